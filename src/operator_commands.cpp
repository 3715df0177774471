#include "operator_commands.hpp"
#include "logger.hpp"

using json = nlohmann::json;

OperatorCommandHandler::OperatorCommandHandler(MissionApi &api, float default_speed_m_s, float default_altitude_m)
    : api_(api), default_speed_m_s_(default_speed_m_s), default_altitude_m_(default_altitude_m)
{
}

/**
 * @brief 创建任务
 * 航点来源按优先级：waypoints 数组 > plan 对象(QGC 格式) > plan_file 路径
 */
ApiResult OperatorCommandHandler::createMission(const json &msg)
{
    const std::string name = msg.value("name", "");

    if (msg.contains("waypoints"))
    {
        std::vector<Waypoint> waypoints = parse_waypoints(msg.at("waypoints"), default_speed_m_s_, default_altitude_m_);
        return api_.createMission(name, waypoints);
    }
    if (msg.contains("plan"))
    {
        std::vector<Waypoint> waypoints = parse_qgroundcontrol_plan(msg.at("plan"), default_speed_m_s_, default_altitude_m_);
        return api_.createMission(name, waypoints);
    }

    const std::string plan_file = msg.value("plan_file", "");
    if (!plan_file.empty())
    {
        return api_.createMissionFromPlan(name, plan_file, default_speed_m_s_, default_altitude_m_);
    }

    ApiResult result;
    result.message = "waypoints, plan or plan_file required";
    return result;
}

ApiResult OperatorCommandHandler::setHome(const json &msg)
{
    std::optional<GeoPoint> home;
    if (msg.contains("lat") && msg.contains("lon"))
    {
        home = GeoPoint{msg.at("lat").get<double>(), msg.at("lon").get<double>(), msg.value("alt", 0.0f)};
    }
    return api_.setHome(msg.value("mission_id", ""), home);
}

json OperatorCommandHandler::handle(const json &msg)
{
    auto logger = logging::get_logger();
    if (!msg.is_object())
    {
        logger->warn("[cmd] 指令不是 JSON 对象");
        return json{{"command", ""}, {"ok", false}, {"message", "command must be a json object"}};
    }

    const std::string command = msg.value("command", ""); // 指令名，默认空字符串
    const std::string mission_id = msg.value("mission_id", "");

    ApiResult result;
    try
    {
        // 根据不同的指令类型调用任务接口
        if (command == "create_mission")
        {
            result = createMission(msg);
        }
        else if (command == "start_sequence")
        {
            result = api_.startSequence(mission_id);
        }
        else if (command == "resume_after_smoke")
        {
            result = api_.resumeAfterSmoke(mission_id);
        }
        else if (command == "smoke_pause_status")
        {
            result.ok = true;
            result.data = api_.getSmokePauseStatus(mission_id);
        }
        else if (command == "set_home")
        {
            result = setHome(msg);
        }
        else if (command == "abort")
        {
            result = api_.abort();
        }
        else if (command == "disconnect")
        {
            result = api_.disconnect();
        }
        else if (command == "acknowledge_error")
        {
            result = api_.acknowledgeError();
        }
        else if (command == "delete_mission")
        {
            result = api_.deleteMission(mission_id);
        }
        else if (command == "list_missions")
        {
            result = api_.listMissions();
        }
        else
        {
            result.message = "unknown command: " + command;
        }
    }
    catch (const json::exception &e)
    {
        // 参数类型错误
        result.ok = false;
        result.message = std::string("invalid arguments: ") + e.what();
    }

    if (result.ok)
    {
        logger->info("[cmd] {} 成功 {}", command, result.message);
    }
    else
    {
        logger->warn("[cmd] {} 失败: {}", command, result.message);
    }

    return json{{"command", command}, {"ok", result.ok}, {"message", result.message}, {"data", result.data}};
}

std::string OperatorCommandHandler::handlePayload(const std::vector<unsigned char> &payload)
{
    return handlePayload(std::string(payload.begin(), payload.end()));
}

std::string OperatorCommandHandler::handlePayload(const std::string &payload)
{
    try
    {
        json msg = json::parse(payload);
        return handle(msg).dump();
    }
    catch (const json::parse_error &e)
    {
        logging::get_logger()->error("[cmd] 解析指令失败: {} (位置 {} 字节)", e.what(), e.byte);
        return json{{"command", ""}, {"ok", false}, {"message", "malformed json"}}.dump();
    }
    catch (const json::exception &e)
    {
        logging::get_logger()->error("[cmd] 指令字段错误: {}", e.what());
        return json{{"command", ""}, {"ok", false}, {"message", e.what()}}.dump();
    }
}
