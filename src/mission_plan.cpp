#include "mission_plan.hpp"
#include "logger.hpp"

#include <cmath>
#include <fstream>

void to_json(nlohmann::json &j, const Waypoint &wp)
{
    j = nlohmann::json{
        {"lat", wp.latitude_deg},
        {"lon", wp.longitude_deg},
        {"alt", wp.relative_altitude_m},
        {"speed", wp.speed_m_s},
        {"fly_through", wp.is_fly_through},
        {"loiter_time", wp.loiter_time_s}};

    // NaN 不能写入 JSON，不指定航向时省略
    if (!std::isnan(wp.yaw_deg))
    {
        j["yaw"] = wp.yaw_deg;
    }
}

void from_json(const nlohmann::json &j, Waypoint &wp)
{
    wp.latitude_deg = j.at("lat").get<double>();
    wp.longitude_deg = j.at("lon").get<double>();
    wp.relative_altitude_m = j.contains("alt") && !j.at("alt").is_null() ? j.at("alt").get<float>() : 20.0f;
    wp.speed_m_s = j.contains("speed") && !j.at("speed").is_null() ? j.at("speed").get<float>() : 5.0f;
    wp.yaw_deg = j.contains("yaw") ? j.at("yaw").get<float>() : NAN;
    wp.is_fly_through = j.value("fly_through", true);
    wp.loiter_time_s = j.value("loiter_time", 0.0f);
}

std::vector<Waypoint> parse_waypoints(const nlohmann::json &items, float default_speed_m_s, float default_altitude_m)
{
    std::vector<Waypoint> waypoints;
    if (!items.is_array())
    {
        logging::get_logger()->warn("航点不是数组");
        return waypoints;
    }

    for (const auto &item : items)
    {
        Waypoint wp = item.get<Waypoint>();
        if (!item.contains("alt") || item["alt"].is_null())
        {
            wp.relative_altitude_m = default_altitude_m;
        }
        if (!item.contains("speed") || item["speed"].is_null())
        {
            wp.speed_m_s = default_speed_m_s;
        }
        waypoints.push_back(wp);
    }
    return waypoints;
}

std::vector<Waypoint> parse_qgroundcontrol_plan(const nlohmann::json &plan, float default_speed_m_s, float default_altitude_m)
{
    auto logger = logging::get_logger();
    std::vector<Waypoint> waypoints;
    float current_speed = default_speed_m_s; // 默认速度，仅在没有178命令时使用

    // 验证文件结构是否符合QGC .plan格式
    if (!plan.contains("mission") ||
        !plan["mission"].contains("items") ||
        !plan["mission"]["items"].is_array())
    {
        logger->error("文件格式错误: 不是有效的QGC .plan文件");
        return waypoints;
    }

    for (const auto &item : plan["mission"]["items"])
    {
        // 检查必要字段是否存在
        if (!item.contains("command") ||
            !item.contains("frame") ||
            !item.contains("params"))
        {
            continue; // 跳过不完整的任务项
        }

        const int command = item["command"].get<int>();
        const int frame = item["frame"].get<int>();
        const auto &params = item["params"];

        // 处理速度设置命令 (MAV_CMD_DO_CHANGE_SPEED = 178)
        if (command == 178)
        {
            if (params.size() > 1 && params[1].is_number())
            {
                current_speed = params[1].get<float>(); // params[1]: 速度值 (m/s)
                logger->debug("速度设置为: {} m/s", current_speed);
            }
            continue; // 速度命令不生成航点
        }

        // 处理航点命令 (MAV_CMD_NAV_TAKEOFF = 22, MAV_CMD_NAV_WAYPOINT = 16)
        if (frame == 3 && (command == 16 || command == 22) && params.size() >= 7)
        {
            Waypoint wp;
            wp.loiter_time_s = params[0].is_number() ? params[0].get<float>() : 0.0f;
            wp.yaw_deg = params[3].is_number() ? params[3].get<float>() : NAN; // QGC 用 null 表示不指定
            wp.latitude_deg = params[4].get<double>();
            wp.longitude_deg = params[5].get<double>();
            wp.relative_altitude_m = params[6].is_number() ? params[6].get<float>() : default_altitude_m;
            wp.speed_m_s = current_speed;
            wp.is_fly_through = item.value("autoContinue", true) && wp.loiter_time_s <= 0.0f;

            waypoints.push_back(wp);
            logger->debug("已添加航点: 纬度={}, 经度={}, 高度={}m, 速度={}m/s",
                          wp.latitude_deg, wp.longitude_deg, wp.relative_altitude_m, wp.speed_m_s);
        }
    }

    if (waypoints.empty())
    {
        logger->warn("未找到有效的航点数据");
    }
    return waypoints;
}

std::vector<Waypoint> read_qgroundcontrol_plan(const std::string &filename, float default_speed_m_s, float default_altitude_m)
{
    auto logger = logging::get_logger();

    std::ifstream file(filename);
    if (!file.is_open()) // 文件不存在或不可访问，返回空列表
    {
        logger->error("无法打开文件: {}", filename);
        return {};
    }

    try
    {
        nlohmann::json json_data;
        file >> json_data;
        return parse_qgroundcontrol_plan(json_data, default_speed_m_s, default_altitude_m);
    }
    catch (const std::exception &e)
    {
        logger->error("解析文件时出错: {} ({})", filename, e.what());
        return {};
    }
}
