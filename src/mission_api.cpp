#include "mission_api.hpp"
#include "logger.hpp"

using json = nlohmann::json;

void to_json(json &j, const SmokePauseStatus &status)
{
    j = json{
        {"paused", status.paused},
        {"mission_active", status.mission_active},
        {"mission_id", status.mission_id},
        {"paused_waypoint", status.paused_waypoint},
        {"mode_before_pause", flightModeToString(status.mode_before_pause)},
        {"resume_mode", flightModeToString(status.resume_mode)}};

    if (status.location)
    {
        j["location"] = {{"lat", status.location->latitude_deg},
                         {"lon", status.location->longitude_deg},
                         {"alt", status.location->relative_altitude_m}};
    }
    else
    {
        j["location"] = nullptr;
    }
    j["since"] = status.since ? json(format_iso_time(*status.since)) : json(nullptr);
}

MissionApi::MissionApi(MissionStore &store, MissionController &controller, AutopilotLink &link)
    : store_(store), controller_(controller), link_(link)
{
    controller_.addListener([this](MissionState from, MissionState to, const std::string &)
                            { onTransition(from, to); });
}

// 状态机迁移同步到任务记录
void MissionApi::onTransition(MissionState from, MissionState to)
{
    const std::string id = controller_.activeMissionId();
    if (id.empty())
    {
        return;
    }

    switch (to)
    {
        case MissionState::NAVIGATING:
            store_.updateStatus(id, "running");
            break;
        case MissionState::HOLD_FOR_INSPECTION:
            store_.updateStatus(id, "paused");
            store_.updateProgress(id, controller_.smokePauseStatus().paused_waypoint);
            break;
        case MissionState::RETURN_TO_HOME:
            store_.updateStatus(id, "aborted");
            break;
        case MissionState::ERROR:
            store_.updateStatus(id, "error");
            break;
        case MissionState::IDLE:
            // 只有航线飞完的迁移在清除任务前通知
            if (from == MissionState::NAVIGATING)
            {
                store_.updateStatus(id, "completed");
            }
            break;
        default:
            break;
    }
}

ApiResult MissionApi::createMission(const std::string &name, const std::vector<Waypoint> &waypoints)
{
    ApiResult result;
    if (waypoints.empty())
    {
        result.message = "waypoints required";
        return result;
    }

    // 起始点取当前飞机位置
    std::optional<GeoPoint> home;
    auto telemetry = link_.latestTelemetry();
    if (telemetry && telemetry->has_position)
    {
        home = GeoPoint{telemetry->latitude_deg, telemetry->longitude_deg, telemetry->relative_altitude_m};
    }

    auto record = store_.create(name, waypoints, home);
    if (!record)
    {
        result.message = "create mission failed";
        return result;
    }

    result.ok = true;
    result.message = "mission created";
    result.data = *record;
    return result;
}

ApiResult MissionApi::createMissionFromPlan(const std::string &name, const std::string &plan_file, float default_speed_m_s, float default_altitude_m)
{
    std::vector<Waypoint> waypoints = read_qgroundcontrol_plan(plan_file, default_speed_m_s, default_altitude_m);
    if (waypoints.empty())
    {
        ApiResult result;
        result.message = "no waypoints in plan file " + plan_file;
        return result;
    }
    return createMission(name, waypoints);
}

ApiResult MissionApi::startSequence(const std::string &mission_id)
{
    ApiResult result;
    auto record = store_.find(mission_id);
    if (!record)
    {
        result.message = "mission not found: " + mission_id;
        return result;
    }
    if (record->waypoints.empty())
    {
        result.message = "mission has no waypoints";
        return result;
    }
    if (controller_.state() != MissionState::IDLE)
    {
        result.message = "controller busy: " + MissionController::missionStateToString(controller_.state());
        return result;
    }
    if (!link_.isConnected())
    {
        result.message = "autopilot not connected";
        return result;
    }

    MissionEvent event;
    event.type = MissionEventType::START_SEQUENCE;
    event.mission_id = record->id;
    event.waypoints = record->waypoints;
    controller_.post(std::move(event));

    logging::get_logger()->info("[api] 启动任务 {}", mission_id);
    result.ok = true;
    result.message = "start sequence accepted";
    result.data = {{"mission_id", mission_id}};
    return result;
}

ApiResult MissionApi::resumeAfterSmoke(const std::string &mission_id)
{
    ApiResult result;
    SmokePauseStatus status = controller_.smokePauseStatus();
    if (!status.paused)
    {
        result.message = "mission is not paused for smoke";
        return result;
    }
    if (!mission_id.empty() && status.mission_id != mission_id)
    {
        result.message = "mission id mismatch: active " + status.mission_id;
        return result;
    }

    MissionEvent event;
    event.type = MissionEventType::RESUME;
    event.mission_id = status.mission_id;
    controller_.post(std::move(event));

    logging::get_logger()->info("[api] 恢复任务 {}", status.mission_id);
    result.ok = true;
    result.message = "resume accepted";
    result.data = {{"mission_id", status.mission_id}, {"waypoint", status.paused_waypoint}};
    return result;
}

SmokePauseStatus MissionApi::getSmokePauseStatus(const std::string &mission_id) const
{
    SmokePauseStatus status = controller_.smokePauseStatus();
    if (!mission_id.empty() && status.mission_id != mission_id)
    {
        SmokePauseStatus other;
        other.mission_id = mission_id;
        return other;
    }
    return status;
}

// home 为空时取当前飞机位置
ApiResult MissionApi::setHome(const std::string &mission_id, const std::optional<GeoPoint> &home)
{
    ApiResult result;
    std::optional<GeoPoint> point = home;
    if (!point)
    {
        auto telemetry = link_.latestTelemetry();
        if (!telemetry || !telemetry->has_position)
        {
            result.message = "no home given and no vehicle position";
            return result;
        }
        point = GeoPoint{telemetry->latitude_deg, telemetry->longitude_deg, telemetry->relative_altitude_m};
    }

    if (!store_.setHome(mission_id, *point))
    {
        result.message = "mission not found: " + mission_id;
        return result;
    }

    result.ok = true;
    result.message = "home updated";
    result.data = {{"mission_id", mission_id}, {"lat", point->latitude_deg}, {"lon", point->longitude_deg}};
    return result;
}

ApiResult MissionApi::abort()
{
    MissionEvent event;
    event.type = MissionEventType::ABORT;
    controller_.post(std::move(event));
    logging::get_logger()->warn("[api] 中止任务");

    ApiResult result;
    result.ok = true;
    result.message = "abort accepted";
    return result;
}

ApiResult MissionApi::disconnect()
{
    MissionEvent event;
    event.type = MissionEventType::DISCONNECT;
    controller_.post(std::move(event));

    ApiResult result;
    result.ok = true;
    result.message = "disconnect accepted";
    return result;
}

ApiResult MissionApi::acknowledgeError()
{
    ApiResult result;
    if (controller_.state() != MissionState::ERROR)
    {
        result.message = "controller not in error state";
        return result;
    }

    MissionEvent event;
    event.type = MissionEventType::ACKNOWLEDGE_ERROR;
    controller_.post(std::move(event));
    result.ok = true;
    result.message = "error acknowledged";
    return result;
}

ApiResult MissionApi::listMissions() const
{
    ApiResult result;
    result.ok = true;
    result.data = {{"missions", store_.list()}};
    return result;
}

ApiResult MissionApi::deleteMission(const std::string &mission_id)
{
    ApiResult result;
    if (mission_id.empty())
    {
        result.message = "mission_id required";
        return result;
    }
    if (controller_.activeMissionId() == mission_id)
    {
        result.message = "mission is active: " + mission_id;
        return result;
    }
    if (!store_.remove(mission_id))
    {
        result.message = "mission not found: " + mission_id;
        return result;
    }

    logging::get_logger()->info("[api] 删除任务 {}", mission_id);
    result.ok = true;
    result.message = "mission deleted";
    result.data = {{"mission_id", mission_id}};
    return result;
}
