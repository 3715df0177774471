#ifndef MISSION_API_HPP
#define MISSION_API_HPP

#include "autopilot_link.hpp"
#include "mission_controller.hpp"
#include "mission_store.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// 接口调用结果
struct ApiResult
{
    bool ok = false;
    std::string message;
    nlohmann::json data = nlohmann::json::object();
};

void to_json(nlohmann::json &j, const SmokePauseStatus &status);

/**
 * @brief 面向操作员的任务接口
 * 启动、恢复和中止只投递事件，实际迁移由任务状态机线程完成
 */
class MissionApi
{
public:
    MissionApi(MissionStore &store, MissionController &controller, AutopilotLink &link);

    ApiResult createMission(const std::string &name, const std::vector<Waypoint> &waypoints);
    ApiResult createMissionFromPlan(const std::string &name, const std::string &plan_file, float default_speed_m_s, float default_altitude_m);
    ApiResult startSequence(const std::string &mission_id);
    ApiResult resumeAfterSmoke(const std::string &mission_id);
    SmokePauseStatus getSmokePauseStatus(const std::string &mission_id) const;
    ApiResult setHome(const std::string &mission_id, const std::optional<GeoPoint> &home);
    ApiResult abort();
    ApiResult disconnect();
    ApiResult acknowledgeError();
    ApiResult listMissions() const;
    ApiResult deleteMission(const std::string &mission_id); // 正在执行的任务不能删除

private:
    void onTransition(MissionState from, MissionState to);

    MissionStore &store_;
    MissionController &controller_;
    AutopilotLink &link_;
};

#endif // MISSION_API_HPP
