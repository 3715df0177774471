#ifndef AUTOPILOT_LINK_HPP
#define AUTOPILOT_LINK_HPP

#include "detection_types.hpp"
#include "mission_plan.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

// 飞行模式(遥测上报 + 可下发的三种导航模式)
enum class FlightMode
{
    UNKNOWN,
    MISSION,          // 自动航线
    HOLD,             // 定点悬停(PX4 Hold / ArduPilot LOITER)
    RETURN_TO_LAUNCH, // 返航
    TAKEOFF,
    LAND,
    MANUAL,
    OTHER
};

// 指令应答
enum class CommandResult
{
    ACK,
    REJECTED,
    TIMEOUT,
    LINK_LOST,
    CANCELLED // 等待应答期间被 cancelPending 打断
};

// 最近一次遥测
struct TelemetrySample
{
    bool has_position = false;
    double latitude_deg = 0.0;
    double longitude_deg = 0.0;
    float absolute_altitude_m = 0.0f;
    float relative_altitude_m = 0.0f;
    float roll_deg = 0.0f;
    float pitch_deg = 0.0f;
    float yaw_deg = 0.0f;
    float battery_remaining_percent = -1.0f; // 未知时为负数
    float ground_speed_m_s = 0.0f;
    bool armed = false;
    FlightMode flight_mode = FlightMode::UNKNOWN;
    std::string flight_mode_name; // 飞控原始模式名，如 Position、Offboard
    TimePoint timestamp; // 最近一次更新时间
};

std::string flightModeToString(FlightMode mode);
std::string commandResultToString(CommandResult result);

/**
 * @brief 飞控链路接口
 * 所有指令同步等待应答，超时由调用方指定；cancelPending 可从其他线程打断正在进行的等待
 */
class AutopilotLink
{
public:
    virtual ~AutopilotLink() = default;

    // 切换飞行模式(MISSION / HOLD / RETURN_TO_LAUNCH)
    virtual CommandResult setMode(FlightMode mode, std::chrono::milliseconds timeout) = 0;

    // 清除并上传航线
    virtual CommandResult uploadMission(const std::vector<Waypoint> &waypoints, std::chrono::milliseconds timeout) = 0;

    // 设置航线当前航点(恢复任务时从中断处继续)
    virtual CommandResult setCurrentWaypoint(int index, std::chrono::milliseconds timeout) = 0;

    // 打断正在等待应答的指令(返回 CANCELLED)，clearCancel 之前新发出的指令也立即返回 CANCELLED
    virtual void cancelPending() = 0;
    virtual void clearCancel() = 0;

    virtual int currentWaypoint() const = 0;
    virtual bool missionFinished() const = 0; // 已上传航线的最后一个航点已完成
    virtual std::optional<TelemetrySample> latestTelemetry() const = 0;
    virtual bool isConnected() const = 0;
};

#endif // AUTOPILOT_LINK_HPP
