#ifndef MAVSDK_AUTOPILOT_LINK_HPP
#define MAVSDK_AUTOPILOT_LINK_HPP

#include "autopilot_link.hpp"
#include "mavsdk_members.hpp"
#include "telemetry_monitor.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

struct AckWaiter;

/**
 * @brief 基于 MAVSDK 的飞控链路实现
 * 使用插件的异步接口下发指令，在等待器上等待应答以实现超时与打断
 */
class MavsdkAutopilotLink : public AutopilotLink
{
public:
    MavsdkAutopilotLink(Mavsdk_members &mavsdk, TelemetryMonitor &monitor);
    ~MavsdkAutopilotLink() override;

    CommandResult setMode(FlightMode mode, std::chrono::milliseconds timeout) override;
    CommandResult uploadMission(const std::vector<Waypoint> &waypoints, std::chrono::milliseconds timeout) override;
    CommandResult setCurrentWaypoint(int index, std::chrono::milliseconds timeout) override;

    void cancelPending() override;
    void clearCancel() override;

    int currentWaypoint() const override { return current_waypoint_.load(); }
    bool missionFinished() const override;
    std::optional<TelemetrySample> latestTelemetry() const override { return monitor_.latestSample(); }
    bool isConnected() const override;

private:
    CommandResult startMission(std::chrono::milliseconds timeout);
    CommandResult armIfNeeded(std::chrono::milliseconds timeout);

    /**
     * @brief 下发异步指令并等待应答
     * @param call 发起调用的函数，参数为结果回调
     * @param convert 插件结果到 CommandResult 的转换
     */
    template <typename ResultT, typename Call, typename Convert>
    CommandResult waitForAck(Call call, Convert convert, std::chrono::milliseconds timeout);
    void removeWaiter(const AckWaiter *waiter);

    Mavsdk_members &mavsdk_;
    TelemetryMonitor &monitor_;

    std::mutex waiters_mutex_;
    std::vector<std::weak_ptr<AckWaiter>> waiters_;
    bool cancelled_ = false;

    std::atomic<int> current_waypoint_{0};
    std::atomic<int> mission_total_{0};
    mavsdk::Mission::MissionProgressHandle progress_handle_;
};

#endif // MAVSDK_AUTOPILOT_LINK_HPP
