#include "mavsdk_autopilot_link.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cmath>
#include <condition_variable>

using namespace mavsdk;

// 一次指令等待的状态，插件回调可能晚于超时到达，由回调与等待方共享持有
struct AckWaiter
{
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    bool cancelled = false;
};

namespace
{
    CommandResult from_action_result(Action::Result result)
    {
        switch (result)
        {
            case Action::Result::Success:
                return CommandResult::ACK;
            case Action::Result::Timeout:
                return CommandResult::TIMEOUT;
            case Action::Result::NoSystem:
            case Action::Result::ConnectionError:
                return CommandResult::LINK_LOST;
            default:
                return CommandResult::REJECTED;
        }
    }

    CommandResult from_mission_result(Mission::Result result)
    {
        switch (result)
        {
            case Mission::Result::Success:
                return CommandResult::ACK;
            case Mission::Result::Timeout:
                return CommandResult::TIMEOUT;
            case Mission::Result::NoSystem:
                return CommandResult::LINK_LOST;
            default:
                return CommandResult::REJECTED;
        }
    }

    template <typename ResultT>
    struct TypedAckWaiter : AckWaiter
    {
        ResultT result{};
    };

    /**
     * 创建一个任务项（航点）
     */
    Mission::MissionItem make_mission_item(const Waypoint &wp)
    {
        Mission::MissionItem item{};

        item.latitude_deg = wp.latitude_deg;
        item.longitude_deg = wp.longitude_deg;
        item.relative_altitude_m = wp.relative_altitude_m;
        item.speed_m_s = wp.speed_m_s;
        item.yaw_deg = wp.yaw_deg;
        item.is_fly_through = wp.is_fly_through;
        if (wp.loiter_time_s > 0.0f)
        {
            item.loiter_time_s = wp.loiter_time_s;
        }

        return item;
    }
}

MavsdkAutopilotLink::MavsdkAutopilotLink(Mavsdk_members &mavsdk, TelemetryMonitor &monitor)
    : mavsdk_(mavsdk), monitor_(monitor)
{
    // 订阅任务进度，记录当前航点
    progress_handle_ = mavsdk_.mission.subscribe_mission_progress(
        [this](Mission::MissionProgress progress)
        {
            current_waypoint_ = progress.current;
            mission_total_ = progress.total;
            logging::get_logger()->debug("当前航点: {} / {}", progress.current, progress.total);
        });
}

MavsdkAutopilotLink::~MavsdkAutopilotLink()
{
    mavsdk_.mission.unsubscribe_mission_progress(progress_handle_);
}

template <typename ResultT, typename Call, typename Convert>
CommandResult MavsdkAutopilotLink::waitForAck(Call call, Convert convert, std::chrono::milliseconds timeout)
{
    auto waiter = std::make_shared<TypedAckWaiter<ResultT>>();
    {
        std::lock_guard<std::mutex> lock(waiters_mutex_);
        if (cancelled_)
        {
            return CommandResult::CANCELLED;
        }
        waiters_.push_back(waiter);
    }

    call([waiter](ResultT result)
         {
             std::lock_guard<std::mutex> lock(waiter->mutex);
             waiter->result = result;
             waiter->done = true;
             waiter->cv.notify_all(); });

    CommandResult outcome = CommandResult::TIMEOUT;
    {
        std::unique_lock<std::mutex> lock(waiter->mutex);
        waiter->cv.wait_for(lock, timeout, [&waiter]
                            { return waiter->done || waiter->cancelled; });
        if (waiter->done)
        {
            outcome = convert(waiter->result);
        }
        else if (waiter->cancelled)
        {
            outcome = CommandResult::CANCELLED;
        }
    }

    removeWaiter(waiter.get());
    return outcome;
}

void MavsdkAutopilotLink::removeWaiter(const AckWaiter *waiter)
{
    std::lock_guard<std::mutex> lock(waiters_mutex_);
    waiters_.erase(std::remove_if(waiters_.begin(), waiters_.end(),
                                  [waiter](const std::weak_ptr<AckWaiter> &w)
                                  {
                                      auto locked = w.lock();
                                      return !locked || locked.get() == waiter;
                                  }),
                   waiters_.end());
}

void MavsdkAutopilotLink::cancelPending()
{
    std::vector<std::shared_ptr<AckWaiter>> active;
    {
        std::lock_guard<std::mutex> lock(waiters_mutex_);
        cancelled_ = true;
        for (const auto &w : waiters_)
        {
            if (auto locked = w.lock())
            {
                active.push_back(std::move(locked));
            }
        }
    }

    for (auto &waiter : active)
    {
        {
            std::lock_guard<std::mutex> lock(waiter->mutex);
            waiter->cancelled = true;
        }
        waiter->cv.notify_all();
    }
    if (!active.empty())
    {
        logging::get_logger()->info("已打断{}个等待中的飞控指令", active.size());
    }
}

void MavsdkAutopilotLink::clearCancel()
{
    std::lock_guard<std::mutex> lock(waiters_mutex_);
    cancelled_ = false;
}

bool MavsdkAutopilotLink::missionFinished() const
{
    const int total = mission_total_.load();
    return total > 0 && current_waypoint_.load() >= total;
}

bool MavsdkAutopilotLink::isConnected() const
{
    return mavsdk_.system && mavsdk_.system->is_connected();
}

CommandResult MavsdkAutopilotLink::setMode(FlightMode mode, std::chrono::milliseconds timeout)
{
    if (!isConnected())
    {
        return CommandResult::LINK_LOST;
    }

    Action &action = mavsdk_.action;
    switch (mode)
    {
        case FlightMode::MISSION:
            return startMission(timeout);

        case FlightMode::HOLD:
            return waitForAck<Action::Result>(
                [&action](Action::ResultCallback cb)
                { action.hold_async(cb); },
                from_action_result, timeout);

        case FlightMode::RETURN_TO_LAUNCH:
            return waitForAck<Action::Result>(
                [&action](Action::ResultCallback cb)
                { action.return_to_launch_async(cb); },
                from_action_result, timeout);

        default:
            logging::get_logger()->error("不支持下发的飞行模式: {}", flightModeToString(mode));
            return CommandResult::REJECTED;
    }
}

// 解锁(已解锁时跳过)
CommandResult MavsdkAutopilotLink::armIfNeeded(std::chrono::milliseconds timeout)
{
    if (mavsdk_.telemetry.armed())
    {
        return CommandResult::ACK;
    }

    Action &action = mavsdk_.action;
    CommandResult result = waitForAck<Action::Result>(
        [&action](Action::ResultCallback cb)
        { action.arm_async(cb); },
        from_action_result, timeout);

    if (result != CommandResult::ACK)
    {
        logging::get_logger()->error("解锁失败: {}", commandResultToString(result));
    }
    return result;
}

// 进入(或继续)航线模式：地面未解锁时先解锁，解锁与开始共用一个超时
CommandResult MavsdkAutopilotLink::startMission(std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    CommandResult arm_result = armIfNeeded(timeout);
    if (arm_result != CommandResult::ACK)
    {
        return arm_result;
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining <= std::chrono::milliseconds::zero())
    {
        return CommandResult::TIMEOUT;
    }

    Mission &mission = mavsdk_.mission;
    return waitForAck<Mission::Result>(
        [&mission](Mission::ResultCallback cb)
        { mission.start_mission_async(cb); },
        from_mission_result, remaining);
}

CommandResult MavsdkAutopilotLink::uploadMission(const std::vector<Waypoint> &waypoints, std::chrono::milliseconds timeout)
{
    auto logger = logging::get_logger();
    if (waypoints.empty())
    {
        logger->error("无法上传空任务");
        return CommandResult::REJECTED;
    }
    if (!isConnected())
    {
        return CommandResult::LINK_LOST;
    }

    Mission &mission = mavsdk_.mission;

    logger->info("清除现有任务...");
    CommandResult clear_result = waitForAck<Mission::Result>(
        [&mission](Mission::ResultCallback cb)
        { mission.clear_mission_async(cb); },
        from_mission_result, timeout);
    if (clear_result == CommandResult::CANCELLED)
    {
        return clear_result;
    }
    if (clear_result != CommandResult::ACK)
    {
        logger->warn("清除任务失败: {}", commandResultToString(clear_result));
    }

    Mission::MissionPlan mission_plan{};
    for (const auto &wp : waypoints)
    {
        mission_plan.mission_items.push_back(make_mission_item(wp));
    }

    // 航点上传耗时与航点数量相关，超时按航点数放宽
    auto upload_timeout = timeout + std::chrono::milliseconds(200) * static_cast<int>(waypoints.size());
    CommandResult result = waitForAck<Mission::Result>(
        [&mission, mission_plan](Mission::ResultCallback cb)
        { mission.upload_mission_async(mission_plan, cb); },
        from_mission_result, upload_timeout);

    if (result == CommandResult::ACK)
    {
        current_waypoint_ = 0;
        mission_total_ = 0;
        logger->info("任务上传成功，共{}个航点", waypoints.size());
    }
    else
    {
        logger->error("航线任务上传失败: {}", commandResultToString(result));
    }
    return result;
}

CommandResult MavsdkAutopilotLink::setCurrentWaypoint(int index, std::chrono::milliseconds timeout)
{
    if (!isConnected())
    {
        return CommandResult::LINK_LOST;
    }

    Mission &mission = mavsdk_.mission;
    return waitForAck<Mission::Result>(
        [&mission, index](Mission::ResultCallback cb)
        { mission.set_current_mission_item_async(index, cb); },
        from_mission_result, timeout);
}
