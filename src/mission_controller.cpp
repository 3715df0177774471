#include "mission_controller.hpp"
#include "logger.hpp"

#include <algorithm>
#include <iterator>

HoldSmokePolicy parse_hold_smoke_policy(const std::string &text)
{
    if (text == "return_home" || text == "rtl")
    {
        return HoldSmokePolicy::RETURN_HOME;
    }
    return HoldSmokePolicy::IGNORE;
}

// 状态机类构造函数
MissionController::MissionController(AutopilotLink &link, const MissionControllerConfig &config)
    : link_(link), config_(config)
{
    if (config_.command_retries < 0)
    {
        config_.command_retries = 0;
    }
}

MissionController::~MissionController()
{
    stop();
}

void MissionController::start()
{
    if (running_.exchange(true))
    {
        return;
    }
    worker_ = std::thread(&MissionController::eventLoop, this);
}

void MissionController::stop()
{
    if (running_.exchange(false))
    {
        abort_requested_ = true; // 打断正在重试的指令
        cancelPreemptibleCommand();
        queue_cv_.notify_all();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }
}

void MissionController::post(MissionEvent event)
{
    const bool preempt = event.type == MissionEventType::ABORT || event.type == MissionEventType::DISCONNECT;
    std::size_t dropped_starts = 0;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        // 中止/断开优先于所有排队中的检测事件，排队中的启动请求作废
        if (preempt)
        {
            abort_requested_ = true;
            auto it = std::remove_if(queue_.begin(), queue_.end(), [](const MissionEvent &queued)
                                     { return queued.type == MissionEventType::START_SEQUENCE; });
            dropped_starts = static_cast<std::size_t>(std::distance(it, queue_.end()));
            queue_.erase(it, queue_.end());
            queue_.push_front(std::move(event));
        }
        else
        {
            queue_.push_back(std::move(event));
        }
    }

    if (dropped_starts > 0)
    {
        logging::get_logger()->warn("[mission] 中止请求丢弃了{}个排队中的启动请求", dropped_starts);
    }
    if (preempt)
    {
        cancelPreemptibleCommand();
    }
    queue_cv_.notify_one();
}

std::size_t MissionController::pendingEvents() const
{
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void MissionController::eventLoop()
{
    while (running_.load())
    {
        std::optional<MissionEvent> event;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait_for(lock, config_.poll_interval, [this]
                               { return !queue_.empty() || !running_.load(); });
            if (!running_.load())
            {
                break;
            }
            if (!queue_.empty())
            {
                event = std::move(queue_.front());
                queue_.pop_front();
            }
        }

        checkLink();
        if (event)
        {
            handleEvent(*event);
        }
        checkHoldTimeout(Clock::now());
        checkMissionComplete();
    }
}

/**
 * @brief 状态机主处理函数
 * 链路断开期间只处理断开和错误确认，其余事件丢弃，状态保持不变
 */
bool MissionController::handleEvent(const MissionEvent &event)
{
    auto logger = logging::get_logger();
    checkLink();

    const bool needs_link = event.type != MissionEventType::DISCONNECT && event.type != MissionEventType::ACKNOWLEDGE_ERROR;
    if (needs_link && link_fault_.load())
    {
        logger->warn("[mission] 链路断开，忽略事件 {} (状态保持 {})", eventTypeToString(event.type), missionStateToString(state()));
        if (event.type == MissionEventType::ABORT)
        {
            abort_requested_ = false;
        }
        return false;
    }

    switch (event.type)
    {
        case MissionEventType::START_SEQUENCE:
            return onStartSequence(event);
        case MissionEventType::SMOKE_RISING_EDGE:
            return onSmokeRisingEdge(event);
        case MissionEventType::RESUME:
            return onResume(event);
        case MissionEventType::ABORT:
            abort_requested_ = false;
            return onAbort("operator abort");
        case MissionEventType::DISCONNECT:
            abort_requested_ = false;
            return onDisconnect();
        case MissionEventType::ACKNOWLEDGE_ERROR:
            return onAcknowledgeError();
        case MissionEventType::HOLD_TIMEOUT:
            if (state() == MissionState::HOLD_FOR_INSPECTION)
            {
                return onAbort("hold timeout");
            }
            return false;
        default:
            return false;
    }
}

bool MissionController::onStartSequence(const MissionEvent &event)
{
    auto logger = logging::get_logger();

    if (state() != MissionState::IDLE)
    {
        logger->warn("[mission] 当前状态 {}，不能启动任务 {}", missionStateToString(state()), event.mission_id);
        return false;
    }
    if (event.waypoints.empty())
    {
        logger->error("[mission] 任务 {} 没有航点，拒绝启动", event.mission_id);
        return false;
    }

    beginCommand(true);
    CommandResult upload = link_.uploadMission(event.waypoints, config_.ack_timeout);
    endCommand();
    if (upload == CommandResult::CANCELLED)
    {
        logger->warn("[mission] 任务 {} 上传被中止请求打断", event.mission_id);
        return false;
    }
    if (upload != CommandResult::ACK)
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_error_ = "mission upload failed: " + commandResultToString(upload);
        if (upload == CommandResult::LINK_LOST)
        {
            link_fault_ = true;
        }
        logger->error("[mission] 任务 {} 上传失败: {}", event.mission_id, commandResultToString(upload));
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        mission_id_ = event.mission_id;
        waypoints_ = event.waypoints;
        nav_mode_ = FlightMode::MISSION;
        last_error_.reset();
    }

    CommandResult result = issueModeCommand(FlightMode::MISSION, true);
    if (result != CommandResult::ACK)
    {
        handleCommandFailure(FlightMode::MISSION, result, MissionState::IDLE);
        // 仍在 IDLE(被中止或链路断开)时不保留任务
        if (state() == MissionState::IDLE)
        {
            clearMission();
        }
        return false;
    }

    setState(MissionState::NAVIGATING, "start sequence " + event.mission_id);
    return true;
}

bool MissionController::onSmokeRisingEdge(const MissionEvent &event)
{
    auto logger = logging::get_logger();
    const MissionState current = state();

    if (current == MissionState::HOLD_FOR_INSPECTION)
    {
        if (config_.hold_smoke_policy == HoldSmokePolicy::RETURN_HOME)
        {
            return onAbort("smoke again during hold");
        }
        logger->info("[mission] 悬停检查中再次出现烟雾，忽略");
        return false;
    }

    if (current != MissionState::NAVIGATING)
    {
        logger->debug("[mission] 状态 {} 下忽略烟雾事件", missionStateToString(current));
        return false;
    }

    // 记录悬停位置和中断航点
    auto telemetry = link_.latestTelemetry();
    const int waypoint = link_.currentWaypoint();
    const FlightMode before_pause = telemetry ? telemetry->flight_mode : FlightMode::UNKNOWN;
    const FlightMode resume_mode = resumableMode(before_pause);
    if (resume_mode != before_pause)
    {
        logger->warn("[mission] 悬停前模式 {} 无法恢复，恢复时按 {} 处理", flightModeToString(before_pause), flightModeToString(resume_mode));
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        mode_before_pause_ = before_pause;
        nav_mode_ = resume_mode;
        pause_location_.reset();
        if (telemetry && telemetry->has_position)
        {
            pause_location_ = GeoPoint{telemetry->latitude_deg, telemetry->longitude_deg, telemetry->relative_altitude_m};
        }
        pause_since_ = event.timestamp;
        paused_waypoint_ = waypoint;
    }

    CommandResult result = issueModeCommand(FlightMode::HOLD, true);
    if (result != CommandResult::ACK)
    {
        clearPause();
        handleCommandFailure(FlightMode::HOLD, result, MissionState::NAVIGATING);
        return false;
    }

    setState(MissionState::HOLD_FOR_INSPECTION, "smoke rising edge at waypoint " + std::to_string(waypoint));
    return true;
}

bool MissionController::onResume(const MissionEvent &event)
{
    auto logger = logging::get_logger();

    int waypoint = -1;
    FlightMode mode = FlightMode::MISSION;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != MissionState::HOLD_FOR_INSPECTION)
        {
            logger->warn("[mission] 当前状态 {}，无法恢复", missionStateToString(state_));
            return false;
        }
        if (!event.mission_id.empty() && event.mission_id != mission_id_)
        {
            logger->warn("[mission] 恢复请求的任务 {} 与当前任务 {} 不一致", event.mission_id, mission_id_);
            return false;
        }
        waypoint = paused_waypoint_;
        mode = nav_mode_;
    }

    setState(MissionState::RESUMING, "operator resume");

    // 只有航线模式需要回到中断航点
    if (mode == FlightMode::MISSION && waypoint >= 0)
    {
        beginCommand(true);
        CommandResult wp_result = link_.setCurrentWaypoint(waypoint, config_.ack_timeout);
        endCommand();
        if (wp_result == CommandResult::LINK_LOST || wp_result == CommandResult::CANCELLED)
        {
            handleCommandFailure(mode, wp_result, MissionState::RESUMING);
            return false;
        }
        if (wp_result != CommandResult::ACK)
        {
            logger->warn("[mission] 设置当前航点 {} 失败: {}，由飞控从自身记录的航点继续", waypoint, commandResultToString(wp_result));
        }
    }

    CommandResult result = issueModeCommand(mode, true);
    if (result != CommandResult::ACK)
    {
        handleCommandFailure(mode, result, MissionState::RESUMING);
        return false;
    }

    clearPause();
    if (mode == FlightMode::RETURN_TO_LAUNCH)
    {
        // 悬停前已在返航，恢复即继续返航
        setState(MissionState::RETURN_TO_HOME, "resumed return to launch");
        clearMission();
        setState(MissionState::IDLE, "return to launch engaged");
        return true;
    }
    setState(MissionState::NAVIGATING, "resumed at waypoint " + std::to_string(waypoint));
    return true;
}

bool MissionController::onAbort(const std::string &reason)
{
    auto logger = logging::get_logger();
    const MissionState current = state();

    if (current == MissionState::IDLE || current == MissionState::RETURN_TO_HOME)
    {
        logger->info("[mission] 状态 {} 下无需中止", missionStateToString(current));
        return false;
    }

    setState(MissionState::RETURN_TO_HOME, reason);

    // 返航指令不可被打断
    CommandResult result = issueModeCommand(FlightMode::RETURN_TO_LAUNCH, false);
    if (result != CommandResult::ACK)
    {
        handleCommandFailure(FlightMode::RETURN_TO_LAUNCH, result, MissionState::RETURN_TO_HOME);
        return false;
    }

    clearPause();
    clearMission();
    setState(MissionState::IDLE, "return to launch engaged");
    return true;
}

bool MissionController::onDisconnect()
{
    clearPause();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        mission_id_.clear();
        waypoints_.clear();
        last_error_.reset();
    }
    if (state() != MissionState::IDLE)
    {
        setState(MissionState::IDLE, "disconnect");
    }
    return true;
}

bool MissionController::onAcknowledgeError()
{
    if (state() != MissionState::ERROR)
    {
        return false;
    }
    clearPause();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_error_.reset();
        mission_id_.clear();
        waypoints_.clear();
    }
    setState(MissionState::IDLE, "error acknowledged");
    return true;
}

CommandResult MissionController::issueModeCommand(FlightMode mode, bool preemptible)
{
    auto logger = logging::get_logger();
    const int attempts = config_.command_retries + 1;
    CommandResult result = CommandResult::TIMEOUT;

    for (int attempt = 1; attempt <= attempts; ++attempt)
    {
        if (preemptible && abort_requested_.load())
        {
            logger->warn("[mission] {} 指令被中止请求打断", flightModeToString(mode));
            return CommandResult::CANCELLED;
        }

        logger->info("[mission] 下发模式切换 {} ({}/{})", flightModeToString(mode), attempt, attempts);
        beginCommand(preemptible);
        result = link_.setMode(mode, config_.ack_timeout);
        endCommand();

        if (result == CommandResult::ACK)
        {
            return result;
        }
        if (result == CommandResult::CANCELLED)
        {
            logger->warn("[mission] {} 等待应答时被中止请求打断", flightModeToString(mode));
            return result;
        }
        if (result != CommandResult::TIMEOUT)
        {
            return result; // 拒绝或链路断开不重试
        }
        logger->warn("[mission] {} 应答超时", flightModeToString(mode));
    }

    logger->error("[mission] {}: {} 重试 {} 次后仍未应答", errorKindToString(ErrorKind::AUTOPILOT_COMMAND_TIMEOUT), flightModeToString(mode), config_.command_retries);
    return result;
}

void MissionController::handleCommandFailure(FlightMode mode, CommandResult result, MissionState from)
{
    auto logger = logging::get_logger();

    if (result == CommandResult::CANCELLED || (abort_requested_.load() && from != MissionState::RETURN_TO_HOME))
    {
        logger->info("[mission] 等待中止事件处理");
        return;
    }

    const std::string message = flightModeToString(mode) + " " + commandResultToString(result);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_error_ = message;
    }

    if (result == CommandResult::LINK_LOST)
    {
        link_fault_ = true;
        logger->error("[mission] {}: 状态冻结在 {}", errorKindToString(ErrorKind::AUTOPILOT_LINK_LOST), missionStateToString(state()));
        return;
    }

    setState(MissionState::ERROR, message);
}

void MissionController::checkLink()
{
    auto logger = logging::get_logger();
    const bool connected = link_.isConnected();

    if (!connected)
    {
        if (!link_fault_.exchange(true))
        {
            logger->error("[mission] {}: 状态冻结在 {}", errorKindToString(ErrorKind::AUTOPILOT_LINK_LOST), missionStateToString(state()));
        }
    }
    else if (link_fault_.exchange(false))
    {
        logger->info("[mission] 飞控链路已恢复，状态 {}", missionStateToString(state()));
    }
}

void MissionController::checkHoldTimeout(TimePoint now)
{
    if (config_.hold_timeout_sec <= 0.0)
    {
        return;
    }

    bool expired = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        expired = state_ == MissionState::HOLD_FOR_INSPECTION && pause_since_ &&
                  seconds_between(*pause_since_, now) > config_.hold_timeout_sec;
    }

    if (expired)
    {
        logging::get_logger()->warn("[mission] 悬停检查超过 {:.0f}s 未处理，自动返航", config_.hold_timeout_sec);
        MissionEvent event;
        event.type = MissionEventType::HOLD_TIMEOUT;
        event.timestamp = now;
        handleEvent(event);
    }
}

void MissionController::checkMissionComplete()
{
    if (state() != MissionState::NAVIGATING || link_fault_.load() || !link_.missionFinished())
    {
        return;
    }

    // 先迁移再清任务，监听方据此把任务记录标为完成
    setState(MissionState::IDLE, "mission complete");
    clearMission();
}

void MissionController::beginCommand(bool preemptible)
{
    std::lock_guard<std::mutex> lock(command_mutex_);
    preemptible_in_flight_ = preemptible;
}

void MissionController::endCommand()
{
    std::lock_guard<std::mutex> lock(command_mutex_);
    if (preemptible_in_flight_)
    {
        link_.clearCancel();
    }
    preemptible_in_flight_ = false;
}

// 返航等不可打断的指令不受影响
void MissionController::cancelPreemptibleCommand()
{
    std::lock_guard<std::mutex> lock(command_mutex_);
    if (preemptible_in_flight_)
    {
        link_.cancelPending();
    }
}

FlightMode MissionController::resumableMode(FlightMode before_pause)
{
    if (before_pause == FlightMode::RETURN_TO_LAUNCH)
    {
        return FlightMode::RETURN_TO_LAUNCH;
    }
    return FlightMode::MISSION;
}

void MissionController::setState(MissionState next, const std::string &reason)
{
    MissionState previous;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        previous = state_;
        state_ = next;
    }

    logging::get_logger()->info("[mission] {} -> {} ({})", missionStateToString(previous), missionStateToString(next), reason);

    std::vector<TransitionListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listeners = listeners_;
    }
    for (auto &listener : listeners)
    {
        listener(previous, next, reason);
    }
}

void MissionController::clearPause()
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    pause_location_.reset();
    pause_since_.reset();
    paused_waypoint_ = -1;
    mode_before_pause_ = FlightMode::UNKNOWN;
}

void MissionController::clearMission()
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    mission_id_.clear();
    waypoints_.clear();
}

void MissionController::addListener(TransitionListener listener)
{
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_.push_back(std::move(listener));
}

MissionState MissionController::state() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::string MissionController::activeMissionId() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return mission_id_;
}

std::optional<std::string> MissionController::lastError() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_error_;
}

SmokePauseStatus MissionController::smokePauseStatus() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    SmokePauseStatus status;
    status.paused = state_ == MissionState::HOLD_FOR_INSPECTION;
    status.mission_active = state_ == MissionState::NAVIGATING ||
                            state_ == MissionState::HOLD_FOR_INSPECTION ||
                            state_ == MissionState::RESUMING;
    status.mission_id = mission_id_;
    status.location = pause_location_;
    status.since = pause_since_;
    status.paused_waypoint = paused_waypoint_;
    status.mode_before_pause = mode_before_pause_;
    status.resume_mode = nav_mode_;
    return status;
}

std::string MissionController::missionStateToString(MissionState state)
{
    switch (state)
    {
        case MissionState::IDLE:
            return "Idle";
        case MissionState::NAVIGATING:
            return "Navigating";
        case MissionState::HOLD_FOR_INSPECTION:
            return "HoldForInspection";
        case MissionState::RESUMING:
            return "Resuming";
        case MissionState::RETURN_TO_HOME:
            return "ReturnToHome";
        case MissionState::ERROR:
            return "Error";
        default:
            return "Unknown";
    }
}

std::string MissionController::eventTypeToString(MissionEventType type)
{
    switch (type)
    {
        case MissionEventType::START_SEQUENCE:
            return "StartSequence";
        case MissionEventType::SMOKE_RISING_EDGE:
            return "SmokeRisingEdge";
        case MissionEventType::RESUME:
            return "Resume";
        case MissionEventType::ABORT:
            return "Abort";
        case MissionEventType::DISCONNECT:
            return "Disconnect";
        case MissionEventType::ACKNOWLEDGE_ERROR:
            return "AcknowledgeError";
        case MissionEventType::HOLD_TIMEOUT:
            return "HoldTimeout";
        default:
            return "Unknown";
    }
}
