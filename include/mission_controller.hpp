#ifndef MISSION_CONTROLLER_HPP
#define MISSION_CONTROLLER_HPP

#include "autopilot_link.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// 任务状态
enum class MissionState
{
    IDLE,                // 空闲
    NAVIGATING,          // 航线飞行
    HOLD_FOR_INSPECTION, // 发现烟雾，悬停检查
    RESUMING,            // 正在恢复航线
    RETURN_TO_HOME,      // 返航
    ERROR                // 指令重试耗尽，等待操作员确认
};

// 悬停期间再次出现烟雾上升沿时的处理策略
enum class HoldSmokePolicy
{
    IGNORE,     // 不处理
    RETURN_HOME // 直接返航
};

// 状态机输入事件
enum class MissionEventType
{
    START_SEQUENCE,
    SMOKE_RISING_EDGE,
    RESUME,
    ABORT,
    DISCONNECT,
    ACKNOWLEDGE_ERROR,
    HOLD_TIMEOUT
};

struct MissionEvent
{
    MissionEventType type = MissionEventType::START_SEQUENCE;
    std::string mission_id;
    std::vector<Waypoint> waypoints; // 仅 START_SEQUENCE 使用
    TimePoint timestamp = Clock::now();
};

// 烟雾悬停状态查询结果
struct SmokePauseStatus
{
    bool paused = false;
    bool mission_active = false;
    std::string mission_id;
    std::optional<GeoPoint> location;
    std::optional<TimePoint> since;
    int paused_waypoint = -1;
    FlightMode mode_before_pause = FlightMode::UNKNOWN; // 悬停前飞控上报的模式
    FlightMode resume_mode = FlightMode::MISSION;       // 恢复时切回的模式
};

struct MissionControllerConfig
{
    std::chrono::milliseconds ack_timeout{3000};
    int command_retries = 3;
    double hold_timeout_sec = 0.0; // 0 表示不自动返航
    HoldSmokePolicy hold_smoke_policy = HoldSmokePolicy::IGNORE;
    std::chrono::milliseconds poll_interval{200};
};

HoldSmokePolicy parse_hold_smoke_policy(const std::string &text);

/**
 * @brief 任务状态机
 *
 * IDLE -> NAVIGATING -> HOLD_FOR_INSPECTION -> { RESUMING -> NAVIGATING | RETURN_TO_HOME -> IDLE }
 * 每次迁移最多下发一条模式切换指令，等待应答或超时后才会重试；重试耗尽进入 ERROR。
 * 中止和断开事件插到队首，丢弃排队中的启动请求，并打断正在等待应答或重试的可打断指令。
 * 航线飞完后自动回到 IDLE。
 */
class MissionController
{
public:
    using TransitionListener = std::function<void(MissionState from, MissionState to, const std::string &reason)>;

    MissionController(AutopilotLink &link, const MissionControllerConfig &config);
    ~MissionController();

    void start(); // 启动事件处理线程
    void stop();

    // 非阻塞投递事件
    void post(MissionEvent event);

    // 同步处理一个事件(事件线程内部调用，测试中也直接调用)
    bool handleEvent(const MissionEvent &event);

    // 检查链路状态，断开时冻结状态机
    void checkLink();

    // 检查悬停超时
    void checkHoldTimeout(TimePoint now);

    // 航线飞完时 NAVIGATING -> IDLE
    void checkMissionComplete();

    void addListener(TransitionListener listener);

    MissionState state() const;
    std::string activeMissionId() const;
    SmokePauseStatus smokePauseStatus() const;
    bool linkFault() const { return link_fault_.load(); }
    std::optional<std::string> lastError() const;
    std::size_t pendingEvents() const;

    static std::string missionStateToString(MissionState state);
    static std::string eventTypeToString(MissionEventType type);

private:
    void eventLoop();

    bool onStartSequence(const MissionEvent &event);
    bool onSmokeRisingEdge(const MissionEvent &event);
    bool onResume(const MissionEvent &event);
    bool onAbort(const std::string &reason);
    bool onDisconnect();
    bool onAcknowledgeError();

    /**
     * @brief 下发模式切换指令：超时重试，拒绝或链路断开立即返回
     * @param preemptible 为 true 时收到中止请求后不再重试
     */
    CommandResult issueModeCommand(FlightMode mode, bool preemptible);

    // 指令失败后的统一处理：链路断开冻结，其余进入 ERROR
    void handleCommandFailure(FlightMode mode, CommandResult result, MissionState from);

    void setState(MissionState next, const std::string &reason);
    void clearPause();
    void clearMission();

    // 标记正在等待应答的指令是否可被中止请求打断
    void beginCommand(bool preemptible);
    void endCommand();
    void cancelPreemptibleCommand();

    // 悬停前模式中能恢复的只有航线和返航，其余按航线恢复
    static FlightMode resumableMode(FlightMode before_pause);

    AutopilotLink &link_;
    MissionControllerConfig config_;

    mutable std::mutex state_mutex_; // 保护以下状态字段
    MissionState state_ = MissionState::IDLE;
    std::string mission_id_;
    std::vector<Waypoint> waypoints_;
    FlightMode nav_mode_ = FlightMode::MISSION; // 恢复时切回的模式
    FlightMode mode_before_pause_ = FlightMode::UNKNOWN;
    std::optional<GeoPoint> pause_location_;
    std::optional<TimePoint> pause_since_;
    int paused_waypoint_ = -1;
    std::optional<std::string> last_error_;

    std::mutex listener_mutex_;
    std::vector<TransitionListener> listeners_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<MissionEvent> queue_;

    std::mutex command_mutex_;
    bool preemptible_in_flight_ = false;

    std::atomic<bool> abort_requested_{false};
    std::atomic<bool> link_fault_{false};
    std::atomic<bool> running_{false};
    std::thread worker_;
};

#endif // MISSION_CONTROLLER_HPP
