#ifndef STATUS_REPORT_HPP
#define STATUS_REPORT_HPP

#include "alert_dispatcher.hpp"
#include "autopilot_link.hpp"
#include "detection_aggregator.hpp"
#include "mission_controller.hpp"

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

// 状态输出所需的各模块快照
struct StatusInputs
{
    AggregateState detection;
    double fps = 0.0;
    uint64_t stage2_invocations = 0;
    MissionState mission_state = MissionState::IDLE;
    std::string mission_id;
    bool link_connected = false;
    bool link_fault = false;
    std::optional<std::string> mission_error;
    std::optional<TelemetrySample> telemetry;
    DispatcherStats alerts;
    std::size_t snapshots = 0;
    TimePoint now = Clock::now();
};

/**
 * @brief /api/status 输出
 * 时间字段为本地时间 ISO-8601 字符串，未发生时为 null
 */
nlohmann::json build_status_json(const StatusInputs &in);

// 每秒日志/MQTT 状态行
std::string build_status_line(const StatusInputs &in);

#endif // STATUS_REPORT_HPP
