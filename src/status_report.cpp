#include "status_report.hpp"

#include <sstream>

using json = nlohmann::json;

namespace
{
json time_or_null(const std::optional<TimePoint> &tp)
{
    return tp ? json(format_iso_time(*tp)) : json(nullptr);
}

json boxes_to_json(const std::vector<cv::Rect> &boxes)
{
    json arr = json::array();
    for (const auto &b : boxes)
    {
        arr.push_back({b.x, b.y, b.width, b.height});
    }
    return arr;
}
} // namespace

json build_status_json(const StatusInputs &in)
{
    const AggregateState &s = in.detection;
    json j;

    // 检测
    j["has_smoke"] = s.has_smoke;
    j["has_fire"] = s.has_fire;
    j["smoke_max_conf"] = s.smoke_max_conf;
    j["fire_max_conf"] = s.fire_max_conf;
    j["smoke_boxes"] = s.smoke_box_count;
    j["fire_boxes"] = s.fire_box_count;
    j["smoke_consec"] = s.smoke_consecutive_frames;
    j["fire_consec"] = s.fire_consecutive_frames;
    j["smoke_rects"] = boxes_to_json(s.smoke_boxes);
    j["fire_rects"] = boxes_to_json(s.fire_boxes);
    j["frame_seq"] = s.last_frame_seq;
    j["fps"] = in.fps;
    j["stage2_invocations"] = in.stage2_invocations;

    j["timestamp"] = format_iso_time(in.now);
    j["last_update"] = time_or_null(s.last_update_time);
    j["last_fire_check"] = time_or_null(s.last_fire_check_time);
    j["last_fire_confirm"] = time_or_null(s.last_fire_confirm_time);
    j["last_fire_snapshot"] = time_or_null(s.last_fire_snapshot_time);
    j["last_smoke_alert"] = time_or_null(s.last_smoke_alert_time);
    j["last_fire_alert"] = time_or_null(s.last_fire_alert_time);
    j["snapshots"] = in.snapshots;

    // 降级状态
    j["faults"] = {
        {"stage1_fault", s.stage1_fault},
        {"stage2_fault", s.stage2_fault},
        {"smoke_only_mode", s.smoke_only_mode},
        {"telemetry_stale", s.telemetry_stale},
        {"autopilot_link_fault", in.link_fault},
        {"stage1_timeouts", s.stage1_timeouts},
        {"stage2_timeouts", s.stage2_timeouts},
        {"stage2_skipped_busy", s.stage2_skipped_busy},
        {"stage2_stale_results", s.stage2_stale_results}};

    // 任务
    j["mission"] = {
        {"state", MissionController::missionStateToString(in.mission_state)},
        {"mission_id", in.mission_id},
        {"link_connected", in.link_connected},
        {"error", in.mission_error ? json(*in.mission_error) : json(nullptr)}};

    if (in.telemetry)
    {
        const TelemetrySample &t = *in.telemetry;
        j["telemetry"] = {
            {"has_position", t.has_position},
            {"lat", t.latitude_deg},
            {"lon", t.longitude_deg},
            {"abs_alt", t.absolute_altitude_m},
            {"rel_alt", t.relative_altitude_m},
            {"roll", t.roll_deg},
            {"pitch", t.pitch_deg},
            {"yaw", t.yaw_deg},
            {"battery", t.battery_remaining_percent},
            {"ground_speed", t.ground_speed_m_s},
            {"armed", t.armed},
            {"flight_mode", flightModeToString(t.flight_mode)},
            {"flight_mode_name", t.flight_mode_name},
            {"updated", format_iso_time(t.timestamp)}};
    }
    else
    {
        j["telemetry"] = nullptr;
    }

    j["alerts"] = {
        {"enqueued", in.alerts.enqueued},
        {"sent", in.alerts.sent},
        {"suppressed", in.alerts.suppressed},
        {"low_confidence", in.alerts.low_confidence},
        {"failed", in.alerts.failed},
        {"overflow", in.alerts.overflow},
        {"queue_depth", in.alerts.queue_depth}};

    return j;
}

std::string build_status_line(const StatusInputs &in)
{
    const AggregateState &s = in.detection;
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(2);

    oss << "fps=" << in.fps
        << " smoke=" << (s.has_smoke ? 1 : 0) << "(" << s.smoke_max_conf << "," << s.smoke_consecutive_frames << ")"
        << " fire=" << (s.has_fire ? 1 : 0) << "(" << s.fire_max_conf << ")"
        << " s2=" << in.stage2_invocations
        << " mission=" << MissionController::missionStateToString(in.mission_state)
        << " link=" << (in.link_connected ? "up" : "down")
        << " alerts=" << in.alerts.sent << "/" << in.alerts.enqueued;

    if (s.stage1_fault)
    {
        oss << " STAGE1_FAULT";
    }
    if (s.smoke_only_mode)
    {
        oss << " SMOKE_ONLY";
    }
    if (s.telemetry_stale)
    {
        oss << " TELEMETRY_STALE";
    }
    return oss.str();
}
