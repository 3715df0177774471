#pragma once

#include "autopilot_link.hpp"
#include "detection_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class AlertKind
{
    SMOKE_WARNING, // 烟雾预警
    FIRE_CONFIRMED // 明火确认
};

/**
 * @brief 地理标记告警
 * 每个上升沿创建一次，入队后只由告警线程访问
 */
struct GeoAlert
{
    AlertKind kind = AlertKind::SMOKE_WARNING;
    float max_confidence = 0.0f;
    int box_count = 0;
    std::vector<cv::Rect> boxes;
    std::optional<TelemetrySample> telemetry; // 遥测过期或缺失时为空
    std::optional<std::string> geo_link;      // 地图链接
    std::vector<unsigned char> jpeg;          // 告警图片
    std::string caption;
    TimePoint created_at;
    uint64_t frame_seq = 0;
};

inline std::string alertKindToString(AlertKind kind)
{
    return kind == AlertKind::FIRE_CONFIRMED ? "FireConfirmed" : "SmokeWarning";
}

// 限流通道名，同时作为消息主题后缀
inline std::string alertChannel(AlertKind kind)
{
    return kind == AlertKind::FIRE_CONFIRMED ? "fire" : "smoke";
}
