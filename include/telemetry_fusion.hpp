#ifndef TELEMETRY_FUSION_HPP
#define TELEMETRY_FUSION_HPP

#include "config.hpp"
#include "geo_alert.hpp"
#include "stage_scheduler.hpp"

#include <functional>
#include <optional>
#include <string>

using TelemetryProvider = std::function<std::optional<TelemetrySample>()>;

/**
 * @brief 检测事件与遥测融合
 * 只读取内存中的最新遥测，不做任何网络 I/O
 */
class TelemetryFusion
{
public:
    TelemetryFusion(const FusionConfig &config, TelemetryProvider provider);

    /**
     * @brief 生成告警
     * 遥测缺失或超过 telemetry_stale_sec 时坐标置空，告警照常生成
     */
    GeoAlert fuse(const DetectionEvent &event) const;

    // 在参考时间点遥测是否有效
    std::optional<TelemetrySample> freshTelemetry(TimePoint reference) const;

    static std::string geoLink(double latitude_deg, double longitude_deg);

    std::string caption(const GeoAlert &alert) const;

private:
    FusionConfig config_;
    TelemetryProvider provider_;
};

#endif // TELEMETRY_FUSION_HPP
