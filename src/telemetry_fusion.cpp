#include "telemetry_fusion.hpp"
#include "detection_overlay.hpp"
#include "logger.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

TelemetryFusion::TelemetryFusion(const FusionConfig &config, TelemetryProvider provider)
    : config_(config), provider_(std::move(provider))
{
}

std::optional<TelemetrySample> TelemetryFusion::freshTelemetry(TimePoint reference) const
{
    if (!provider_)
    {
        return std::nullopt;
    }

    std::optional<TelemetrySample> sample = provider_();
    if (!sample || !sample->has_position)
    {
        return std::nullopt;
    }

    const double age = seconds_between(sample->timestamp, reference);
    if (age > config_.telemetry_stale_sec)
    {
        logging::get_logger()->warn("[fusion] {}: 遥测已 {:.1f}s 未更新", errorKindToString(ErrorKind::TELEMETRY_STALE), age);
        return std::nullopt;
    }
    return sample;
}

std::string TelemetryFusion::geoLink(double latitude_deg, double longitude_deg)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(7) << "https://maps.google.com/?q=" << latitude_deg << "," << longitude_deg;
    return oss.str();
}

std::string TelemetryFusion::caption(const GeoAlert &alert) const
{
    std::ostringstream oss;
    oss << std::fixed;

    if (alert.kind == AlertKind::FIRE_CONFIRMED)
    {
        oss << "FIRE CONFIRMED!\n";
    }
    else
    {
        oss << "SMOKE DETECTED!\n";
    }
    oss << "Confidence: " << std::setprecision(1) << alert.max_confidence * 100.0f << "%\n";
    oss << "Boxes: " << alert.box_count << "\n";
    oss << "Time: " << format_iso_time(alert.created_at) << "\n";

    if (alert.telemetry)
    {
        oss << "Location: " << std::setprecision(6) << alert.telemetry->latitude_deg << ", " << alert.telemetry->longitude_deg
            << " (" << std::setprecision(1) << alert.telemetry->relative_altitude_m << " m AGL)\n";
        if (alert.geo_link)
        {
            oss << "Map: " << *alert.geo_link << "\n";
        }
    }
    else if (!config_.location_label.empty())
    {
        oss << "Location: " << config_.location_label << "\n";
    }
    else
    {
        oss << "Location: unavailable\n";
    }

    if (alert.kind == AlertKind::FIRE_CONFIRMED)
    {
        oss << "IMMEDIATE ACTION REQUIRED!";
    }
    else
    {
        oss << "Checking for fire...";
    }
    return oss.str();
}

GeoAlert TelemetryFusion::fuse(const DetectionEvent &event) const
{
    GeoAlert alert;
    alert.kind = event.kind == DetectionClass::FIRE ? AlertKind::FIRE_CONFIRMED : AlertKind::SMOKE_WARNING;
    alert.created_at = event.frame.timestamp;
    alert.frame_seq = event.frame.seq;

    for (const auto &det : event.detections)
    {
        alert.max_confidence = std::max(alert.max_confidence, det.confidence);
        alert.boxes.push_back(det.box);
    }
    alert.box_count = static_cast<int>(alert.boxes.size());

    alert.telemetry = freshTelemetry(event.frame.timestamp);
    if (alert.telemetry)
    {
        alert.geo_link = geoLink(alert.telemetry->latitude_deg, alert.telemetry->longitude_deg);
    }

    // 告警图片
    if (!event.frame.image.empty())
    {
        std::ostringstream banner;
        banner << std::fixed << std::setprecision(0);
        cv::Scalar color;
        if (alert.kind == AlertKind::FIRE_CONFIRMED)
        {
            banner << "FIRE CONFIRMED " << alert.max_confidence * 100.0f << "%";
            color = COLOR_FIRE;
        }
        else
        {
            banner << "SMOKE WARNING " << alert.max_confidence * 100.0f << "%";
            color = COLOR_BANNER;
        }
        cv::Mat rendered = render_alert_image(event.frame.image, event.detections, banner.str(), color);
        alert.jpeg = encode_jpeg(rendered, config_.jpeg_quality);
    }

    alert.caption = caption(alert);
    return alert;
}
