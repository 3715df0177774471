#include "fakes.hpp"
#include "telemetry_fusion.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;

namespace
{
const TimePoint T0 = TimePoint(std::chrono::hours(24 * 365 * 50));

DetectionEvent make_event(DetectionClass kind, bool with_image = true)
{
    DetectionEvent event;
    event.kind = kind;
    event.frame.seq = 42;
    event.frame.timestamp = T0;
    if (with_image)
    {
        event.frame.image = cv::Mat(480, 640, CV_8UC3, cv::Scalar(40, 80, 120));
    }
    event.detections = {make_detection(kind, 0.62f, cv::Rect(100, 100, 80, 60)),
                        make_detection(kind, 0.87f, cv::Rect(300, 200, 50, 50))};
    return event;
}

TelemetryProvider fixed(std::optional<TelemetrySample> sample)
{
    return [sample]()
    { return sample; };
}
} // namespace

TEST(TelemetryFusion, FreshTelemetryAddsGeoLink)
{
    TelemetryFusion fusion(FusionConfig{}, fixed(make_telemetry(47.3977419, 8.5455938, T0 - 1s)));
    GeoAlert alert = fusion.fuse(make_event(DetectionClass::FIRE));

    EXPECT_EQ(alert.kind, AlertKind::FIRE_CONFIRMED);
    EXPECT_FLOAT_EQ(alert.max_confidence, 0.87f);
    EXPECT_EQ(alert.box_count, 2);
    EXPECT_EQ(alert.frame_seq, 42u);
    EXPECT_EQ(alert.created_at, T0);

    ASSERT_TRUE(alert.telemetry.has_value());
    ASSERT_TRUE(alert.geo_link.has_value());
    EXPECT_EQ(*alert.geo_link, "https://maps.google.com/?q=47.3977419,8.5455938");

    EXPECT_EQ(alert.caption.rfind("FIRE CONFIRMED!", 0), 0u);
    EXPECT_NE(alert.caption.find("Confidence: 87.0%"), std::string::npos);
    EXPECT_NE(alert.caption.find("Boxes: 2"), std::string::npos);
    EXPECT_NE(alert.caption.find("Map: https://maps.google.com/?q="), std::string::npos);
    EXPECT_NE(alert.caption.find("IMMEDIATE ACTION REQUIRED!"), std::string::npos);
}

TEST(TelemetryFusion, StaleTelemetryStillProducesAlert)
{
    TelemetryFusion fusion(FusionConfig{}, fixed(make_telemetry(47.0, 8.0, T0 - 6s)));
    GeoAlert alert = fusion.fuse(make_event(DetectionClass::SMOKE));

    EXPECT_EQ(alert.kind, AlertKind::SMOKE_WARNING);
    EXPECT_FALSE(alert.telemetry.has_value());
    EXPECT_FALSE(alert.geo_link.has_value());
    EXPECT_EQ(alert.caption.rfind("SMOKE DETECTED!", 0), 0u);
    EXPECT_NE(alert.caption.find("Location: unavailable"), std::string::npos);
    EXPECT_NE(alert.caption.find("Checking for fire..."), std::string::npos);
}

TEST(TelemetryFusion, StalenessThresholdIsInclusive)
{
    TelemetryFusion fusion(FusionConfig{}, fixed(make_telemetry(47.0, 8.0, T0 - 5s)));
    EXPECT_TRUE(fusion.freshTelemetry(T0).has_value());
    EXPECT_FALSE(fusion.freshTelemetry(T0 + 1s).has_value());
}

TEST(TelemetryFusion, MissingTelemetryUsesLocationLabel)
{
    FusionConfig cfg;
    cfg.location_label = "North ridge tower";

    TelemetryFusion no_sample(cfg, fixed(std::nullopt));
    GeoAlert alert = no_sample.fuse(make_event(DetectionClass::SMOKE));
    EXPECT_FALSE(alert.geo_link.has_value());
    EXPECT_NE(alert.caption.find("Location: North ridge tower"), std::string::npos);

    // 有遥测但没有定位
    TelemetrySample no_fix = make_telemetry(0.0, 0.0, T0);
    no_fix.has_position = false;
    TelemetryFusion without_fix(cfg, fixed(no_fix));
    EXPECT_FALSE(without_fix.freshTelemetry(T0).has_value());

    TelemetryFusion no_provider(cfg, nullptr);
    EXPECT_FALSE(no_provider.freshTelemetry(T0).has_value());
}

TEST(TelemetryFusion, RendersJpegFromFrame)
{
    TelemetryFusion fusion(FusionConfig{}, fixed(std::nullopt));

    GeoAlert alert = fusion.fuse(make_event(DetectionClass::FIRE));
    ASSERT_GT(alert.jpeg.size(), 2u);
    EXPECT_EQ(alert.jpeg[0], 0xff);
    EXPECT_EQ(alert.jpeg[1], 0xd8);

    GeoAlert no_image = fusion.fuse(make_event(DetectionClass::FIRE, false));
    EXPECT_TRUE(no_image.jpeg.empty());
}
