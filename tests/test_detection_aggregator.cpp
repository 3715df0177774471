#include "detection_aggregator.hpp"

#include <gtest/gtest.h>

namespace
{
Detection smoke(float conf)
{
    Detection d;
    d.cls = DetectionClass::SMOKE;
    d.confidence = conf;
    d.box = cv::Rect(10, 10, 100, 100);
    return d;
}

Detection fire(float conf)
{
    Detection d;
    d.cls = DetectionClass::FIRE;
    d.confidence = conf;
    d.box = cv::Rect(20, 20, 40, 40);
    d.stage = StageId::STAGE2_FIRE;
    return d;
}

AggregatorConfig config_with(int smoke_n, int fire_n = 2)
{
    AggregatorConfig cfg;
    cfg.smoke_threshold = 0.3f;
    cfg.fire_threshold = 0.5f;
    cfg.smoke_consecutive_frames = smoke_n;
    cfg.fire_confirm_frames = fire_n;
    cfg.fire_hold_sec = 3.0;
    return cfg;
}

TimePoint at(double sec)
{
    return TimePoint(std::chrono::milliseconds(static_cast<int64_t>(sec * 1000.0)));
}
} // namespace

TEST(DetectionAggregator, SingleFrameHysteresis)
{
    DetectionAggregator agg(config_with(1));

    auto u1 = agg.update(StageId::STAGE1_SMOKE, {smoke(0.6f)}, 1, at(0.0));
    EXPECT_TRUE(u1.state.has_smoke);
    EXPECT_TRUE(u1.smoke_rising);

    auto u2 = agg.update(StageId::STAGE1_SMOKE, {}, 2, at(0.1));
    EXPECT_FALSE(u2.state.has_smoke);
    EXPECT_TRUE(u2.smoke_falling);
}

TEST(DetectionAggregator, ThreeFrameHysteresis)
{
    DetectionAggregator agg(config_with(3));

    EXPECT_FALSE(agg.update(StageId::STAGE1_SMOKE, {smoke(0.5f)}, 1, at(0.0)).state.has_smoke);
    EXPECT_FALSE(agg.update(StageId::STAGE1_SMOKE, {smoke(0.5f)}, 2, at(0.1)).state.has_smoke);
    auto third = agg.update(StageId::STAGE1_SMOKE, {smoke(0.5f)}, 3, at(0.2));
    EXPECT_TRUE(third.state.has_smoke);
    EXPECT_TRUE(third.smoke_rising);
    EXPECT_EQ(third.state.smoke_consecutive_frames, 3);

    // 持续有烟不会再产生上升沿
    auto fourth = agg.update(StageId::STAGE1_SMOKE, {smoke(0.5f)}, 4, at(0.3));
    EXPECT_TRUE(fourth.state.has_smoke);
    EXPECT_FALSE(fourth.smoke_rising);

    // 一帧无烟立即复位
    auto clear = agg.update(StageId::STAGE1_SMOKE, {}, 5, at(0.4));
    EXPECT_FALSE(clear.state.has_smoke);
    EXPECT_EQ(clear.state.smoke_consecutive_frames, 0);

    // 重新计数
    EXPECT_FALSE(agg.update(StageId::STAGE1_SMOKE, {smoke(0.5f)}, 6, at(0.5)).state.has_smoke);
}

TEST(DetectionAggregator, ConfidenceSequenceWithTwoFrameWindow)
{
    DetectionAggregator agg(config_with(2));
    const float confs[] = {0.1f, 0.4f, 0.6f, 0.65f};
    const bool expected[] = {false, false, true, true};

    for (int i = 0; i < 4; ++i)
    {
        auto u = agg.update(StageId::STAGE1_SMOKE, {smoke(confs[i])}, static_cast<uint64_t>(i + 1), at(i * 0.1));
        EXPECT_EQ(u.state.has_smoke, expected[i]) << "frame " << i + 1;
    }
}

TEST(DetectionAggregator, BelowThresholdDoesNotCount)
{
    DetectionAggregator agg(config_with(1));
    auto u = agg.update(StageId::STAGE1_SMOKE, {smoke(0.29f)}, 1, at(0.0));
    EXPECT_FALSE(u.state.has_smoke);
    EXPECT_EQ(u.state.smoke_box_count, 0);
}

TEST(DetectionAggregator, FireNeedsConsecutiveConfirmations)
{
    DetectionAggregator agg(config_with(1, 2));

    auto first = agg.update(StageId::STAGE2_FIRE, {fire(0.7f)}, 1, at(0.0));
    EXPECT_FALSE(first.state.has_fire);
    EXPECT_EQ(first.state.fire_consecutive_frames, 1);

    auto second = agg.update(StageId::STAGE2_FIRE, {fire(0.8f)}, 2, at(0.1));
    EXPECT_TRUE(second.state.has_fire);
    EXPECT_TRUE(second.fire_rising);
    EXPECT_FLOAT_EQ(second.state.fire_max_conf, 0.8f);
    EXPECT_EQ(second.state.fire_box_count, 1);
    ASSERT_TRUE(second.state.last_fire_confirm_time.has_value());
}

TEST(DetectionAggregator, FireHoldExpires)
{
    DetectionAggregator agg(config_with(1, 1));

    agg.update(StageId::STAGE2_FIRE, {fire(0.9f)}, 1, at(0.0));
    EXPECT_TRUE(agg.snapshot().has_fire);

    // 保持时间内仍为真
    auto within = agg.update(StageId::STAGE1_SMOKE, {}, 2, at(2.0));
    EXPECT_TRUE(within.state.has_fire);

    auto after = agg.update(StageId::STAGE1_SMOKE, {}, 3, at(3.5));
    EXPECT_FALSE(after.state.has_fire);
    EXPECT_TRUE(after.fire_falling);
}

TEST(DetectionAggregator, StaleStage2ResultIsDiscarded)
{
    DetectionAggregator agg(config_with(1, 1));

    EXPECT_TRUE(agg.update(StageId::STAGE2_FIRE, {}, 5, at(0.5)).applied);

    auto stale = agg.update(StageId::STAGE2_FIRE, {fire(0.9f)}, 4, at(0.4));
    EXPECT_FALSE(stale.applied);
    EXPECT_FALSE(stale.state.has_fire);
    EXPECT_EQ(stale.state.stage2_stale_results, 1u);

    auto same = agg.update(StageId::STAGE2_FIRE, {fire(0.9f)}, 5, at(0.5));
    EXPECT_FALSE(same.applied);

    auto fresh = agg.update(StageId::STAGE2_FIRE, {fire(0.9f)}, 6, at(0.6));
    EXPECT_TRUE(fresh.applied);
    EXPECT_TRUE(fresh.state.has_fire);
}

TEST(DetectionAggregator, Stage2FaultEntersSmokeOnlyMode)
{
    DetectionAggregator agg(config_with(1));
    agg.markStageFault(StageId::STAGE2_FIRE);
    agg.markStageTimeout(StageId::STAGE1_SMOKE);

    AggregateState s = agg.snapshot();
    EXPECT_TRUE(s.stage2_fault);
    EXPECT_TRUE(s.smoke_only_mode);
    EXPECT_FALSE(s.stage1_fault);
    EXPECT_EQ(s.stage1_timeouts, 1u);
}
