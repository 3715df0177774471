#include "detection_aggregator.hpp"

#include <algorithm>

DetectionAggregator::DetectionAggregator(const AggregatorConfig &config) : config_(config)
{
    config_.smoke_consecutive_frames = std::max(1, config_.smoke_consecutive_frames);
    config_.fire_confirm_frames = std::max(1, config_.fire_confirm_frames);
}

AggregateUpdate DetectionAggregator::update(StageId stage, const std::vector<Detection> &detections, uint64_t frame_seq, TimePoint frame_ts)
{
    std::lock_guard<std::mutex> lock(mutex_);

    const bool smoke_before = state_.has_smoke;
    const bool fire_before = state_.has_fire;

    AggregateUpdate result;
    if (stage == StageId::STAGE1_SMOKE)
    {
        applyStage1(detections, frame_seq, frame_ts);
    }
    else
    {
        result.applied = applyStage2(detections, frame_seq, frame_ts);
    }

    result.smoke_rising = !smoke_before && state_.has_smoke;
    result.smoke_falling = smoke_before && !state_.has_smoke;
    result.fire_rising = !fire_before && state_.has_fire;
    result.fire_falling = fire_before && !state_.has_fire;
    result.state = state_;
    return result;
}

void DetectionAggregator::applyStage1(const std::vector<Detection> &detections, uint64_t frame_seq, TimePoint frame_ts)
{
    float max_conf = 0.0f;
    state_.smoke_boxes.clear();
    for (const auto &det : detections)
    {
        if (det.cls != DetectionClass::SMOKE || det.confidence < config_.smoke_threshold)
        {
            continue;
        }
        max_conf = std::max(max_conf, det.confidence);
        state_.smoke_boxes.push_back(det.box);
    }

    state_.smoke_max_conf = max_conf;
    state_.smoke_box_count = static_cast<int>(state_.smoke_boxes.size());

    // 迟滞：连续 N 帧合格才置位，任一帧不合格立即复位
    if (state_.smoke_box_count > 0)
    {
        state_.smoke_consecutive_frames++;
    }
    else
    {
        state_.smoke_consecutive_frames = 0;
    }
    state_.has_smoke = state_.smoke_consecutive_frames >= config_.smoke_consecutive_frames;

    state_.last_frame_seq = frame_seq;
    state_.last_update_time = frame_ts;

    expireFireHold(frame_ts);
}

bool DetectionAggregator::applyStage2(const std::vector<Detection> &detections, uint64_t frame_seq, TimePoint frame_ts)
{
    if (frame_seq <= state_.last_fire_seq)
    {
        state_.stage2_stale_results++;
        return false;
    }
    state_.last_fire_seq = frame_seq;
    state_.last_fire_check_time = frame_ts;

    float max_conf = 0.0f;
    std::vector<cv::Rect> boxes;
    for (const auto &det : detections)
    {
        if (det.cls != DetectionClass::FIRE || det.confidence < config_.fire_threshold)
        {
            continue;
        }
        max_conf = std::max(max_conf, det.confidence);
        boxes.push_back(det.box);
    }

    if (!boxes.empty())
    {
        state_.fire_consecutive_frames++;
        if (state_.fire_consecutive_frames >= config_.fire_confirm_frames)
        {
            state_.has_fire = true;
            state_.last_fire_confirm_time = frame_ts;
            state_.fire_max_conf = max_conf;
            state_.fire_box_count = static_cast<int>(boxes.size());
            state_.fire_boxes = std::move(boxes);
        }
    }
    else
    {
        state_.fire_consecutive_frames = 0;
    }

    expireFireHold(frame_ts);
    return true;
}

// 明火确认后保持 fire_hold_sec 秒，超时后清除
void DetectionAggregator::expireFireHold(TimePoint now)
{
    if (!state_.has_fire || !state_.last_fire_confirm_time)
    {
        return;
    }

    if (seconds_between(*state_.last_fire_confirm_time, now) > config_.fire_hold_sec)
    {
        state_.has_fire = false;
        state_.fire_max_conf = 0.0f;
        state_.fire_box_count = 0;
        state_.fire_boxes.clear();
    }
}

AggregateState DetectionAggregator::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void DetectionAggregator::markStageTimeout(StageId stage)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (stage == StageId::STAGE1_SMOKE)
    {
        state_.stage1_timeouts++;
    }
    else
    {
        state_.stage2_timeouts++;
    }
}

void DetectionAggregator::markStageFault(StageId stage)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (stage == StageId::STAGE1_SMOKE)
    {
        state_.stage1_fault = true;
    }
    else
    {
        state_.stage2_fault = true;
        state_.smoke_only_mode = true; // 第二阶段故障后降级为仅烟雾检测
    }
}

void DetectionAggregator::markStage2Skipped()
{
    std::lock_guard<std::mutex> lock(mutex_);
    state_.stage2_skipped_busy++;
}

void DetectionAggregator::markAlertQueued(DetectionClass cls, TimePoint ts)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (cls == DetectionClass::SMOKE)
    {
        state_.last_smoke_alert_time = ts;
    }
    else
    {
        state_.last_fire_alert_time = ts;
    }
}

void DetectionAggregator::markFireSnapshot(TimePoint ts)
{
    std::lock_guard<std::mutex> lock(mutex_);
    state_.last_fire_snapshot_time = ts;
}

void DetectionAggregator::setTelemetryStale(bool stale)
{
    std::lock_guard<std::mutex> lock(mutex_);
    state_.telemetry_stale = stale;
}
