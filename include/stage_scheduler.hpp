#ifndef STAGE_SCHEDULER_HPP
#define STAGE_SCHEDULER_HPP

#include "config.hpp"
#include "detection_aggregator.hpp"
#include "inference_session.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

// 检测边沿事件(烟雾预警 / 明火确认)，每个上升沿只产生一次
struct DetectionEvent
{
    DetectionClass kind = DetectionClass::SMOKE;
    AggregateState snapshot;           // 边沿发生时的聚合状态
    Frame frame;                       // 触发帧
    std::vector<Detection> detections; // 触发帧上的合格检测(原图坐标)
};

using DetectionEventSink = std::function<void(const DetectionEvent &)>;

// 每次第二阶段结果含有超过明火阈值的检测时调用(不论是否为上升沿)，在第二阶段工作线程中执行
using FireHitSink = std::function<void(const Frame &frame, const std::vector<Detection> &fire)>;

// 单帧处理结果
struct TickResult
{
    uint64_t seq = 0;
    InferenceStatus stage1_status = InferenceStatus::OK;
    std::vector<Detection> smoke_detections; // 通过阈值和面积过滤的烟雾框
    bool stage2_submitted = false;
    AggregateState state;
    cv::Mat annotated; // 叠加检测框和横幅的画面
};

AggregatorConfig make_aggregator_config(const DetectionConfig &config);

/**
 * @brief 两级检测调度器
 *
 * 每帧必跑第一阶段(烟雾)；只有本帧存在超过烟雾阈值的检测时才把 ROI 交给第二阶段(明火)。
 * 第二阶段忙时跳过本帧，不阻塞第一阶段；第二阶段结果在其工作线程中写入聚合器。
 */
class StageScheduler
{
public:
    StageScheduler(const DetectionConfig &config, InferenceSession &stage1, InferenceSession &stage2, DetectionAggregator &aggregator);

    void setEventSink(DetectionEventSink sink);
    void setFireHitSink(FireHitSink sink);

    TickResult processFrame(const Frame &frame, bool annotate = true);

    uint64_t stage2Invocations() const { return stage2_invocations_.load(); }
    bool waitStage2Idle(std::chrono::milliseconds timeout) { return stage2_.waitIdle(timeout); }
    double fps() const;

private:
    std::vector<Detection> filterSmoke(const InferenceResult &result, const Frame &frame) const;
    bool maybeSubmitStage2(const Frame &frame, const std::vector<Detection> &smoke);
    void onStage2Result(const InferenceResult &result, const cv::Rect &roi, const Frame &frame);
    void emit(DetectionClass kind, const AggregateState &state, const Frame &frame, const std::vector<Detection> &detections);
    void updateFps();

    DetectionConfig config_;
    InferenceSession &stage1_;
    InferenceSession &stage2_;
    DetectionAggregator &aggregator_;

    std::mutex sink_mutex_;
    DetectionEventSink sink_;
    FireHitSink fire_hit_sink_;

    std::atomic<uint64_t> stage2_invocations_{0};
    std::optional<TimePoint> last_stage2_submit_; // 只在主循环线程访问
    bool stage1_fault_reported_ = false;
    bool stage2_fault_reported_ = false;

    mutable std::mutex fps_mutex_;
    double fps_ = 0.0;
    std::chrono::steady_clock::time_point last_tick_{};
};

#endif // STAGE_SCHEDULER_HPP
