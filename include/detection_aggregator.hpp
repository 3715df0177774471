#ifndef DETECTION_AGGREGATOR_HPP
#define DETECTION_AGGREGATOR_HPP

#include "detection_types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

/**
 * @brief 烟雾/明火聚合状态
 * 聚合器内部持有唯一可变实例，对外只返回拷贝
 */
struct AggregateState
{
    bool has_smoke = false;           // 烟雾(迟滞后)
    bool has_fire = false;            // 明火(确认后保持)
    float smoke_max_conf = 0.0f;      // 最近一帧合格烟雾框最大置信度
    float fire_max_conf = 0.0f;       // 最近一次明火确认的最大置信度
    int smoke_box_count = 0;          // 最近一帧合格烟雾框数量
    int fire_box_count = 0;           // 最近一次第二阶段明火框数量
    int smoke_consecutive_frames = 0; // 连续合格烟雾帧数
    int fire_consecutive_frames = 0;  // 连续明火命中次数
    std::vector<cv::Rect> smoke_boxes;
    std::vector<cv::Rect> fire_boxes;

    std::optional<TimePoint> last_fire_check_time;    // 最近一次第二阶段结果时间
    std::optional<TimePoint> last_fire_confirm_time;  // 最近一次明火确认时间
    std::optional<TimePoint> last_fire_snapshot_time; // 最近一次明火快照时间
    std::optional<TimePoint> last_smoke_alert_time;   // 最近一次烟雾告警入队时间
    std::optional<TimePoint> last_fire_alert_time;    // 最近一次明火告警入队时间
    std::optional<TimePoint> last_update_time;        // 最近一次第一阶段更新时间

    uint64_t last_frame_seq = 0; // 最近一次第一阶段帧序号
    uint64_t last_fire_seq = 0;  // 最近一次已应用的第二阶段帧序号

    // 降级标志
    bool stage1_fault = false;
    bool stage2_fault = false;
    bool smoke_only_mode = false;
    bool telemetry_stale = false;
    uint64_t stage1_timeouts = 0;
    uint64_t stage2_timeouts = 0;
    uint64_t stage2_skipped_busy = 0;
    uint64_t stage2_stale_results = 0;
};

// 一次更新的结果：更新后的快照和边沿
struct AggregateUpdate
{
    AggregateState state;
    bool applied = true;     // 第二阶段过期结果被丢弃时为 false
    bool smoke_rising = false;
    bool smoke_falling = false;
    bool fire_rising = false;
    bool fire_falling = false;
};

struct AggregatorConfig
{
    float smoke_threshold = 0.30f;
    float fire_threshold = 0.50f;
    int smoke_consecutive_frames = 3;
    int fire_confirm_frames = 2;
    double fire_hold_sec = 3.0;
};

/**
 * @brief 检测结果聚合器
 * 第一阶段(主循环)和第二阶段(明火工作线程)两个写者，互斥锁只在状态迁移和拷贝期间持有
 */
class DetectionAggregator
{
public:
    explicit DetectionAggregator(const AggregatorConfig &config);

    /**
     * @brief 应用一个阶段的检测结果
     * @param stage 结果来源阶段
     * @param detections 该阶段已过滤的检测结果(原图坐标)
     * @param frame_seq 帧序号，第二阶段结果序号不大于已应用序号时丢弃
     * @param frame_ts 帧时间戳，迟滞和保持时间均以此为准
     */
    AggregateUpdate update(StageId stage, const std::vector<Detection> &detections, uint64_t frame_seq, TimePoint frame_ts);

    AggregateState snapshot() const;

    void markStageTimeout(StageId stage);
    void markStageFault(StageId stage);
    void markStage2Skipped();
    void markAlertQueued(DetectionClass cls, TimePoint ts);
    void markFireSnapshot(TimePoint ts);
    void setTelemetryStale(bool stale);

    const AggregatorConfig &config() const { return config_; }

private:
    void applyStage1(const std::vector<Detection> &detections, uint64_t frame_seq, TimePoint frame_ts);
    bool applyStage2(const std::vector<Detection> &detections, uint64_t frame_seq, TimePoint frame_ts);
    void expireFireHold(TimePoint now);

    AggregatorConfig config_;
    mutable std::mutex mutex_;
    AggregateState state_;
};

#endif // DETECTION_AGGREGATOR_HPP
