#ifndef DETECTION_TYPES_HPP
#define DETECTION_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// 检测类别
enum class DetectionClass
{
    SMOKE, // 烟雾
    FIRE   // 明火
};

// 检测阶段
enum class StageId
{
    STAGE1_SMOKE, // 第一阶段：全帧烟雾检测
    STAGE2_FIRE   // 第二阶段：ROI 明火确认
};

// 推理调用状态
enum class InferenceStatus
{
    OK,
    TIMEOUT,
    HARDWARE_FAULT
};

// 错误分类，用于日志和状态输出
enum class ErrorKind
{
    INFERENCE_TIMEOUT,
    INFERENCE_HARDWARE_FAULT,
    TELEMETRY_STALE,
    AUTOPILOT_COMMAND_TIMEOUT,
    AUTOPILOT_LINK_LOST,
    ALERT_DELIVERY_FAILURE,
    QUEUE_OVERFLOW
};

/**
 * @brief 采集到的一帧图像
 * seq 从 1 开始单调递增，0 表示无效帧
 */
struct Frame
{
    cv::Mat image;       // BGR 图像
    TimePoint timestamp; // 采集时间(墙钟)
    uint64_t seq = 0;    // 帧序号
};

// 单个检测结果，box 为原图坐标
struct Detection
{
    DetectionClass cls = DetectionClass::SMOKE;
    float confidence = 0.0f;
    cv::Rect box;
    StageId stage = StageId::STAGE1_SMOKE;
    TimePoint frame_ts;
};

// 一次推理调用的返回
struct InferenceResult
{
    InferenceStatus status = InferenceStatus::OK;
    std::vector<Detection> detections;
    double latency_ms = 0.0;
};

std::string detectionClassToString(DetectionClass cls);
std::string stageToString(StageId stage);
std::string inferenceStatusToString(InferenceStatus status);
std::string errorKindToString(ErrorKind kind);

// 时间点格式化为本地时间 ISO-8601 字符串(精确到毫秒)
std::string format_iso_time(TimePoint tp);

// 两个时间点之间的秒数(b - a)
double seconds_between(TimePoint a, TimePoint b);

#endif // DETECTION_TYPES_HPP
