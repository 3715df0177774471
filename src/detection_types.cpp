#include "detection_types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

std::string detectionClassToString(DetectionClass cls)
{
    switch (cls)
    {
        case DetectionClass::SMOKE:
            return "smoke";
        case DetectionClass::FIRE:
            return "fire";
        default:
            return "unknown";
    }
}

std::string stageToString(StageId stage)
{
    switch (stage)
    {
        case StageId::STAGE1_SMOKE:
            return "stage1";
        case StageId::STAGE2_FIRE:
            return "stage2";
        default:
            return "unknown";
    }
}

std::string inferenceStatusToString(InferenceStatus status)
{
    switch (status)
    {
        case InferenceStatus::OK:
            return "OK";
        case InferenceStatus::TIMEOUT:
            return "TIMEOUT";
        case InferenceStatus::HARDWARE_FAULT:
            return "HARDWARE_FAULT";
        default:
            return "UNKNOWN";
    }
}

std::string errorKindToString(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::INFERENCE_TIMEOUT:
            return "InferenceTimeout";
        case ErrorKind::INFERENCE_HARDWARE_FAULT:
            return "InferenceHardwareFault";
        case ErrorKind::TELEMETRY_STALE:
            return "TelemetryStale";
        case ErrorKind::AUTOPILOT_COMMAND_TIMEOUT:
            return "AutopilotCommandTimeout";
        case ErrorKind::AUTOPILOT_LINK_LOST:
            return "AutopilotLinkLost";
        case ErrorKind::ALERT_DELIVERY_FAILURE:
            return "AlertDeliveryFailure";
        case ErrorKind::QUEUE_OVERFLOW:
            return "QueueOverflow";
        default:
            return "Unknown";
    }
}

std::string format_iso_time(TimePoint tp)
{
    std::time_t t = Clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    if (ms < 0)
    {
        ms += 1000;
    }

    std::tm tm_local{};
    localtime_r(&t, &tm_local);

    std::ostringstream oss;
    oss << std::put_time(&tm_local, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

double seconds_between(TimePoint a, TimePoint b)
{
    return std::chrono::duration_cast<std::chrono::duration<double>>(b - a).count();
}
