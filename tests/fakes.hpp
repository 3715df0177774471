#pragma once

#include "autopilot_link.hpp"
#include "inference_backend.hpp"
#include "notification_transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

// 按脚本返回结果的推理后端
class FakeBackend : public InferenceBackend
{
public:
    explicit FakeBackend(bool load_ok = true) : load_ok_(load_ok) {}

    bool load() override { return load_ok_; }

    InferenceResult infer(const cv::Mat &image) override
    {
        calls++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_input_size_ = image.size();
        }
        if (delay.count() > 0)
        {
            std::this_thread::sleep_for(delay);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (script_.empty())
        {
            return InferenceResult{};
        }
        InferenceResult r = script_.front();
        script_.pop_front();
        return r;
    }

    std::string name() const override { return "fake"; }

    void push(const InferenceResult &result)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(result);
    }

    cv::Size lastInputSize() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_input_size_;
    }

    std::atomic<int> calls{0};
    std::chrono::milliseconds delay{0};

private:
    bool load_ok_;
    mutable std::mutex mutex_;
    std::deque<InferenceResult> script_;
    cv::Size last_input_size_;
};

inline Detection make_detection(DetectionClass cls, float conf, const cv::Rect &box)
{
    Detection d;
    d.cls = cls;
    d.confidence = conf;
    d.box = box;
    return d;
}

inline InferenceResult make_result(std::vector<Detection> detections, InferenceStatus status = InferenceStatus::OK)
{
    InferenceResult r;
    r.status = status;
    r.detections = std::move(detections);
    return r;
}

// 记录所有指令的飞控链路
class FakeAutopilotLink : public AutopilotLink
{
public:
    CommandResult setMode(FlightMode mode, std::chrono::milliseconds timeout) override
    {
        std::function<void(FlightMode)> hook;
        CommandResult result = default_mode_result;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            mode_commands_.push_back(mode);
            if (cancelled_)
            {
                return CommandResult::CANCELLED;
            }
            if (block_mode && *block_mode == mode)
            {
                // 模拟飞控迟迟不应答，直到被打断或超时
                blocked_ = true;
                cv_.notify_all();
                const bool cancelled = cv_.wait_for(lock, timeout, [this]
                                                    { return cancelled_; });
                blocked_ = false;
                return cancelled ? CommandResult::CANCELLED : CommandResult::TIMEOUT;
            }
            if (!mode_script_.empty())
            {
                result = mode_script_.front();
                mode_script_.pop_front();
            }
            hook = on_set_mode;
        }
        if (hook)
        {
            hook(mode);
        }
        return result;
    }

    CommandResult uploadMission(const std::vector<Waypoint> &waypoints, std::chrono::milliseconds) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        uploads_.push_back(waypoints);
        return upload_result;
    }

    CommandResult setCurrentWaypoint(int index, std::chrono::milliseconds) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        waypoint_commands_.push_back(index);
        return waypoint_result;
    }

    void cancelPending() override
    {
        cancel_calls++;
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
        cv_.notify_all();
    }

    void clearCancel() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = false;
    }

    // 等待 block_mode 指令进入阻塞
    bool waitUntilBlocked(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]
                            { return blocked_; });
    }

    int currentWaypoint() const override { return current_waypoint.load(); }
    bool missionFinished() const override { return mission_finished.load(); }

    std::optional<TelemetrySample> latestTelemetry() const override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return telemetry_;
    }

    bool isConnected() const override { return connected.load(); }

    void scriptModeResults(std::initializer_list<CommandResult> results)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        mode_script_.insert(mode_script_.end(), results.begin(), results.end());
    }

    void setTelemetry(const std::optional<TelemetrySample> &sample)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        telemetry_ = sample;
    }

    std::vector<FlightMode> modeCommands() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return mode_commands_;
    }

    std::vector<int> waypointCommands() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return waypoint_commands_;
    }

    std::size_t uploadCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return uploads_.size();
    }

    std::atomic<bool> connected{true};
    std::atomic<int> current_waypoint{0};
    std::atomic<bool> mission_finished{false};
    std::atomic<int> cancel_calls{0};
    std::optional<FlightMode> block_mode; // 该模式的指令阻塞到被打断
    CommandResult default_mode_result = CommandResult::ACK;
    CommandResult upload_result = CommandResult::ACK;
    CommandResult waypoint_result = CommandResult::ACK;
    std::function<void(FlightMode)> on_set_mode; // 在 setMode 返回前调用

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
    bool blocked_ = false;
    std::deque<CommandResult> mode_script_;
    std::vector<FlightMode> mode_commands_;
    std::vector<int> waypoint_commands_;
    std::vector<std::vector<Waypoint>> uploads_;
    std::optional<TelemetrySample> telemetry_;
};

// 记录发送内容的告警通道
class FakeTransport : public NotificationTransport
{
public:
    struct Sent
    {
        std::string channel;
        std::string text;
        std::size_t image_size = 0;
        std::optional<std::string> geo_link;
    };

    bool send(const std::string &channel,
              const std::string &text,
              const std::vector<unsigned char> &image,
              const std::optional<std::string> &geo_link) override
    {
        attempts++;
        std::lock_guard<std::mutex> lock(mutex_);
        if (failures_left_ > 0)
        {
            failures_left_--;
            return false;
        }
        sent_.push_back(Sent{channel, text, image.size(), geo_link});
        return true;
    }

    void failNext(int n)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_left_ = n;
    }

    std::vector<Sent> sent() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    std::atomic<int> attempts{0};

private:
    mutable std::mutex mutex_;
    int failures_left_ = 0;
    std::vector<Sent> sent_;
};

inline TelemetrySample make_telemetry(double lat, double lon, TimePoint ts)
{
    TelemetrySample t;
    t.has_position = true;
    t.latitude_deg = lat;
    t.longitude_deg = lon;
    t.relative_altitude_m = 30.0f;
    t.absolute_altitude_m = 130.0f;
    t.flight_mode = FlightMode::MISSION;
    t.flight_mode_name = "Mission";
    t.timestamp = ts;
    return t;
}
