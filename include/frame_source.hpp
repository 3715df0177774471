#pragma once

#include "config.hpp"
#include "detection_types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>

#include <opencv2/videoio.hpp>

// 视频帧来源
class FrameSource
{
public:
    virtual ~FrameSource() = default;

    virtual bool start() = 0;
    virtual void stop() = 0;

    // 取下一帧，超时或停止时返回空
    virtual std::optional<Frame> nextFrame(std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief 基于 cv::VideoCapture 的采集(摄像头序号 / RTSP / 视频文件)
 * 采集线程持续读帧放入长度为 queue_size 的队列，队列满时丢弃最旧帧；断流后按间隔重连
 */
class VideoCaptureSource : public FrameSource
{
public:
    explicit VideoCaptureSource(const VideoConfig &config);
    ~VideoCaptureSource() override;

    bool start() override;
    void stop() override;
    std::optional<Frame> nextFrame(std::chrono::milliseconds timeout) override;

    uint64_t droppedFrames() const { return dropped_.load(); }
    bool connected() const { return connected_.load(); }

private:
    bool open();
    void captureThread();

    VideoConfig config_;
    cv::VideoCapture capture_; // 只在采集线程中使用(start 前除外)

    std::deque<Frame> frame_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cond_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<uint64_t> dropped_{0};
    uint64_t next_seq_ = 1;
    std::thread capture_thread_;
};
