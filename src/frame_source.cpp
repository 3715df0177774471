#include "frame_source.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

VideoCaptureSource::VideoCaptureSource(const VideoConfig &config) : config_(config)
{
    config_.queue_size = std::max(1, config_.queue_size);
}

VideoCaptureSource::~VideoCaptureSource()
{
    stop();
}

// 纯数字视为摄像头序号
bool VideoCaptureSource::open()
{
    auto logger = logging::get_logger();
    const std::string &source = config_.source;

    try
    {
        const bool is_index = !source.empty() && std::all_of(source.begin(), source.end(), [](unsigned char c)
                                                             { return std::isdigit(c) != 0; });
        bool ok = false;
        if (is_index)
        {
            int index = 0;
            try
            {
                index = std::stoi(source);
            }
            catch (const std::out_of_range &)
            {
                logger->error("[video] 摄像头序号超出范围: {}", source);
                return false;
            }
            ok = capture_.open(index);
        }
        else
        {
            ok = capture_.open(source, cv::CAP_FFMPEG) || capture_.open(source);
        }

        if (!ok || !capture_.isOpened())
        {
            logger->error("[video] 无法打开视频源: {}", source);
            return false;
        }
    }
    catch (const cv::Exception &e)
    {
        logger->error("[video] 打开视频源异常({}): {}", source, e.what());
        return false;
    }

    capture_.set(cv::CAP_PROP_BUFFERSIZE, 1);
    logger->info("[video] 视频源已打开: {} ({}x{} @ {:.1f}fps)", source,
                 static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_WIDTH)),
                 static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_HEIGHT)),
                 capture_.get(cv::CAP_PROP_FPS));
    return true;
}

bool VideoCaptureSource::start()
{
    if (running_)
    {
        return true;
    }

    // 首次打开失败视为启动失败
    if (!open())
    {
        return false;
    }

    connected_ = true;
    running_ = true;
    capture_thread_ = std::thread(&VideoCaptureSource::captureThread, this);
    return true;
}

void VideoCaptureSource::stop()
{
    if (!running_.exchange(false))
    {
        return;
    }

    queue_cond_.notify_all();
    if (capture_thread_.joinable())
    {
        capture_thread_.join();
    }
    capture_.release();

    std::lock_guard<std::mutex> lock(queue_mutex_);
    frame_queue_.clear();
}

std::optional<Frame> VideoCaptureSource::nextFrame(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(queue_mutex_);

    // 等待直到队列非空或已停止
    if (!queue_cond_.wait_for(lock, timeout, [this]
                              { return !running_ || !frame_queue_.empty(); }))
    {
        return std::nullopt;
    }
    if (frame_queue_.empty())
    {
        return std::nullopt;
    }

    Frame frame = std::move(frame_queue_.front());
    frame_queue_.pop_front();
    return frame;
}

void VideoCaptureSource::captureThread()
{
    auto logger = logging::get_logger();
    const auto reconnect_delay = std::chrono::milliseconds(config_.reconnect_delay_ms);

    while (running_)
    {
        if (!connected_)
        {
            std::this_thread::sleep_for(reconnect_delay);
            if (!running_)
            {
                break;
            }
            capture_.release();
            if (open())
            {
                connected_ = true;
                logger->info("[video] 视频源重连成功");
            }
            continue;
        }

        cv::Mat image;
        bool ok = false;
        try
        {
            ok = capture_.read(image);
        }
        catch (const cv::Exception &e)
        {
            logger->error("[video] 读帧异常: {}", e.what());
        }

        if (!ok || image.empty())
        {
            logger->warn("[video] 视频流中断，{}ms 后重连", config_.reconnect_delay_ms);
            connected_ = false;
            continue;
        }

        Frame frame;
        frame.image = std::move(image);
        frame.timestamp = Clock::now();

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            frame.seq = next_seq_++;
            if (frame_queue_.size() >= static_cast<std::size_t>(config_.queue_size))
            {
                frame_queue_.pop_front(); // 丢弃最早的一帧
                ++dropped_;
            }
            frame_queue_.push_back(std::move(frame));
        }
        queue_cond_.notify_one();
    }
}
