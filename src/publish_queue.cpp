#include "publish_queue.hpp"
#include "logger.hpp"

#include <algorithm>

PublishQueue::PublishQueue(std::size_t capacity, PublishFn publish)
    : capacity_(std::max<std::size_t>(1, capacity)), publish_(std::move(publish))
{
}

PublishQueue::~PublishQueue()
{
    stop();
}

void PublishQueue::start()
{
    if (running_.exchange(true))
    {
        return;
    }
    worker_ = std::thread(&PublishQueue::workerLoop, this);
}

void PublishQueue::stop()
{
    if (!running_.exchange(false))
    {
        return;
    }
    queue_cv_.notify_all();
    if (worker_.joinable())
    {
        worker_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
    busy_ = false;
    idle_cv_.notify_all();
}

void PublishQueue::post(std::string topic, std::string payload)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= capacity_)
        {
            queue_.pop_front(); // 丢弃最旧的消息
            if (dropped_++ == 0)
            {
                logging::get_logger()->warn("[publish] 发布积压，开始丢弃旧消息 ({})", topic);
            }
        }
        queue_.push_back(Message{std::move(topic), std::move(payload)});
    }
    queue_cv_.notify_one();
}

bool PublishQueue::waitIdle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]
                             { return queue_.empty() && !busy_; });
}

std::size_t PublishQueue::depth() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void PublishQueue::workerLoop()
{
    while (true)
    {
        Message message;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queue_cv_.wait(lock, [this]
                           { return !queue_.empty() || !running_.load(); });
            if (!running_.load())
            {
                break;
            }
            message = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        bool ok = false;
        try
        {
            ok = publish_ && publish_(message.topic, message.payload);
        }
        catch (const std::exception &e)
        {
            logging::get_logger()->error("[publish] {} 发布异常: {}", message.topic, e.what());
        }
        if (ok)
        {
            ++published_;
        }
        else
        {
            ++failed_;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }
}
