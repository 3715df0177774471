#include "alert_dispatcher.hpp"
#include "logger.hpp"

AlertDispatcher::AlertDispatcher(const AlertConfig &config, NotificationTransport &transport)
    : config_(config), transport_(transport)
{
    limiter_.setCooldown(alertChannel(AlertKind::SMOKE_WARNING), config_.smoke_cooldown_sec);
    limiter_.setCooldown(alertChannel(AlertKind::FIRE_CONFIRMED), config_.fire_cooldown_sec);
}

AlertDispatcher::~AlertDispatcher()
{
    stop();
}

void AlertDispatcher::start()
{
    if (running_.exchange(true))
    {
        return;
    }
    worker_ = std::thread(&AlertDispatcher::workerLoop, this);
    logging::get_logger()->info("[alert] 告警线程启动 (队列 {}, 烟雾冷却 {:.0f}s, 明火冷却 {:.0f}s)",
                                config_.queue_capacity, config_.smoke_cooldown_sec, config_.fire_cooldown_sec);
}

void AlertDispatcher::stop()
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
    if (!queue_.empty())
    {
        logging::get_logger()->warn("[alert] 停止时丢弃 {} 条未发送告警", queue_.size());
        queue_.clear();
    }
    busy_ = false;
    idle_cv_.notify_all();
}

bool AlertDispatcher::enqueue(GeoAlert alert)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= config_.queue_capacity)
        {
            ++stats_.overflow;
            logging::get_logger()->warn("[alert] {}: 丢弃 {} 告警 (帧 {})", errorKindToString(ErrorKind::QUEUE_OVERFLOW),
                                        alertKindToString(alert.kind), alert.frame_seq);
            return false;
        }
        queue_.push_back(std::move(alert));
        ++stats_.enqueued;
    }
    queue_cv_.notify_one();
    return true;
}

bool AlertDispatcher::waitIdle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]
                             { return queue_.empty() && !busy_; });
}

DispatcherStats AlertDispatcher::stats() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    DispatcherStats stats = stats_;
    stats.queue_depth = queue_.size();
    return stats;
}

void AlertDispatcher::workerLoop()
{
    while (true)
    {
        GeoAlert alert;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queue_cv_.wait(lock, [this]
                           { return !queue_.empty() || !running_.load(); });
            if (!running_.load())
            {
                break;
            }
            alert = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        process(alert);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }
}

void AlertDispatcher::process(const GeoAlert &alert)
{
    auto logger = logging::get_logger();
    const std::string channel = alertChannel(alert.kind);

    if (alert.max_confidence < config_.min_confidence)
    {
        logger->debug("[alert] {} 置信度 {:.2f} 低于 {:.2f}，丢弃", channel, alert.max_confidence, config_.min_confidence);
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.low_confidence;
        return;
    }

    // 冷却以告警创建时间计算
    if (!limiter_.allow(channel, alert.created_at))
    {
        logger->debug("[alert] {} 冷却中({:.0f}s)，丢弃帧 {} 的告警", channel, limiter_.cooldown(channel), alert.frame_seq);
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.suppressed;
        return;
    }

    if (deliver(alert))
    {
        limiter_.record(channel, alert.created_at);
        logger->info("[alert] {} 告警已发送 (置信度 {:.2f}, {} 个框, 帧 {})", channel, alert.max_confidence, alert.box_count, alert.frame_seq);
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.sent;
    }
    else
    {
        logger->error("[alert] {}: {} 告警重试 {} 次后放弃", errorKindToString(ErrorKind::ALERT_DELIVERY_FAILURE), channel, config_.retries);
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.failed;
    }
}

/**
 * @brief 发送一条告警，失败按指数退避重试
 * @return 任一次发送成功返回 true；重试耗尽或停止时返回 false
 */
bool AlertDispatcher::deliver(const GeoAlert &alert)
{
    auto logger = logging::get_logger();
    const std::string channel = alertChannel(alert.kind);
    std::chrono::milliseconds delay(config_.backoff_ms);

    for (int attempt = 0; attempt <= config_.retries; ++attempt)
    {
        if (attempt > 0)
        {
            if (!sleepBackoff(delay))
            {
                return false;
            }
            delay *= 2;
        }

        try
        {
            if (transport_.send(channel, alert.caption, alert.jpeg, alert.geo_link))
            {
                return true;
            }
        }
        catch (const std::exception &e)
        {
            logger->error("[alert] 发送异常: {}", e.what());
        }
        logger->warn("[alert] {} 告警发送失败 ({}/{})", channel, attempt + 1, config_.retries + 1);
    }
    return false;
}

bool AlertDispatcher::sleepBackoff(std::chrono::milliseconds delay)
{
    std::unique_lock<std::mutex> lock(mutex_);
    queue_cv_.wait_for(lock, delay, [this]
                       { return !running_.load(); });
    return running_.load();
}
