#ifndef ALERT_DISPATCHER_HPP
#define ALERT_DISPATCHER_HPP

#include "config.hpp"
#include "geo_alert.hpp"
#include "notification_transport.hpp"
#include "rate_limiter.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>

// 告警发送统计
struct DispatcherStats
{
    uint64_t enqueued = 0;
    uint64_t sent = 0;
    uint64_t suppressed = 0;     // 冷却期内被限流
    uint64_t low_confidence = 0; // 低于最小置信度
    uint64_t failed = 0;         // 重试耗尽
    uint64_t overflow = 0;       // 队列满被丢弃
    std::size_t queue_depth = 0;
};

/**
 * @brief 告警分发器
 *
 * 检测线程只调用 enqueue(不阻塞)，发送、限流和重试全部在独立工作线程中完成。
 * 队列满时丢弃新告警；同一通道按入队顺序发送。
 */
class AlertDispatcher
{
public:
    AlertDispatcher(const AlertConfig &config, NotificationTransport &transport);
    ~AlertDispatcher();

    void start();
    void stop(); // 打断退避等待，丢弃未发送告警

    // 非阻塞入队，队列满时返回 false
    bool enqueue(GeoAlert alert);

    // 等待队列清空且没有正在发送的告警
    bool waitIdle(std::chrono::milliseconds timeout);

    DispatcherStats stats() const;

private:
    void workerLoop();
    void process(const GeoAlert &alert);
    bool deliver(const GeoAlert &alert);
    bool sleepBackoff(std::chrono::milliseconds delay);

    AlertConfig config_;
    NotificationTransport &transport_;
    RateLimiter limiter_; // 只在工作线程访问

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<GeoAlert> queue_;
    bool busy_ = false;
    DispatcherStats stats_;

    std::atomic<bool> running_{false};
    std::thread worker_;
};

#endif // ALERT_DISPATCHER_HPP
