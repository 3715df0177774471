#ifndef PUBLISH_QUEUE_HPP
#define PUBLISH_QUEUE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

/**
 * @brief 状态消息发布队列
 *
 * 主循环和状态机只调用 post(不阻塞)，由独立线程调用发布函数。
 * 队列满时丢弃最旧的消息，代理无响应时积压不会超过容量。
 */
class PublishQueue
{
public:
    using PublishFn = std::function<bool(const std::string &topic, const std::string &payload)>;

    PublishQueue(std::size_t capacity, PublishFn publish);
    ~PublishQueue();

    void start();
    void stop(); // 丢弃未发布的消息

    void post(std::string topic, std::string payload);

    // 等待队列清空且没有正在发布的消息
    bool waitIdle(std::chrono::milliseconds timeout);

    uint64_t published() const { return published_.load(); }
    uint64_t failed() const { return failed_.load(); }
    uint64_t dropped() const { return dropped_.load(); }
    std::size_t depth() const;

private:
    struct Message
    {
        std::string topic;
        std::string payload;
    };

    void workerLoop();

    std::size_t capacity_;
    PublishFn publish_;

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<Message> queue_;
    bool busy_ = false;

    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> dropped_{0};

    std::atomic<bool> running_{false};
    std::thread worker_;
};

#endif // PUBLISH_QUEUE_HPP
