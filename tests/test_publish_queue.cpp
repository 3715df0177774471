#include "alert_dispatcher.hpp"
#include "fakes.hpp"
#include "publish_queue.hpp"
#include "stage_scheduler.hpp"

#include <gtest/gtest.h>

#include <condition_variable>

using namespace std::chrono_literals;

namespace
{
// 代理不应答：发布调用一直阻塞到 release()
class HungBroker
{
public:
    bool publish(const std::string &, const std::string &payload)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        payloads_.push_back(payload);
        cv_.notify_all();
        cv_.wait(lock, [this]
                 { return released_; });
        return true;
    }

    PublishQueue::PublishFn fn()
    {
        return [this](const std::string &topic, const std::string &payload)
        { return publish(topic, payload); };
    }

    void release()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

    bool waitCalls(std::size_t n, std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]
                            { return payloads_.size() >= n; });
    }

    std::vector<std::string> payloads()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return payloads_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool released_ = false;
    std::vector<std::string> payloads_;
};

// 发送一直阻塞到 release() 的告警通道
class HungTransport : public NotificationTransport
{
public:
    bool send(const std::string &, const std::string &, const std::vector<unsigned char> &, const std::optional<std::string> &) override
    {
        std::unique_lock<std::mutex> lock(mutex_);
        ++calls_;
        cv_.notify_all();
        cv_.wait(lock, [this]
                 { return released_; });
        return true;
    }

    void release()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        cv_.notify_all();
    }

    bool waitCalls(int n, std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]
                            { return calls_ >= n; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool released_ = false;
    int calls_ = 0;
};

Frame make_frame(uint64_t seq)
{
    Frame f;
    f.image = cv::Mat::zeros(240, 320, CV_8UC3);
    f.seq = seq;
    f.timestamp = TimePoint(std::chrono::milliseconds(1000 + static_cast<int64_t>(seq) * 66));
    return f;
}
} // namespace

TEST(PublishQueue, PostReturnsImmediatelyWhileBrokerHangs)
{
    HungBroker broker;
    PublishQueue queue(4, broker.fn());
    queue.start();

    queue.post("firewatch/status", "0");
    EXPECT_TRUE(broker.waitCalls(1, 1s));

    const auto start = std::chrono::steady_clock::now();
    for (int i = 1; i <= 20; ++i)
    {
        queue.post("firewatch/status", std::to_string(i));
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 100ms);

    // 积压不超过容量，旧消息被丢弃
    EXPECT_EQ(queue.depth(), 4u);
    EXPECT_EQ(queue.dropped(), 16u);

    broker.release();
    EXPECT_TRUE(queue.waitIdle(1s));
    const std::vector<std::string> expected{"0", "17", "18", "19", "20"};
    EXPECT_EQ(broker.payloads(), expected);
    EXPECT_EQ(queue.published(), 5u);
    queue.stop();
}

TEST(PublishQueue, FailedPublishIsCounted)
{
    PublishQueue queue(4, [](const std::string &, const std::string &)
                       { return false; });
    queue.start();
    queue.post("firewatch/status", "{}");
    EXPECT_TRUE(queue.waitIdle(1s));
    EXPECT_EQ(queue.failed(), 1u);
    EXPECT_EQ(queue.published(), 0u);
}

// 主循环的状态发布和告警入队都不等待代理，逐帧检测保持节奏
TEST(PublishQueue, FrameLoopKeepsCadenceWhileDeliveryHangs)
{
    HungBroker broker;
    PublishQueue queue(4, broker.fn());
    queue.start();

    HungTransport transport;
    AlertConfig alert_cfg;
    alert_cfg.smoke_cooldown_sec = 0.0;
    AlertDispatcher dispatcher(alert_cfg, transport);
    dispatcher.start();

    DetectionConfig cfg;
    DetectionAggregator aggregator(make_aggregator_config(cfg));
    auto b1 = std::make_unique<FakeBackend>();
    FakeBackend *smoke = b1.get();
    InferenceSession stage1(StageId::STAGE1_SMOKE, std::move(b1), 500ms);
    InferenceSession stage2(StageId::STAGE2_FIRE, std::make_unique<FakeBackend>(), 500ms);
    ASSERT_TRUE(stage1.start());
    ASSERT_TRUE(stage2.start());
    StageScheduler scheduler(cfg, stage1, stage2, aggregator);

    // 先让发布线程和告警线程都卡在代理上
    queue.post("firewatch/status", "0");
    GeoAlert first;
    first.kind = AlertKind::SMOKE_WARNING;
    first.max_confidence = 0.9f;
    dispatcher.enqueue(first);
    EXPECT_TRUE(broker.waitCalls(1, 1s));
    EXPECT_TRUE(transport.waitCalls(1, 1s));

    const auto start = std::chrono::steady_clock::now();
    for (uint64_t seq = 1; seq <= 30; ++seq)
    {
        scheduler.processFrame(make_frame(seq), false);
        queue.post("firewatch/status", std::to_string(seq));
        GeoAlert alert;
        alert.kind = AlertKind::SMOKE_WARNING;
        alert.max_confidence = 0.9f;
        alert.frame_seq = seq;
        dispatcher.enqueue(std::move(alert));
    }
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, 1s);
    EXPECT_EQ(smoke->calls.load(), 30);

    broker.release();
    transport.release();
    EXPECT_TRUE(queue.waitIdle(1s));
    EXPECT_EQ(broker.payloads().back(), "30");
    dispatcher.stop();
    queue.stop();
    stage1.stop();
    stage2.stop();
}
