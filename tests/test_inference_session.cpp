#include "fakes.hpp"
#include "inference_session.hpp"

#include <gtest/gtest.h>

#include <future>

using namespace std::chrono_literals;

TEST(InferenceSession, ReturnsBackendResult)
{
    auto backend = std::make_unique<FakeBackend>();
    FakeBackend *fake = backend.get();
    fake->push(make_result({make_detection(DetectionClass::SMOKE, 0.7f, cv::Rect(0, 0, 10, 10))}));

    InferenceSession session(StageId::STAGE1_SMOKE, std::move(backend), 500ms);
    ASSERT_TRUE(session.start());

    InferenceResult r = session.infer(cv::Mat::zeros(48, 64, CV_8UC3));
    EXPECT_EQ(r.status, InferenceStatus::OK);
    ASSERT_EQ(r.detections.size(), 1u);
    EXPECT_FLOAT_EQ(r.detections[0].confidence, 0.7f);
    EXPECT_EQ(fake->calls.load(), 1);
}

TEST(InferenceSession, SlowBackendTimesOut)
{
    auto backend = std::make_unique<FakeBackend>();
    backend->delay = 200ms;
    InferenceSession session(StageId::STAGE1_SMOKE, std::move(backend), 50ms);
    ASSERT_TRUE(session.start());

    InferenceResult r = session.infer(cv::Mat::zeros(48, 64, CV_8UC3));
    EXPECT_EQ(r.status, InferenceStatus::TIMEOUT);

    // 上一个请求仍在执行，新的调用不会阻塞
    EXPECT_TRUE(session.busy());
    EXPECT_EQ(session.infer(cv::Mat::zeros(48, 64, CV_8UC3)).status, InferenceStatus::TIMEOUT);

    EXPECT_TRUE(session.waitIdle(1s));
    EXPECT_FALSE(session.busy());
}

TEST(InferenceSession, SubmitIsRejectedWhileBusy)
{
    auto backend = std::make_unique<FakeBackend>();
    backend->delay = 100ms;
    InferenceSession session(StageId::STAGE2_FIRE, std::move(backend), 1s);
    ASSERT_TRUE(session.start());

    std::promise<InferenceStatus> done;
    auto future = done.get_future();
    ASSERT_TRUE(session.submit(cv::Mat::zeros(8, 8, CV_8UC3), [&done](const InferenceResult &r)
                               { done.set_value(r.status); }));
    EXPECT_FALSE(session.submit(cv::Mat::zeros(8, 8, CV_8UC3), nullptr));

    ASSERT_EQ(future.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(future.get(), InferenceStatus::OK);
    EXPECT_TRUE(session.waitIdle(1s));
}

TEST(InferenceSession, HardwareFaultSuspendsSession)
{
    auto backend = std::make_unique<FakeBackend>();
    backend->push(make_result({}, InferenceStatus::HARDWARE_FAULT));
    InferenceSession session(StageId::STAGE2_FIRE, std::move(backend), 500ms);
    ASSERT_TRUE(session.start());

    EXPECT_EQ(session.infer(cv::Mat::zeros(8, 8, CV_8UC3)).status, InferenceStatus::HARDWARE_FAULT);
    EXPECT_TRUE(session.faulted());

    EXPECT_FALSE(session.submit(cv::Mat::zeros(8, 8, CV_8UC3), nullptr));
    EXPECT_EQ(session.infer(cv::Mat::zeros(8, 8, CV_8UC3)).status, InferenceStatus::HARDWARE_FAULT);
}

TEST(InferenceSession, LoadFailureMarksFault)
{
    InferenceSession session(StageId::STAGE1_SMOKE, std::make_unique<FakeBackend>(false), 100ms);
    EXPECT_FALSE(session.start());
    EXPECT_TRUE(session.faulted());
    EXPECT_FALSE(session.running());
}
