#ifndef INFERENCE_SESSION_HPP
#define INFERENCE_SESSION_HPP

#include "inference_backend.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

/**
 * @brief 单个推理阶段的独立执行上下文
 *
 * 会话独占一个后端实例和一个工作线程，请求通道只有一个槽位：
 * 已有请求在排队或执行时新的提交直接被拒绝，调用方不会被阻塞。
 * 后端返回硬件故障后会话进入故障状态，不再接受请求。
 */
class InferenceSession
{
public:
    using ResultCallback = std::function<void(const InferenceResult &)>;

    InferenceSession(StageId stage, std::unique_ptr<InferenceBackend> backend, std::chrono::milliseconds timeout);
    ~InferenceSession();

    bool start(); // 加载模型并启动工作线程，加载失败时会话直接进入故障状态
    void stop();

    /**
     * @brief 非阻塞提交
     * @param image 输入图像，调用方提交后不得再原地修改
     * @param on_done 结果回调，在会话工作线程中执行；执行时间超过超时时间的结果以 TIMEOUT 返回
     * @return 会话忙、故障或未启动时返回 false
     */
    bool submit(const cv::Mat &image, ResultCallback on_done);

    // 同步推理，最多等待超时时间
    InferenceResult infer(const cv::Mat &image);

    bool busy() const;
    bool faulted() const { return faulted_.load(); }
    bool running() const { return running_.load(); }
    StageId stage() const { return stage_; }

    // 等待会话空闲(测试和退出时使用)
    bool waitIdle(std::chrono::milliseconds timeout);

private:
    struct Request
    {
        cv::Mat image;
        ResultCallback on_done;
        std::chrono::steady_clock::time_point submitted;
    };

    void workerLoop();

    StageId stage_;
    std::unique_ptr<InferenceBackend> backend_;
    std::chrono::milliseconds timeout_;

    mutable std::mutex mutex_;
    std::condition_variable request_cv_;
    std::condition_variable idle_cv_;
    std::optional<Request> pending_; // 单槽请求通道
    bool in_flight_ = false;         // 工作线程正在执行

    std::atomic<bool> running_{false};
    std::atomic<bool> faulted_{false};
    std::thread worker_;
};

#endif // INFERENCE_SESSION_HPP
