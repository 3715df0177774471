#include "inference_session.hpp"
#include "logger.hpp"

#include <future>

InferenceSession::InferenceSession(StageId stage, std::unique_ptr<InferenceBackend> backend, std::chrono::milliseconds timeout)
    : stage_(stage), backend_(std::move(backend)), timeout_(timeout)
{
}

InferenceSession::~InferenceSession()
{
    stop();
}

bool InferenceSession::start()
{
    auto logger = logging::get_logger();
    if (running_.load())
    {
        return true;
    }

    if (!backend_ || !backend_->load())
    {
        faulted_ = true;
        logger->critical("[{}] 推理后端加载失败，阶段已停用 ({})", stageToString(stage_), errorKindToString(ErrorKind::INFERENCE_HARDWARE_FAULT));
        return false;
    }

    running_ = true;
    worker_ = std::thread(&InferenceSession::workerLoop, this);
    logger->info("[{}] 推理会话已启动: {} (timeout={}ms)", stageToString(stage_), backend_->name(), timeout_.count());
    return true;
}

void InferenceSession::stop()
{
    if (running_.exchange(false))
    {
        request_cv_.notify_all();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }
}

bool InferenceSession::submit(const cv::Mat &image, ResultCallback on_done)
{
    if (!running_.load() || faulted_.load())
    {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_ || in_flight_)
        {
            return false;
        }
        pending_ = Request{image, std::move(on_done), std::chrono::steady_clock::now()};
    }
    request_cv_.notify_one();
    return true;
}

InferenceResult InferenceSession::infer(const cv::Mat &image)
{
    auto promise = std::make_shared<std::promise<InferenceResult>>();
    std::future<InferenceResult> future = promise->get_future();

    const auto deadline = std::chrono::steady_clock::now() + timeout_;

    // 上一次同步调用的回调返回后工作线程才清除执行标志，在超时预算内等待其空闲
    if (busy() && !faulted_.load())
    {
        waitIdle(timeout_);
    }

    InferenceResult result;
    if (!submit(image, [promise](const InferenceResult &r)
                { promise->set_value(r); }))
    {
        // 上一个超时请求仍在执行时同样按超时处理
        result.status = faulted_.load() ? InferenceStatus::HARDWARE_FAULT : InferenceStatus::TIMEOUT;
        return result;
    }

    if (future.wait_until(deadline) != std::future_status::ready)
    {
        result.status = InferenceStatus::TIMEOUT;
        return result;
    }
    return future.get();
}

bool InferenceSession::busy() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.has_value() || in_flight_;
}

bool InferenceSession::waitIdle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]
                             { return !pending_ && !in_flight_; });
}

void InferenceSession::workerLoop()
{
    auto logger = logging::get_logger();

    while (true)
    {
        Request request;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            request_cv_.wait(lock, [this]
                             { return pending_.has_value() || !running_.load(); });
            if (!running_.load())
            {
                pending_.reset();
                break;
            }
            request = std::move(*pending_);
            pending_.reset();
            in_flight_ = true;
        }

        InferenceResult result;
        try
        {
            result = backend_->infer(request.image);
        }
        catch (const std::exception &e)
        {
            logger->error("[{}] 推理后端异常: {}", stageToString(stage_), e.what());
            result.status = InferenceStatus::HARDWARE_FAULT;
            result.detections.clear();
        }

        if (result.status == InferenceStatus::HARDWARE_FAULT && !faulted_.exchange(true))
        {
            logger->critical("[{}] {}，阶段已停用", stageToString(stage_), errorKindToString(ErrorKind::INFERENCE_HARDWARE_FAULT));
        }

        auto elapsed = std::chrono::steady_clock::now() - request.submitted;
        if (result.status == InferenceStatus::OK && elapsed > timeout_)
        {
            result.status = InferenceStatus::TIMEOUT;
            result.detections.clear();
        }

        if (request.on_done)
        {
            try
            {
                request.on_done(result);
            }
            catch (const std::exception &e)
            {
                logger->error("[{}] 结果回调异常: {}", stageToString(stage_), e.what());
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_ = false;
        }
        idle_cv_.notify_all();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_ = false;
    }
    idle_cv_.notify_all();
}
