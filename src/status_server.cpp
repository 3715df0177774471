#include "status_server.hpp"
#include "detection_overlay.hpp"
#include "logger.hpp"

#include <chrono>

#include <opencv2/imgproc.hpp>

StreamPacer::StreamPacer(int fps)
{
    if (fps > 0)
    {
        period_ = std::chrono::duration_cast<SteadyClock::duration>(std::chrono::microseconds(1000000 / fps));
    }
}

StreamPacer::SteadyClock::duration StreamPacer::delayBefore(SteadyClock::time_point now) const
{
    if (!last_sent_ || period_ == SteadyClock::duration::zero())
    {
        return SteadyClock::duration::zero();
    }
    const auto next = *last_sent_ + period_;
    return next > now ? next - now : SteadyClock::duration::zero();
}

StatusServer::StatusServer(const HttpConfig &config, SnapshotRing &snapshots)
    : config_(config), snapshots_(snapshots)
{
}

StatusServer::~StatusServer()
{
    stop();
}

bool StatusServer::start()
{
    if (running_)
    {
        return true;
    }

    http_srv_ = std::make_unique<httplib::Server>();
    setupRoutes();

    if (!http_srv_->bind_to_port(config_.host.c_str(), config_.port))
    {
        logging::get_logger()->error("[http] 无法监听 {}:{}", config_.host, config_.port);
        http_srv_.reset();
        return false;
    }

    running_ = true;
    http_thread_ = std::thread(&StatusServer::runHttp, this);
    logging::get_logger()->info("[http] 状态服务已启动 http://{}:{}/api/status", config_.host, config_.port);
    return true;
}

void StatusServer::stop()
{
    if (!running_.exchange(false))
    {
        return;
    }

    frame_cv_.notify_all();
    if (http_srv_)
    {
        http_srv_->stop();
    }
    if (http_thread_.joinable())
    {
        http_thread_.join();
    }
    http_srv_.reset();
}

void StatusServer::runHttp()
{
    if (!http_srv_->listen_after_bind())
    {
        if (running_)
        {
            logging::get_logger()->error("[http] 服务异常退出");
        }
    }
}

void StatusServer::publishFrame(const cv::Mat &annotated)
{
    if (annotated.empty())
    {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(frame_mutex_);
        annotated.copyTo(latest_frame_);
        ++frame_seq_;
    }
    frame_cv_.notify_all();
}

/**
 * @brief 写出一帧 MJPEG
 * 等待新画面最多 1 秒，没有新画面时发送等待提示图
 */
bool StatusServer::writeMjpegPart(httplib::DataSink &sink, uint64_t &last_seq, StreamPacer &pacer)
{
    cv::Mat frame;
    {
        std::unique_lock<std::mutex> lock(frame_mutex_);

        // 限速等待期间只响应停止
        const auto delay = pacer.delayBefore(std::chrono::steady_clock::now());
        if (delay > std::chrono::steady_clock::duration::zero())
        {
            frame_cv_.wait_for(lock, delay, [this]
                               { return !running_.load(); });
        }
        frame_cv_.wait_for(lock, std::chrono::seconds(1), [&]
                           { return !running_ || frame_seq_ != last_seq; });
        if (!running_)
        {
            return false;
        }
        if (frame_seq_ != last_seq)
        {
            frame = latest_frame_.clone();
            last_seq = frame_seq_;
        }
    }

    if (frame.empty())
    {
        frame = cv::Mat::zeros(480, 640, CV_8UC3);
        cv::putText(frame, "Waiting...", cv::Point(200, 240), cv::FONT_HERSHEY_SIMPLEX, 1.0, cv::Scalar(255, 255, 255), 2);
    }

    std::vector<unsigned char> jpeg = encode_jpeg(frame, config_.jpeg_quality);
    if (jpeg.empty())
    {
        return true;
    }

    const std::string header = "--frame\r\nContent-Type: image/jpeg\r\nContent-Length: " + std::to_string(jpeg.size()) + "\r\n\r\n";
    pacer.markSent(std::chrono::steady_clock::now());
    if (!sink.write(header.data(), header.size()))
    {
        return false;
    }
    if (!sink.write(reinterpret_cast<const char *>(jpeg.data()), jpeg.size()))
    {
        return false;
    }
    return sink.write("\r\n", 2);
}

void StatusServer::setupRoutes()
{
    http_srv_->Get("/api/status", [this](const httplib::Request &, httplib::Response &res)
                   {
        nlohmann::json body = status_provider_ ? status_provider_() : nlohmann::json::object();
        res.set_header("Cache-Control", "no-store");
        res.set_content(body.dump(), "application/json"); });

    http_srv_->Get("/api/mission/smoke_pause_status", [this](const httplib::Request &req, httplib::Response &res)
                   {
        const std::string mission_id = req.has_param("mission_id") ? req.get_param_value("mission_id") : std::string();
        nlohmann::json body = pause_provider_ ? pause_provider_(mission_id) : nlohmann::json::object();
        res.set_content(body.dump(), "application/json"); });

    http_srv_->Post("/api/command", [this](const httplib::Request &req, httplib::Response &res)
                    {
        if (!command_handler_)
        {
            res.status = 503;
            return;
        }
        res.set_content(command_handler_(req.body), "application/json"); });

    http_srv_->Get(R"(/snaps/snap_(\d+)\.jpg)", [this](const httplib::Request &req, httplib::Response &res)
                   {
        res.set_header("Cache-Control", "no-store, no-cache, must-revalidate, max-age=0");
        res.set_header("Pragma", "no-cache");

        std::size_t index = 0;
        try
        {
            index = static_cast<std::size_t>(std::stoul(req.matches[1].str()));
        }
        catch (const std::exception &)
        {
            res.status = 404;
            return;
        }

        auto snap = snapshots_.get(index);
        if (!snap)
        {
            res.status = 404;
            res.set_content("no snapshot", "text/plain");
            return;
        }
        res.set_content(std::string(snap->jpeg->begin(), snap->jpeg->end()), "image/jpeg"); });

    http_srv_->Get("/video_feed", [this](const httplib::Request &, httplib::Response &res)
                   {
        auto last_seq = std::make_shared<uint64_t>(0);
        auto pacer = std::make_shared<StreamPacer>(config_.stream_fps);
        res.set_chunked_content_provider("multipart/x-mixed-replace; boundary=frame",
                                         [this, last_seq, pacer](std::size_t, httplib::DataSink &sink)
                                         { return writeMjpegPart(sink, *last_seq, *pacer); }); });
}
