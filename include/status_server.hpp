#ifndef STATUS_SERVER_HPP
#define STATUS_SERVER_HPP

#include "config.hpp"
#include "snapshot_ring.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>

/**
 * @brief 视频流限速：两次写出之间至少间隔 1/fps 秒
 * fps <= 0 时不限速
 */
class StreamPacer
{
public:
    using SteadyClock = std::chrono::steady_clock;

    explicit StreamPacer(int fps);

    // 距离允许写出下一帧还需等待的时间
    SteadyClock::duration delayBefore(SteadyClock::time_point now) const;
    void markSent(SteadyClock::time_point now) { last_sent_ = now; }

private:
    SteadyClock::duration period_{0};
    std::optional<SteadyClock::time_point> last_sent_;
};

/**
 * @brief HTTP 状态与视频流服务
 *
 * GET  /api/status                      状态 JSON
 * GET  /api/mission/smoke_pause_status  烟雾悬停状态(?mission_id=)
 * POST /api/command                     操作员指令(与 MQTT 指令格式相同)
 * GET  /snaps/snap_<n>.jpg              第 n 张最新明火抓拍(0 为最新)
 * GET  /video_feed                      MJPEG 实时画面(按 stream_fps 限速)
 */
class StatusServer
{
public:
    using StatusProvider = std::function<nlohmann::json()>;
    using PauseStatusProvider = std::function<nlohmann::json(const std::string &mission_id)>;
    using CommandHandler = std::function<std::string(const std::string &body)>;

    StatusServer(const HttpConfig &config, SnapshotRing &snapshots);
    ~StatusServer();

    void setStatusProvider(StatusProvider provider) { status_provider_ = std::move(provider); }
    void setPauseStatusProvider(PauseStatusProvider provider) { pause_provider_ = std::move(provider); }
    void setCommandHandler(CommandHandler handler) { command_handler_ = std::move(handler); }

    bool start();
    void stop();

    // 主循环每帧调用，保存最新的叠加画面
    void publishFrame(const cv::Mat &annotated);

private:
    void setupRoutes();
    void runHttp();
    bool writeMjpegPart(httplib::DataSink &sink, uint64_t &last_seq, StreamPacer &pacer);

    HttpConfig config_;
    SnapshotRing &snapshots_;

    StatusProvider status_provider_;
    PauseStatusProvider pause_provider_;
    CommandHandler command_handler_;

    std::mutex frame_mutex_;
    std::condition_variable frame_cv_;
    cv::Mat latest_frame_;
    uint64_t frame_seq_ = 0;

    std::unique_ptr<httplib::Server> http_srv_;
    std::atomic<bool> running_{false};
    std::thread http_thread_;
};

#endif // STATUS_SERVER_HPP
