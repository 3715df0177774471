#ifndef FIREWATCH_APP_HPP
#define FIREWATCH_APP_HPP

#include "alert_dispatcher.hpp"
#include "config.hpp"
#include "detection_aggregator.hpp"
#include "frame_source.hpp"
#include "inference_session.hpp"
#include "mavsdk_autopilot_link.hpp"
#include "mavsdk_members.hpp"
#include "mission_api.hpp"
#include "mission_controller.hpp"
#include "mission_store.hpp"
#include "mqtt_notification_transport.hpp"
#include "operator_commands.hpp"
#include "publish_queue.hpp"
#include "snapshot_ring.hpp"
#include "stage_scheduler.hpp"
#include "status_report.hpp"
#include "status_server.hpp"
#include "telemetry_fusion.hpp"
#include "telemetry_monitor.hpp"

#include <atomic>
#include <memory>
#include <optional>

#include <mavsdk/mavsdk.h>

/**
 * @brief 程序主体：创建并连接所有模块，运行采集-检测主循环
 */
class FirewatchApp
{
public:
    explicit FirewatchApp(const AppConfig &config);
    ~FirewatchApp();

    // 初始化失败返回非零退出码
    int run();
    void requestStop() { running_ = false; }

private:
    bool initMqtt();
    bool connectAutopilot();
    bool initMission();
    bool initDetection();
    void initAlerts();
    void initStatusServer();
    void importPlanFile();

    void mainLoop();
    void shutdown();

    void onDetectionEvent(const DetectionEvent &event);
    void onFireHit(const Frame &frame, const std::vector<Detection> &fire);
    StatusInputs collectStatus() const;
    void reportStatus();
    void publish(const std::string &suffix, std::string payload); // 非阻塞，经发布队列发送

    AppConfig config_;
    std::atomic<bool> running_{true};

    // 飞控
    std::unique_ptr<mavsdk::Mavsdk> drone_sdk_;
    std::optional<mavsdk::Telemetry> telemetry_;
    std::optional<mavsdk::Mission> mission_;
    std::optional<mavsdk::Action> action_;
    std::unique_ptr<Mavsdk_members> mavsdk_;
    std::unique_ptr<TelemetryMonitor> telemetry_monitor_;
    std::unique_ptr<MavsdkAutopilotLink> link_;

    // 任务
    std::unique_ptr<MissionStore> store_;
    std::unique_ptr<MissionController> controller_;
    std::unique_ptr<MissionApi> api_;
    std::unique_ptr<OperatorCommandHandler> commands_;

    // 检测
    std::unique_ptr<DetectionAggregator> aggregator_;
    std::unique_ptr<InferenceSession> stage1_;
    std::unique_ptr<InferenceSession> stage2_;
    std::unique_ptr<StageScheduler> scheduler_;
    std::unique_ptr<VideoCaptureSource> source_;

    // 告警与状态
    std::unique_ptr<TelemetryFusion> fusion_;
    std::unique_ptr<MqttNotificationTransport> transport_;
    std::unique_ptr<AlertDispatcher> dispatcher_;
    std::unique_ptr<SnapshotRing> snapshots_;
    std::unique_ptr<StatusServer> server_;
    std::unique_ptr<PublishQueue> publisher_;
};

#endif // FIREWATCH_APP_HPP
