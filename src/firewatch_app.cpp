#include "firewatch_app.hpp"
#include "detection_overlay.hpp"
#include "logger.hpp"
#include "yolo_dnn_backend.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

using namespace mavsdk;

FirewatchApp::FirewatchApp(const AppConfig &config) : config_(config)
{
}

FirewatchApp::~FirewatchApp()
{
    shutdown();
}

/*::::::::::::::::::::::::::::::::::::::::::::::::::::::::: MQTT 初始化与启动 ::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::*/

bool FirewatchApp::initMqtt()
{
    // 状态、迁移和指令回复经队列发布，主循环和 MQTT 回调线程不等待代理
    publisher_ = std::make_unique<PublishQueue>(config_.mqtt.publish_queue, [](const std::string &topic, const std::string &payload)
                                                { return mqtt_client::Instance()->sendMessage(topic, payload); });
    publisher_->start();

    if (!config_.mqtt.enabled)
    {
        logging::get_logger()->info("[mqtt] 已在配置中关闭");
        return false;
    }

    // 连接失败不影响检测，告警发送会记录失败
    return mqtt_client::Instance()->init(config_.mqtt);
}

/*::::::::::::::::::::::::::::::::::::::::::::::::::::::::: 飞控连接 ::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::*/

bool FirewatchApp::connectAutopilot()
{
    auto logger = logging::get_logger();

    // 创建MAVSDK实例并配置为地面站类型
    drone_sdk_ = std::make_unique<Mavsdk>(Mavsdk::Configuration{ComponentType::GroundStation});

    ConnectionResult connection_result = drone_sdk_->add_any_connection(config_.mission.connection_url);
    if (connection_result != ConnectionResult::Success)
    {
        logger->error("[mavsdk] 建立连接失败 {}: {}", config_.mission.connection_url, static_cast<int>(connection_result));
        return false;
    }

    // 等待自动飞行器系统出现
    auto system = drone_sdk_->first_autopilot(config_.mission.connect_timeout_sec);
    if (!system)
    {
        logger->error("[mavsdk] 无人机连接等待超时({:.0f}s)", config_.mission.connect_timeout_sec);
        mqtt_client::Instance()->sendMessage(mqtt_client::Instance()->topic("reply"), "无人机连接等待超时");
        return false;
    }

    auto &system_ref = system.value();
    telemetry_.emplace(system_ref);
    mission_.emplace(system_ref);
    action_.emplace(system_ref);

    // 整合MAVSDK功能模块，在整个程序中传递
    mavsdk_ = std::make_unique<Mavsdk_members>(system_ref, telemetry_.value(), mission_.value(), action_.value());
    telemetry_monitor_ = std::make_unique<TelemetryMonitor>(mavsdk_->telemetry);
    link_ = std::make_unique<MavsdkAutopilotLink>(*mavsdk_, *telemetry_monitor_);

    logger->info("[mavsdk] 无人机连接成功 ({})", config_.mission.connection_url);
    mqtt_client::Instance()->sendMessage(mqtt_client::Instance()->topic("reply"), "无人机连接成功");
    return true;
}

/*::::::::::::::::::::::::::::::::::::::::::::::::::::::::: 任务模块 ::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::*/

bool FirewatchApp::initMission()
{
    store_ = std::make_unique<MissionStore>(config_.mission.store_path);
    if (!store_->load())
    {
        return false;
    }

    MissionControllerConfig mc;
    mc.ack_timeout = std::chrono::milliseconds(config_.mission.ack_timeout_ms);
    mc.command_retries = config_.mission.command_retries;
    mc.hold_timeout_sec = config_.mission.hold_timeout_sec;
    mc.hold_smoke_policy = parse_hold_smoke_policy(config_.mission.hold_smoke_policy);

    controller_ = std::make_unique<MissionController>(*link_, mc);
    api_ = std::make_unique<MissionApi>(*store_, *controller_, *link_);
    commands_ = std::make_unique<OperatorCommandHandler>(*api_, config_.mission.default_speed_m_s, config_.mission.default_altitude_m);

    controller_->addListener([this](MissionState from, MissionState to, const std::string &reason)
                             {
        const std::string text = MissionController::missionStateToString(from) + " -> " +
                                 MissionController::missionStateToString(to) + " (" + reason + ")";
        publish("mission", text); });

    controller_->start();

    // 操作员指令
    mqtt_client::Instance()->subscribeTopic(mqtt_client::Instance()->topic("cmd"), [this](const std::vector<unsigned char> &payload)
                                            {
        publish("reply", commands_->handlePayload(payload)); });

    importPlanFile();
    return true;
}

// 启动时导入配置中的 QGC 航线文件
void FirewatchApp::importPlanFile()
{
    if (config_.mission.plan_file.empty())
    {
        return;
    }

    ApiResult result = api_->createMissionFromPlan("", config_.mission.plan_file, config_.mission.default_speed_m_s, config_.mission.default_altitude_m);
    if (result.ok)
    {
        logging::get_logger()->info("[mission] 已导入航线 {} -> {}", config_.mission.plan_file, result.data.value("id", ""));
    }
    else
    {
        logging::get_logger()->warn("[mission] 导入航线失败: {}", result.message);
    }
}

/*::::::::::::::::::::::::::::::::::::::::::::::::::::::::: 检测模块 ::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::*/

bool FirewatchApp::initDetection()
{
    auto logger = logging::get_logger();
    const DetectionConfig &dc = config_.detection;

    aggregator_ = std::make_unique<DetectionAggregator>(make_aggregator_config(dc));

    stage1_ = std::make_unique<InferenceSession>(StageId::STAGE1_SMOKE,
                                                 std::make_unique<YoloDnnBackend>(dc.stage1, DetectionClass::SMOKE),
                                                 std::chrono::milliseconds(dc.stage1.timeout_ms));
    stage2_ = std::make_unique<InferenceSession>(StageId::STAGE2_FIRE,
                                                 std::make_unique<YoloDnnBackend>(dc.stage2, DetectionClass::FIRE),
                                                 std::chrono::milliseconds(dc.stage2.timeout_ms));

    if (!stage1_->start())
    {
        logger->critical("烟雾模型加载失败: {}", dc.stage1.model_path);
        return false;
    }
    if (!stage2_->start())
    {
        aggregator_->markStageFault(StageId::STAGE2_FIRE);
        logger->error("明火模型加载失败: {}，仅运行烟雾检测", dc.stage2.model_path);
    }

    scheduler_ = std::make_unique<StageScheduler>(dc, *stage1_, *stage2_, *aggregator_);
    scheduler_->setEventSink([this](const DetectionEvent &event)
                             { onDetectionEvent(event); });
    scheduler_->setFireHitSink([this](const Frame &frame, const std::vector<Detection> &fire)
                               { onFireHit(frame, fire); });

    source_ = std::make_unique<VideoCaptureSource>(config_.video);
    if (!source_->start())
    {
        logger->critical("视频源打开失败: {}", config_.video.source);
        return false;
    }
    return true;
}

/*::::::::::::::::::::::::::::::::::::::::::::::::::::::::: 告警与状态 ::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::*/

void FirewatchApp::initAlerts()
{
    snapshots_ = std::make_unique<SnapshotRing>(static_cast<std::size_t>(config_.http.snapshot_slots));

    TelemetryProvider provider = [this]() -> std::optional<TelemetrySample>
    {
        return link_ ? link_->latestTelemetry() : std::nullopt;
    };
    fusion_ = std::make_unique<TelemetryFusion>(config_.fusion, provider);

    transport_ = std::make_unique<MqttNotificationTransport>(*mqtt_client::Instance(), std::chrono::milliseconds(config_.alerts.send_timeout_ms));
    dispatcher_ = std::make_unique<AlertDispatcher>(config_.alerts, *transport_);
    if (config_.alerts.enabled)
    {
        dispatcher_->start();
    }
}

void FirewatchApp::initStatusServer()
{
    if (!config_.http.enabled)
    {
        return;
    }

    server_ = std::make_unique<StatusServer>(config_.http, *snapshots_);
    server_->setStatusProvider([this]()
                               { return build_status_json(collectStatus()); });
    server_->setPauseStatusProvider([this](const std::string &mission_id)
                                    { return nlohmann::json(api_->getSmokePauseStatus(mission_id)); });
    server_->setCommandHandler([this](const std::string &body)
                               { return commands_->handlePayload(body); });

    if (!server_->start())
    {
        server_.reset(); // 状态页不可用不影响检测
    }
}

/**
 * @brief 检测边沿处理
 * 烟雾事件来自主循环线程，明火事件来自第二阶段工作线程
 */
void FirewatchApp::onDetectionEvent(const DetectionEvent &event)
{
    auto logger = logging::get_logger();
    GeoAlert alert = fusion_->fuse(event);
    aggregator_->setTelemetryStale(!alert.telemetry.has_value());

    if (event.kind == DetectionClass::SMOKE)
    {
        MissionEvent mission_event;
        mission_event.type = MissionEventType::SMOKE_RISING_EDGE;
        mission_event.timestamp = event.frame.timestamp;
        controller_->post(std::move(mission_event));
    }
    else
    {
        logger->warn("明火确认: conf={:.2f}, boxes={}", alert.max_confidence, alert.box_count);
    }

    if (!config_.alerts.enabled)
    {
        return;
    }

    const TimePoint created_at = alert.created_at;
    if (dispatcher_->enqueue(std::move(alert)))
    {
        aggregator_->markAlertQueued(event.kind, created_at);
    }
}

// 第二阶段每次命中明火都刷新抓拍，在第二阶段工作线程中执行
void FirewatchApp::onFireHit(const Frame &frame, const std::vector<Detection> &fire)
{
    float max_conf = 0.0f;
    for (const auto &d : fire)
    {
        max_conf = std::max(max_conf, d.confidence);
    }

    const std::string banner = "FIRE " + std::to_string(static_cast<int>(max_conf * 100.0f)) + "%";
    std::vector<unsigned char> jpeg = encode_jpeg(render_alert_image(frame.image, fire, banner, COLOR_FIRE), config_.fusion.jpeg_quality);
    if (jpeg.empty())
    {
        logging::get_logger()->warn("明火抓拍编码失败 (帧 {})", frame.seq);
        return;
    }

    snapshots_->push(std::move(jpeg), frame.timestamp, frame.seq);
    aggregator_->markFireSnapshot(frame.timestamp);
    logging::get_logger()->debug("明火抓拍已更新 (帧 {}, conf={:.2f})", frame.seq, max_conf);
}

StatusInputs FirewatchApp::collectStatus() const
{
    StatusInputs in;
    in.detection = aggregator_->snapshot();
    in.fps = scheduler_->fps();
    in.stage2_invocations = scheduler_->stage2Invocations();
    in.mission_state = controller_->state();
    in.mission_id = controller_->activeMissionId();
    in.link_connected = link_->isConnected();
    in.link_fault = controller_->linkFault();
    in.mission_error = controller_->lastError();
    in.telemetry = link_->latestTelemetry();
    in.alerts = dispatcher_->stats();
    in.snapshots = snapshots_->size();
    in.now = Clock::now();
    return in;
}

void FirewatchApp::reportStatus()
{
    aggregator_->setTelemetryStale(!fusion_->freshTelemetry(Clock::now()).has_value());

    StatusInputs in = collectStatus();
    logging::get_logger()->info("[status] {}", build_status_line(in));
    publish("status", build_status_json(in).dump());
}

void FirewatchApp::publish(const std::string &suffix, std::string payload)
{
    if (publisher_ && config_.mqtt.enabled)
    {
        publisher_->post(mqtt_client::Instance()->topic(suffix), std::move(payload));
    }
}

/*::::::::::::::::::::::::::::::::::::::::::::::::::::::::: 主循环 ::::::::::::::::::::::::::::::::::::::::::::::::::::::::::::*/

void FirewatchApp::mainLoop()
{
    const auto frame_period = std::chrono::microseconds(1000000 / std::max(1, config_.video.target_fps));
    auto lastWriteTime = std::chrono::steady_clock::now();

    while (running_)
    {
        const auto start = std::chrono::steady_clock::now();

        std::optional<Frame> frame = source_->nextFrame(std::chrono::milliseconds(1000));
        if (frame)
        {
            TickResult tick = scheduler_->processFrame(*frame, server_ != nullptr);
            if (server_)
            {
                server_->publishFrame(tick.annotated);
            }
        }

        // 状态(每秒一次)
        if (std::chrono::steady_clock::now() - lastWriteTime >= std::chrono::seconds(1))
        {
            reportStatus();
            lastWriteTime = std::chrono::steady_clock::now();
        }

        // 限制帧率
        const auto elapsed = std::chrono::steady_clock::now() - start;
        if (frame && elapsed < frame_period)
        {
            std::this_thread::sleep_for(frame_period - elapsed);
        }
    }
}

int FirewatchApp::run()
{
    auto logger = logging::get_logger();
    logger->info("firewatch 启动: source={}, connection={}", config_.video.source, config_.mission.connection_url);

    initMqtt();

    if (!connectAutopilot())
    {
        return 1;
    }
    if (!initMission())
    {
        return 1;
    }
    initAlerts();
    if (!initDetection())
    {
        return 1;
    }
    initStatusServer();

    mainLoop();

    logger->info("firewatch 正在退出");
    shutdown();
    return 0;
}

// 按依赖反序停止各线程
void FirewatchApp::shutdown()
{
    if (source_)
    {
        source_->stop();
    }
    if (server_)
    {
        server_->stop();
    }
    if (stage1_)
    {
        stage1_->stop();
    }
    if (stage2_)
    {
        stage2_->stop();
    }
    if (dispatcher_)
    {
        dispatcher_->stop();
    }
    if (controller_)
    {
        controller_->stop();
    }
    if (publisher_)
    {
        publisher_->stop();
    }
    if (config_.mqtt.enabled)
    {
        mqtt_client::Instance()->shutdown();
    }
}
