#pragma once

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

// 视频输入
struct VideoConfig
{
    std::string source{"rtsp://127.0.0.1:8554/fire"}; // 摄像头序号或 RTSP/文件地址
    int target_fps{15};                               // 主循环目标帧率
    int reconnect_delay_ms{2000};                     // 断流后重连间隔
    int queue_size{2};                                // 采集队列长度，满时丢弃最旧帧
};

// 单个推理阶段
struct StageConfig
{
    std::string model_path;
    int input_size{640};
    int class_id{0};             // 目标类别编号，-1 表示不过滤
    float conf_threshold{0.30f}; // 置信度阈值
    float nms_iou{0.45f};        // NMS IoU 阈值
    int timeout_ms{200};         // 单次推理超时
    bool prefer_cuda{true};      // 优先使用 CUDA 后端
};

// 两级检测与迟滞
struct DetectionConfig
{
    StageConfig stage1{"models/smoke.onnx", 416, 0, 0.30f, 0.45f, 200, true};
    StageConfig stage2{"models/fire.onnx", 640, 0, 0.50f, 0.45f, 500, true};
    double smoke_min_area{0.002};        // 烟雾框最小面积(占全帧比例)
    int smoke_consecutive_frames{3};     // 连续 N 帧判定有烟
    int fire_confirm_frames{2};          // 连续 N 次第二阶段命中判定有火
    double fire_hold_sec{3.0};           // 火情确认后保持时间
    double fire_check_cooldown_sec{0.0}; // 第二阶段提交最小间隔，0 表示每个合格帧都尝试
    double roi_margin{0.35};             // ROI 外扩比例
};

// 遥测融合与告警图像
struct FusionConfig
{
    double telemetry_stale_sec{5.0}; // 遥测过期阈值
    int jpeg_quality{90};            // 告警图片质量
    std::string location_label;      // 无遥测时的文字位置描述(可为空)
};

// 任务与飞控
struct MissionConfig
{
    std::string connection_url{"udpin://0.0.0.0:14540"};
    double connect_timeout_sec{10.0};
    std::string store_path{"./missions/missions.json"};
    std::string plan_file;                   // 启动时导入的 QGC .plan 文件(可选)
    int ack_timeout_ms{3000};                // 模式切换应答超时
    int command_retries{3};                  // 超时重试次数
    double hold_timeout_sec{0.0};            // 悬停检查超时自动返航，0 表示关闭
    std::string hold_smoke_policy{"ignore"}; // 悬停期间再次出现烟雾：ignore | return_home
    float default_speed_m_s{5.0f};
    float default_altitude_m{20.0f};
};

// 告警分发
struct AlertConfig
{
    bool enabled{true};
    std::size_t queue_capacity{10};
    double smoke_cooldown_sec{15.0};
    double fire_cooldown_sec{10.0};
    float min_confidence{0.3f};
    int retries{2};
    int backoff_ms{500};
    int send_timeout_ms{5000};
};

// MQTT 连接
struct MqttConfig
{
    bool enabled{true};
    std::string broker{"127.0.0.1"};
    int port{1883};
    std::string username;
    std::string password;
    std::string client_id{"firewatch"};
    std::string topic_prefix{"firewatch"};
    int keep_alive{60};
    int publish_timeout_ms{1000}; // 状态消息(QoS 0)发布最长等待
    std::size_t publish_queue{16}; // 状态消息队列长度，满时丢弃最旧
};

// HTTP 状态/视频流
struct HttpConfig
{
    bool enabled{true};
    std::string host{"0.0.0.0"};
    int port{5002};
    int snapshot_slots{3};
    int stream_fps{10};
    int jpeg_quality{80};
};

// 日志
struct LogConfig
{
    std::string log_file{"./logs/firewatch.log"};
    std::string log_level{"info"};
};

struct AppConfig
{
    VideoConfig video;
    DetectionConfig detection;
    FusionConfig fusion;
    MissionConfig mission;
    AlertConfig alerts;
    MqttConfig mqtt;
    HttpConfig http;
    LogConfig logging;
};

/**
 * @brief 从 JSON 文件加载配置，未出现的字段保持默认值
 * @param path 配置文件路径
 * @param cfg 输出配置
 * @param error 失败时的错误描述
 * @return 成功返回 true
 */
bool load_config_file(const std::string &path, AppConfig &cfg, std::string &error);

// 从 JSON 对象读取配置(load_config_file 内部使用，也供测试直接调用)
void apply_config_json(const nlohmann::json &j, AppConfig &cfg);

/**
 * @brief 解析命令行和环境变量
 * 先加载 --config 指定的文件(默认 config/firewatch.json，不存在则跳过)，再应用命令行覆盖
 * @return 0 继续运行，1 打印帮助后退出，-1 参数或配置错误
 */
int parse_args(int argc, char **argv, AppConfig &cfg);
