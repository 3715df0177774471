#include "config.hpp"

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace
{
    const char *DEFAULT_CONFIG_PATH = "config/firewatch.json";

    template <typename T>
    void read(const json &j, const char *key, T &out)
    {
        if (j.contains(key) && !j.at(key).is_null())
        {
            out = j.at(key).get<T>();
        }
    }

    void read_stage(const json &j, StageConfig &s)
    {
        read(j, "model_path", s.model_path);
        read(j, "input_size", s.input_size);
        read(j, "class_id", s.class_id);
        read(j, "conf_threshold", s.conf_threshold);
        read(j, "nms_iou", s.nms_iou);
        read(j, "timeout_ms", s.timeout_ms);
        read(j, "prefer_cuda", s.prefer_cuda);
    }

    bool arg_eq(const char *a, const char *b)
    {
        return std::strcmp(a, b) == 0;
    }

    void print_usage()
    {
        std::cout << "Usage: firewatch [--config <file>] [--source <src>] [--connection <url>]\n"
                  << "                 [--smoke-model <onnx>] [--fire-model <onnx>] [--plan <file>]\n"
                  << "                 [--http-port <port>] [--log-level <level>] [--help]\n";
    }
}

void apply_config_json(const json &j, AppConfig &cfg)
{
    if (j.contains("video"))
    {
        const auto &v = j.at("video");
        read(v, "source", cfg.video.source);
        read(v, "target_fps", cfg.video.target_fps);
        read(v, "reconnect_delay_ms", cfg.video.reconnect_delay_ms);
        read(v, "queue_size", cfg.video.queue_size);
    }

    if (j.contains("detection"))
    {
        const auto &d = j.at("detection");
        if (d.contains("stage1"))
        {
            read_stage(d.at("stage1"), cfg.detection.stage1);
        }
        if (d.contains("stage2"))
        {
            read_stage(d.at("stage2"), cfg.detection.stage2);
        }
        read(d, "smoke_min_area", cfg.detection.smoke_min_area);
        read(d, "smoke_consecutive_frames", cfg.detection.smoke_consecutive_frames);
        read(d, "fire_confirm_frames", cfg.detection.fire_confirm_frames);
        read(d, "fire_hold_sec", cfg.detection.fire_hold_sec);
        read(d, "fire_check_cooldown_sec", cfg.detection.fire_check_cooldown_sec);
        read(d, "roi_margin", cfg.detection.roi_margin);
    }

    if (j.contains("fusion"))
    {
        const auto &f = j.at("fusion");
        read(f, "telemetry_stale_sec", cfg.fusion.telemetry_stale_sec);
        read(f, "jpeg_quality", cfg.fusion.jpeg_quality);
        read(f, "location_label", cfg.fusion.location_label);
    }

    if (j.contains("mission"))
    {
        const auto &m = j.at("mission");
        read(m, "connection_url", cfg.mission.connection_url);
        read(m, "connect_timeout_sec", cfg.mission.connect_timeout_sec);
        read(m, "store_path", cfg.mission.store_path);
        read(m, "plan_file", cfg.mission.plan_file);
        read(m, "ack_timeout_ms", cfg.mission.ack_timeout_ms);
        read(m, "command_retries", cfg.mission.command_retries);
        read(m, "hold_timeout_sec", cfg.mission.hold_timeout_sec);
        read(m, "hold_smoke_policy", cfg.mission.hold_smoke_policy);
        read(m, "default_speed_m_s", cfg.mission.default_speed_m_s);
        read(m, "default_altitude_m", cfg.mission.default_altitude_m);
    }

    if (j.contains("alerts"))
    {
        const auto &a = j.at("alerts");
        read(a, "enabled", cfg.alerts.enabled);
        read(a, "queue_capacity", cfg.alerts.queue_capacity);
        read(a, "smoke_cooldown_sec", cfg.alerts.smoke_cooldown_sec);
        read(a, "fire_cooldown_sec", cfg.alerts.fire_cooldown_sec);
        read(a, "min_confidence", cfg.alerts.min_confidence);
        read(a, "retries", cfg.alerts.retries);
        read(a, "backoff_ms", cfg.alerts.backoff_ms);
        read(a, "send_timeout_ms", cfg.alerts.send_timeout_ms);
    }

    if (j.contains("mqtt"))
    {
        const auto &q = j.at("mqtt");
        read(q, "enabled", cfg.mqtt.enabled);
        read(q, "broker", cfg.mqtt.broker);
        read(q, "port", cfg.mqtt.port);
        read(q, "username", cfg.mqtt.username);
        read(q, "password", cfg.mqtt.password);
        read(q, "client_id", cfg.mqtt.client_id);
        read(q, "topic_prefix", cfg.mqtt.topic_prefix);
        read(q, "keep_alive", cfg.mqtt.keep_alive);
        read(q, "publish_timeout_ms", cfg.mqtt.publish_timeout_ms);
        read(q, "publish_queue", cfg.mqtt.publish_queue);
    }

    if (j.contains("http"))
    {
        const auto &h = j.at("http");
        read(h, "enabled", cfg.http.enabled);
        read(h, "host", cfg.http.host);
        read(h, "port", cfg.http.port);
        read(h, "snapshot_slots", cfg.http.snapshot_slots);
        read(h, "stream_fps", cfg.http.stream_fps);
        read(h, "jpeg_quality", cfg.http.jpeg_quality);
    }

    if (j.contains("logging"))
    {
        const auto &l = j.at("logging");
        read(l, "log_file", cfg.logging.log_file);
        read(l, "log_level", cfg.logging.log_level);
    }
}

bool load_config_file(const std::string &path, AppConfig &cfg, std::string &error)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        error = "无法打开配置文件: " + path;
        return false;
    }

    try
    {
        json j;
        file >> j;
        if (!j.is_object())
        {
            error = "配置文件顶层必须是 JSON 对象: " + path;
            return false;
        }
        apply_config_json(j, cfg);
    }
    catch (const json::exception &e)
    {
        error = "解析配置文件失败(" + path + "): " + e.what();
        return false;
    }
    return true;
}

int parse_args(int argc, char **argv, AppConfig &cfg)
{
    // 第一遍：找到配置文件路径和 --help
    std::string config_path = DEFAULT_CONFIG_PATH;
    bool explicit_config = false;
    for (int i = 1; i < argc; ++i)
    {
        if (arg_eq(argv[i], "--help") || arg_eq(argv[i], "-h"))
        {
            print_usage();
            return 1;
        }
        if (arg_eq(argv[i], "--config") && i + 1 < argc)
        {
            config_path = argv[++i];
            explicit_config = true;
        }
    }

    if (explicit_config || std::filesystem::exists(config_path))
    {
        std::string error;
        if (!load_config_file(config_path, cfg, error))
        {
            std::cerr << error << std::endl;
            return -1;
        }
    }

    // 环境变量覆盖
    if (const char *env_src = std::getenv("FIREWATCH_SOURCE"))
        cfg.video.source = env_src;
    if (const char *env_conn = std::getenv("FIREWATCH_CONNECTION"))
        cfg.mission.connection_url = env_conn;
    if (const char *env_broker = std::getenv("FIREWATCH_MQTT_BROKER"))
        cfg.mqtt.broker = env_broker;

    // 第二遍：命令行覆盖
    for (int i = 1; i < argc; ++i)
    {
        const char *arg = argv[i];
        auto next = [&]() -> const char *
        {
            if (i + 1 < argc)
                return argv[i + 1];
            return nullptr;
        };

        if (arg_eq(arg, "--config") && next())
        {
            i++;
        }
        else if (arg_eq(arg, "--source") && next())
        {
            cfg.video.source = next();
            i++;
        }
        else if (arg_eq(arg, "--connection") && next())
        {
            cfg.mission.connection_url = next();
            i++;
        }
        else if (arg_eq(arg, "--smoke-model") && next())
        {
            cfg.detection.stage1.model_path = next();
            i++;
        }
        else if (arg_eq(arg, "--fire-model") && next())
        {
            cfg.detection.stage2.model_path = next();
            i++;
        }
        else if (arg_eq(arg, "--plan") && next())
        {
            cfg.mission.plan_file = next();
            i++;
        }
        else if (arg_eq(arg, "--http-port") && next())
        {
            cfg.http.port = std::atoi(next());
            i++;
        }
        else if (arg_eq(arg, "--log-level") && next())
        {
            cfg.logging.log_level = next();
            i++;
        }
        else
        {
            std::cerr << "未知参数或缺少参数值: " << arg << std::endl;
            print_usage();
            return -1;
        }
    }

    return 0;
}
