#include "config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace
{
// 构造 argv，字符串由调用方持有
std::vector<char *> make_argv(std::vector<std::string> &args)
{
    std::vector<char *> argv;
    for (auto &a : args)
    {
        argv.push_back(a.data());
    }
    return argv;
}

std::string write_file(const std::string &name, const std::string &content)
{
    const fs::path path = fs::temp_directory_path() / name;
    std::ofstream(path) << content;
    return path.string();
}

class ConfigArgs : public ::testing::Test
{
protected:
    void SetUp() override
    {
        unsetenv("FIREWATCH_SOURCE");
        unsetenv("FIREWATCH_CONNECTION");
        unsetenv("FIREWATCH_MQTT_BROKER");
        config_path = write_file("firewatch_test_config.json", R"({"video": {"source": "0"}, "http": {"port": 6000}})");
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove(config_path, ec);
    }

    int parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "firewatch");
        std::vector<char *> argv = make_argv(args);
        return parse_args(static_cast<int>(argv.size()), argv.data(), cfg);
    }

    std::string config_path;
    AppConfig cfg;
};
} // namespace

TEST(Config, DefaultsMatchDocumentedValues)
{
    AppConfig cfg;
    EXPECT_FLOAT_EQ(cfg.detection.stage1.conf_threshold, 0.30f);
    EXPECT_FLOAT_EQ(cfg.detection.stage2.conf_threshold, 0.50f);
    EXPECT_EQ(cfg.detection.smoke_consecutive_frames, 3);
    EXPECT_EQ(cfg.detection.fire_confirm_frames, 2);
    EXPECT_DOUBLE_EQ(cfg.detection.fire_hold_sec, 3.0);
    EXPECT_DOUBLE_EQ(cfg.detection.roi_margin, 0.35);
    EXPECT_DOUBLE_EQ(cfg.fusion.telemetry_stale_sec, 5.0);
    EXPECT_EQ(cfg.alerts.queue_capacity, 10u);
    EXPECT_EQ(cfg.http.snapshot_slots, 3);
}

TEST(Config, PartialJsonKeepsDefaults)
{
    AppConfig cfg;
    json j = json::parse(R"({
        "detection": {"stage1": {"conf_threshold": 0.4}, "smoke_consecutive_frames": 5},
        "alerts": {"smoke_cooldown_sec": 60},
        "mission": {"hold_smoke_policy": "return_home", "plan_file": null}
    })");
    apply_config_json(j, cfg);

    EXPECT_FLOAT_EQ(cfg.detection.stage1.conf_threshold, 0.4f);
    EXPECT_EQ(cfg.detection.stage1.model_path, "models/smoke.onnx");
    EXPECT_EQ(cfg.detection.smoke_consecutive_frames, 5);
    EXPECT_EQ(cfg.detection.fire_confirm_frames, 2);
    EXPECT_DOUBLE_EQ(cfg.alerts.smoke_cooldown_sec, 60.0);
    EXPECT_DOUBLE_EQ(cfg.alerts.fire_cooldown_sec, 10.0);
    EXPECT_EQ(cfg.mission.hold_smoke_policy, "return_home");
    EXPECT_TRUE(cfg.mission.plan_file.empty());
}

TEST(Config, LoadFileReportsErrors)
{
    AppConfig cfg;
    std::string error;
    EXPECT_FALSE(load_config_file("/nonexistent/firewatch.json", cfg, error));
    EXPECT_FALSE(error.empty());

    const std::string broken = write_file("firewatch_broken.json", "{\"video\": ");
    error.clear();
    EXPECT_FALSE(load_config_file(broken, cfg, error));
    EXPECT_FALSE(error.empty());

    const std::string array = write_file("firewatch_array.json", "[1, 2]");
    EXPECT_FALSE(load_config_file(array, cfg, error));

    // 字段类型错误
    const std::string bad_type = write_file("firewatch_bad_type.json", R"({"http": {"port": "high"}})");
    EXPECT_FALSE(load_config_file(bad_type, cfg, error));

    fs::remove(broken);
    fs::remove(array);
    fs::remove(bad_type);
}

TEST_F(ConfigArgs, CommandLineOverridesFile)
{
    ASSERT_EQ(parse({"--config", config_path, "--http-port", "7000", "--plan", "survey.plan"}), 0);
    EXPECT_EQ(cfg.video.source, "0");
    EXPECT_EQ(cfg.http.port, 7000);
    EXPECT_EQ(cfg.mission.plan_file, "survey.plan");
}

TEST_F(ConfigArgs, EnvironmentOverridesFile)
{
    setenv("FIREWATCH_SOURCE", "rtsp://camera/stream", 1);
    ASSERT_EQ(parse({"--config", config_path}), 0);
    EXPECT_EQ(cfg.video.source, "rtsp://camera/stream");
    EXPECT_EQ(cfg.http.port, 6000);
}

TEST_F(ConfigArgs, HelpAndUnknownArguments)
{
    EXPECT_EQ(parse({"--help"}), 1);
    EXPECT_EQ(parse({"--config", config_path, "--bogus"}), -1);
    EXPECT_EQ(parse({"--config", config_path, "--source"}), -1);
    EXPECT_EQ(parse({"--config", "/nonexistent/firewatch.json"}), -1);
}
