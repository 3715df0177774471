#include "fakes.hpp"
#include "mission_api.hpp"
#include "mission_store.hpp"
#include "operator_commands.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <functional>
#include <fstream>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace
{
// 每个测试独立的临时目录
class TempDir
{
public:
    TempDir()
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = fs::temp_directory_path() / (std::string("firewatch_") + info->test_suite_name() + "_" + info->name());
        fs::remove_all(path_);
        fs::create_directories(path_);
    }
    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string file(const std::string &name) const { return (path_ / name).string(); }

private:
    fs::path path_;
};

std::vector<Waypoint> square(int n)
{
    std::vector<Waypoint> wps(n);
    for (int i = 0; i < n; ++i)
    {
        wps[i].latitude_deg = 47.0 + 0.001 * i;
        wps[i].longitude_deg = 8.0 + 0.001 * i;
        wps[i].relative_altitude_m = 15.0f + i;
    }
    return wps;
}

json sample_plan()
{
    return json::parse(R"({
        "fileType": "Plan",
        "mission": {
            "items": [
                {"autoContinue": true, "command": 22, "frame": 3, "params": [0, 0, 0, null, 47.1, 8.1, 10]},
                {"autoContinue": true, "command": 178, "frame": 2, "params": [1, 8.5, -1, 0, 0, 0, 0]},
                {"autoContinue": true, "command": 16, "frame": 3, "params": [0, 0, 0, 90, 47.2, 8.2, 20]},
                {"autoContinue": true, "command": 16, "frame": 0, "params": [0, 0, 0, 0, 47.3, 8.3, 30]},
                {"autoContinue": false, "command": 16, "frame": 3, "params": [5, 0, 0, null, 47.4, 8.4, 25]},
                {"autoContinue": true, "command": 16, "frame": 3}
            ]
        }
    })");
}

bool wait_until(const std::function<bool()> &done)
{
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (done())
        {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return done();
}

bool wait_for_state(const MissionController &controller, MissionState state)
{
    return wait_until([&]
                      { return controller.state() == state; });
}

// 状态机先更新状态再通知监听者，任务记录稍后才会同步
bool wait_for_status(const MissionStore &store, const std::string &id, const std::string &status)
{
    return wait_until([&]
                      {
        auto record = store.find(id);
        return record && record->status == status; });
}
} // namespace

TEST(MissionPlan, ParsesQGroundControlItems)
{
    std::vector<Waypoint> wps = parse_qgroundcontrol_plan(sample_plan(), 5.0f);
    ASSERT_EQ(wps.size(), 3u);

    // 起飞点使用默认速度，178 之后的航点使用新速度
    EXPECT_DOUBLE_EQ(wps[0].latitude_deg, 47.1);
    EXPECT_FLOAT_EQ(wps[0].speed_m_s, 5.0f);
    EXPECT_TRUE(std::isnan(wps[0].yaw_deg));

    EXPECT_DOUBLE_EQ(wps[1].longitude_deg, 8.2);
    EXPECT_FLOAT_EQ(wps[1].relative_altitude_m, 20.0f);
    EXPECT_FLOAT_EQ(wps[1].speed_m_s, 8.5f);
    EXPECT_FLOAT_EQ(wps[1].yaw_deg, 90.0f);
    EXPECT_TRUE(wps[1].is_fly_through);

    // 停留 5 秒的航点不直接飞过
    EXPECT_FLOAT_EQ(wps[2].loiter_time_s, 5.0f);
    EXPECT_FALSE(wps[2].is_fly_through);
}

TEST(MissionPlan, MissingAltitudeUsesDefault)
{
    json plan = json::parse(R"({
        "mission": {
            "items": [
                {"autoContinue": true, "command": 16, "frame": 3, "params": [0, 0, 0, null, 47.2, 8.2, null]},
                {"autoContinue": true, "command": 16, "frame": 3, "params": [0, 0, 0, null, 47.3, 8.3, 42]}
            ]
        }
    })");

    std::vector<Waypoint> wps = parse_qgroundcontrol_plan(plan, 5.0f, 55.0f);
    ASSERT_EQ(wps.size(), 2u);
    EXPECT_FLOAT_EQ(wps[0].relative_altitude_m, 55.0f);
    EXPECT_FLOAT_EQ(wps[1].relative_altitude_m, 42.0f);

    std::vector<Waypoint> listed = parse_waypoints(json::parse(R"([{"lat": 47.0, "lon": 8.0, "alt": null}, {"lat": 47.1, "lon": 8.1, "alt": 12, "speed": 3}])"), 6.0f, 25.0f);
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_FLOAT_EQ(listed[0].relative_altitude_m, 25.0f);
    EXPECT_FLOAT_EQ(listed[0].speed_m_s, 6.0f);
    EXPECT_FLOAT_EQ(listed[1].relative_altitude_m, 12.0f);
    EXPECT_FLOAT_EQ(listed[1].speed_m_s, 3.0f);

    EXPECT_TRUE(parse_waypoints(json::object(), 6.0f, 25.0f).empty());
}

TEST(MissionPlan, RejectsNonPlanDocument)
{
    EXPECT_TRUE(parse_qgroundcontrol_plan(json{{"items", json::array()}}).empty());
    EXPECT_TRUE(read_qgroundcontrol_plan("/nonexistent/firewatch.plan").empty());
}

TEST(MissionPlan, ReadsPlanFile)
{
    TempDir dir;
    const std::string path = dir.file("survey.plan");
    std::ofstream(path) << sample_plan().dump();

    EXPECT_EQ(read_qgroundcontrol_plan(path, 3.0f).size(), 3u);

    std::ofstream(dir.file("broken.plan")) << "{ not json";
    EXPECT_TRUE(read_qgroundcontrol_plan(dir.file("broken.plan")).empty());
}

TEST(MissionStore, CreatePersistsAndReloads)
{
    TempDir dir;
    const std::string path = dir.file("missions/missions.json");

    std::string id;
    {
        MissionStore store(path);
        ASSERT_TRUE(store.load());
        auto record = store.create("survey", square(3), std::nullopt);
        ASSERT_TRUE(record.has_value());
        id = record->id;
        EXPECT_EQ(record->status, "created");
        EXPECT_EQ(record->id.rfind("mission_", 0), 0u);
        EXPECT_TRUE(store.updateStatus(id, "running"));
        EXPECT_TRUE(store.updateProgress(id, 2));
    }

    MissionStore reloaded(path);
    ASSERT_TRUE(reloaded.load());
    auto record = reloaded.find(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->name, "survey");
    EXPECT_EQ(record->status, "running");
    EXPECT_EQ(record->current_waypoint, 2);
    ASSERT_EQ(record->waypoints.size(), 3u);
    EXPECT_DOUBLE_EQ(record->waypoints[1].latitude_deg, 47.001);
    EXPECT_FALSE(record->home.has_value());
}

TEST(MissionStore, IdsAreUnique)
{
    TempDir dir;
    MissionStore store(dir.file("missions.json"));
    auto a = store.create("a", square(1), std::nullopt);
    auto b = store.create("b", square(1), std::nullopt);
    ASSERT_TRUE(a && b);
    EXPECT_NE(a->id, b->id);
    EXPECT_EQ(store.list().size(), 2u);

    EXPECT_TRUE(store.remove(a->id));
    EXPECT_FALSE(store.remove(a->id));
    EXPECT_EQ(store.list().size(), 1u);
}

TEST(MissionStore, EmptyWaypointsRejected)
{
    TempDir dir;
    MissionStore store(dir.file("missions.json"));
    EXPECT_FALSE(store.create("empty", {}, std::nullopt).has_value());
    EXPECT_TRUE(store.list().empty());
}

TEST(MissionStore, HomeReplacesFirstWaypoint)
{
    TempDir dir;
    MissionStore store(dir.file("missions.json"));
    auto record = store.create("with_home", square(2), GeoPoint{46.5, 7.5, 0.0f});
    ASSERT_TRUE(record.has_value());
    EXPECT_DOUBLE_EQ(record->waypoints[0].latitude_deg, 46.5);
    EXPECT_DOUBLE_EQ(record->waypoints[0].longitude_deg, 7.5);
    EXPECT_FLOAT_EQ(record->waypoints[0].relative_altitude_m, 15.0f); // 高度保留
    EXPECT_DOUBLE_EQ(record->waypoints[1].latitude_deg, 47.001);

    EXPECT_TRUE(store.setHome(record->id, GeoPoint{45.0, 6.0, 0.0f}));
    auto updated = store.find(record->id);
    ASSERT_TRUE(updated && updated->home);
    EXPECT_DOUBLE_EQ(updated->home->latitude_deg, 45.0);
    EXPECT_DOUBLE_EQ(updated->waypoints[0].longitude_deg, 6.0);

    EXPECT_FALSE(store.setHome("missing", GeoPoint{}));
}

TEST(MissionStore, CorruptFileFailsToLoad)
{
    TempDir dir;
    const std::string path = dir.file("missions.json");
    std::ofstream(path) << "{\"missions\": [ {";

    MissionStore store(path);
    EXPECT_FALSE(store.load());
    EXPECT_TRUE(store.list().empty());
}

// 任务接口 + 指令处理
class MissionApiTest : public ::testing::Test
{
protected:
    MissionApiTest()
        : store(dir.file("missions.json")),
          controller(link, makeConfig()),
          api(store, controller, link),
          commands(api, 5.0f, 35.0f)
    {
    }

    static MissionControllerConfig makeConfig()
    {
        MissionControllerConfig cfg;
        cfg.ack_timeout = 10ms;
        cfg.command_retries = 1;
        cfg.poll_interval = 10ms;
        return cfg;
    }

    void SetUp() override { controller.start(); }
    void TearDown() override { controller.stop(); }

    json command(const json &msg) { return commands.handle(msg); }

    TempDir dir;
    FakeAutopilotLink link;
    MissionStore store;
    MissionController controller;
    MissionApi api;
    OperatorCommandHandler commands;
};

TEST_F(MissionApiTest, CreateUsesVehiclePositionAsHome)
{
    link.setTelemetry(make_telemetry(46.9, 7.4, Clock::now()));
    ApiResult result = api.createMission("patrol", square(3));
    ASSERT_TRUE(result.ok);
    EXPECT_DOUBLE_EQ(result.data["waypoints"][0]["lat"].get<double>(), 46.9);
    EXPECT_DOUBLE_EQ(result.data["home"]["lon"].get<double>(), 7.4);

    EXPECT_FALSE(api.createMission("empty", {}).ok);
}

TEST_F(MissionApiTest, FullSmokePauseCycle)
{
    ApiResult created = api.createMission("patrol", square(4));
    ASSERT_TRUE(created.ok);
    const std::string id = created.data["id"].get<std::string>();

    EXPECT_FALSE(api.resumeAfterSmoke(id).ok); // 尚未悬停
    ASSERT_TRUE(api.startSequence(id).ok);
    ASSERT_TRUE(wait_for_state(controller, MissionState::NAVIGATING));
    EXPECT_TRUE(wait_for_status(store, id, "running"));

    // 任务进行中不能再次启动
    EXPECT_FALSE(api.startSequence(id).ok);

    link.current_waypoint = 2;
    link.setTelemetry(make_telemetry(47.002, 8.002, Clock::now()));
    MissionEvent smoke;
    smoke.type = MissionEventType::SMOKE_RISING_EDGE;
    controller.post(smoke);
    ASSERT_TRUE(wait_for_state(controller, MissionState::HOLD_FOR_INSPECTION));
    ASSERT_TRUE(wait_for_status(store, id, "paused"));
    EXPECT_EQ(store.find(id)->current_waypoint, 2);

    SmokePauseStatus status = api.getSmokePauseStatus(id);
    EXPECT_TRUE(status.paused);
    json j = status;
    EXPECT_TRUE(j["paused"].get<bool>());
    EXPECT_DOUBLE_EQ(j["location"]["lat"].get<double>(), 47.002);
    EXPECT_TRUE(j["since"].is_string());
    EXPECT_EQ(j["mode_before_pause"], flightModeToString(FlightMode::MISSION));
    EXPECT_EQ(j["resume_mode"], flightModeToString(FlightMode::MISSION));

    // 其他任务编号查询返回未暂停
    EXPECT_FALSE(api.getSmokePauseStatus("mission_other").paused);
    EXPECT_FALSE(api.resumeAfterSmoke("mission_other").ok);

    ApiResult resumed = api.resumeAfterSmoke(id);
    ASSERT_TRUE(resumed.ok);
    EXPECT_EQ(resumed.data["waypoint"].get<int>(), 2);
    ASSERT_TRUE(wait_for_state(controller, MissionState::NAVIGATING));
    EXPECT_EQ(link.waypointCommands(), std::vector<int>{2});
    EXPECT_TRUE(wait_for_status(store, id, "running"));
}

TEST_F(MissionApiTest, StartRequiresKnownMissionAndLink)
{
    EXPECT_FALSE(api.startSequence("mission_missing").ok);

    ApiResult created = api.createMission("patrol", square(2));
    const std::string id = created.data["id"].get<std::string>();
    link.connected = false;
    ApiResult result = api.startSequence(id);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.message, "autopilot not connected");
}

TEST_F(MissionApiTest, AbortMarksMissionAborted)
{
    ApiResult created = api.createMission("patrol", square(2));
    const std::string id = created.data["id"].get<std::string>();
    ASSERT_TRUE(api.startSequence(id).ok);
    ASSERT_TRUE(wait_for_state(controller, MissionState::NAVIGATING));

    ASSERT_TRUE(api.abort().ok);
    ASSERT_TRUE(wait_for_state(controller, MissionState::IDLE));
    EXPECT_TRUE(wait_for_status(store, id, "aborted"));
    EXPECT_EQ(link.modeCommands().back(), FlightMode::RETURN_TO_LAUNCH);
}

TEST_F(MissionApiTest, FinishedMissionIsMarkedCompleted)
{
    ApiResult created = api.createMission("patrol", square(3));
    const std::string id = created.data["id"].get<std::string>();
    ASSERT_TRUE(api.startSequence(id).ok);
    ASSERT_TRUE(wait_for_state(controller, MissionState::NAVIGATING));

    link.mission_finished = true;
    ASSERT_TRUE(wait_for_state(controller, MissionState::IDLE));
    EXPECT_TRUE(wait_for_status(store, id, "completed"));
    EXPECT_TRUE(controller.activeMissionId().empty());
    EXPECT_EQ(link.modeCommands(), std::vector<FlightMode>{FlightMode::MISSION});
}

TEST_F(MissionApiTest, ErrorNeedsAcknowledgement)
{
    EXPECT_FALSE(api.acknowledgeError().ok);

    ApiResult created = api.createMission("patrol", square(2));
    const std::string id = created.data["id"].get<std::string>();
    link.scriptModeResults({CommandResult::REJECTED});
    ASSERT_TRUE(api.startSequence(id).ok);
    ASSERT_TRUE(wait_for_state(controller, MissionState::ERROR));
    EXPECT_TRUE(wait_for_status(store, id, "error"));

    EXPECT_TRUE(api.acknowledgeError().ok);
    EXPECT_TRUE(wait_for_state(controller, MissionState::IDLE));
}

TEST_F(MissionApiTest, SetHomeFallsBackToTelemetry)
{
    ApiResult created = api.createMission("patrol", square(2));
    const std::string id = created.data["id"].get<std::string>();

    EXPECT_FALSE(api.setHome(id, std::nullopt).ok);

    link.setTelemetry(make_telemetry(40.0, 9.0, Clock::now()));
    ASSERT_TRUE(api.setHome(id, std::nullopt).ok);
    EXPECT_DOUBLE_EQ(store.find(id)->waypoints[0].latitude_deg, 40.0);

    ASSERT_TRUE(api.setHome(id, GeoPoint{41.0, 10.0, 0.0f}).ok);
    EXPECT_DOUBLE_EQ(store.find(id)->home->longitude_deg, 10.0);
}

TEST_F(MissionApiTest, CommandsCreateAndStart)
{
    json reply = command({{"command", "create_mission"},
                          {"name", "cmd"},
                          {"waypoints", json::array({json{{"lat", 47.0}, {"lon", 8.0}}, json{{"lat", 47.1}, {"lon", 8.1}, {"alt", 30.0}}})}});
    ASSERT_TRUE(reply["ok"].get<bool>()) << reply.dump();
    EXPECT_EQ(reply["command"], "create_mission");
    const std::string id = reply["data"]["id"].get<std::string>();
    EXPECT_FLOAT_EQ(reply["data"]["waypoints"][1]["alt"].get<float>(), 30.0f);
    // 未给高度的航点使用配置的默认高度
    EXPECT_FLOAT_EQ(reply["data"]["waypoints"][0]["alt"].get<float>(), 35.0f);
    EXPECT_FLOAT_EQ(reply["data"]["waypoints"][0]["speed"].get<float>(), 5.0f);

    json listed = command({{"command", "list_missions"}});
    ASSERT_TRUE(listed["ok"].get<bool>());
    EXPECT_EQ(listed["data"]["missions"].size(), 1u);

    json started = command({{"command", "start_sequence"}, {"mission_id", id}});
    EXPECT_TRUE(started["ok"].get<bool>());
    EXPECT_TRUE(wait_for_state(controller, MissionState::NAVIGATING));

    json status = command({{"command", "smoke_pause_status"}, {"mission_id", id}});
    EXPECT_TRUE(status["ok"].get<bool>());
    EXPECT_FALSE(status["data"]["paused"].get<bool>());
    EXPECT_TRUE(status["data"]["mission_active"].get<bool>());
}

TEST_F(MissionApiTest, CommandsFromInlinePlan)
{
    json reply = command({{"command", "create_mission"}, {"plan", sample_plan()}});
    ASSERT_TRUE(reply["ok"].get<bool>());
    EXPECT_EQ(reply["data"]["waypoints"].size(), 3u);

    json missing = command({{"command", "create_mission"}, {"name", "nothing"}});
    EXPECT_FALSE(missing["ok"].get<bool>());
}

TEST_F(MissionApiTest, MalformedCommandsAreReported)
{
    json unknown = command({{"command", "takeoff"}});
    EXPECT_FALSE(unknown["ok"].get<bool>());
    EXPECT_EQ(unknown["message"], "unknown command: takeoff");

    json not_object = command(json::array({1, 2}));
    EXPECT_FALSE(not_object["ok"].get<bool>());

    // 字段类型错误不抛出
    json bad_type = command({{"command", "create_mission"}, {"waypoints", json::array({json{{"lat", "north"}, {"lon", 8.0}}})}});
    EXPECT_FALSE(bad_type["ok"].get<bool>());

    json parsed = json::parse(commands.handlePayload(std::string("{not json")));
    EXPECT_FALSE(parsed["ok"].get<bool>());
    EXPECT_EQ(parsed["message"], "malformed json");

    const std::string raw = R"({"command": "list_missions"})";
    json ok = json::parse(commands.handlePayload(std::vector<unsigned char>(raw.begin(), raw.end())));
    EXPECT_TRUE(ok["ok"].get<bool>());
}

TEST_F(MissionApiTest, DeleteMissionCommand)
{
    ApiResult first = api.createMission("first", square(2));
    ApiResult second = api.createMission("second", square(2));
    const std::string first_id = first.data["id"].get<std::string>();
    const std::string second_id = second.data["id"].get<std::string>();

    ASSERT_TRUE(api.startSequence(first_id).ok);
    ASSERT_TRUE(wait_for_state(controller, MissionState::NAVIGATING));

    // 正在执行的任务不能删除
    json active = command({{"command", "delete_mission"}, {"mission_id", first_id}});
    EXPECT_FALSE(active["ok"].get<bool>());
    EXPECT_TRUE(store.find(first_id).has_value());

    json deleted = command({{"command", "delete_mission"}, {"mission_id", second_id}});
    EXPECT_TRUE(deleted["ok"].get<bool>()) << deleted.dump();
    EXPECT_FALSE(store.find(second_id).has_value());

    json again = command({{"command", "delete_mission"}, {"mission_id", second_id}});
    EXPECT_FALSE(again["ok"].get<bool>());
    EXPECT_FALSE(command({{"command", "delete_mission"}})["ok"].get<bool>());

    // 任务记录已落盘
    MissionStore reloaded(dir.file("missions.json"));
    ASSERT_TRUE(reloaded.load());
    EXPECT_EQ(reloaded.list().size(), 1u);
}
