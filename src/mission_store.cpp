#include "mission_store.hpp"
#include "detection_types.hpp"
#include "logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

void to_json(json &j, const MissionRecord &record)
{
    j = json{
        {"id", record.id},
        {"name", record.name},
        {"waypoints", record.waypoints},
        {"created_at", record.created_at},
        {"status", record.status},
        {"current_waypoint", record.current_waypoint}};
    if (record.home)
    {
        j["home"] = {{"lat", record.home->latitude_deg}, {"lon", record.home->longitude_deg}, {"alt", record.home->relative_altitude_m}};
    }
}

void from_json(const json &j, MissionRecord &record)
{
    record.id = j.at("id").get<std::string>();
    record.name = j.value("name", record.id);
    record.waypoints = j.value("waypoints", std::vector<Waypoint>{});
    record.created_at = j.value("created_at", static_cast<int64_t>(0));
    record.status = j.value("status", std::string("created"));
    record.current_waypoint = j.value("current_waypoint", 0);
    if (j.contains("home") && j["home"].is_object())
    {
        const json &h = j["home"];
        record.home = GeoPoint{h.value("lat", 0.0), h.value("lon", 0.0), h.value("alt", 0.0f)};
    }
}

MissionStore::MissionStore(std::string path) : path_(std::move(path))
{
}

bool MissionStore::load()
{
    auto logger = logging::get_logger();
    std::lock_guard<std::mutex> lock(mutex_);
    missions_.clear();

    std::error_code ec;
    if (!fs::exists(path_, ec))
    {
        logger->info("任务文件不存在，使用空存储: {}", path_);
        return true;
    }

    std::ifstream file(path_);
    if (!file.is_open())
    {
        logger->error("无法打开任务文件: {}", path_);
        return false;
    }

    try
    {
        json j;
        file >> j;
        missions_ = j.value("missions", std::vector<MissionRecord>{});
        logger->info("已加载 {} 个任务: {}", missions_.size(), path_);
        return true;
    }
    catch (const json::exception &e)
    {
        logger->error("任务文件解析失败({}): {}", path_, e.what());
        missions_.clear();
        return false;
    }
}

bool MissionStore::save() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return saveLocked();
}

bool MissionStore::saveLocked() const
{
    auto logger = logging::get_logger();

    std::error_code ec;
    fs::path target(path_);
    if (target.has_parent_path())
    {
        fs::create_directories(target.parent_path(), ec);
    }

    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open())
        {
            logger->error("无法写入任务文件: {}", tmp);
            return false;
        }
        json j = {{"missions", missions_}};
        out << j.dump(2);
        if (!out.good())
        {
            logger->error("写入任务文件失败: {}", tmp);
            return false;
        }
    }

    fs::rename(tmp, target, ec);
    if (ec)
    {
        logger->error("任务文件重命名失败: {}", ec.message());
        return false;
    }
    return true;
}

std::string MissionStore::nextId(int64_t now) const
{
    std::string base = "mission_" + std::to_string(now);
    std::string id = base;
    int suffix = 1;
    auto taken = [this](const std::string &candidate)
    {
        return std::any_of(missions_.begin(), missions_.end(), [&](const MissionRecord &m)
                           { return m.id == candidate; });
    };
    while (taken(id))
    {
        id = base + "_" + std::to_string(suffix++);
    }
    return id;
}

std::optional<MissionRecord> MissionStore::create(const std::string &name, std::vector<Waypoint> waypoints, const std::optional<GeoPoint> &home)
{
    auto logger = logging::get_logger();
    if (waypoints.empty())
    {
        logger->error("创建任务失败: 航点为空");
        return std::nullopt;
    }

    // 第一个航点固定为起始点
    if (home)
    {
        waypoints.front().latitude_deg = home->latitude_deg;
        waypoints.front().longitude_deg = home->longitude_deg;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const int64_t now = std::chrono::duration_cast<std::chrono::seconds>(Clock::now().time_since_epoch()).count();

    MissionRecord record;
    record.id = nextId(now);
    record.name = name.empty() ? record.id : name;
    record.waypoints = std::move(waypoints);
    record.created_at = now;
    record.home = home;
    missions_.push_back(record);

    if (!saveLocked())
    {
        logger->warn("任务 {} 已创建但未能持久化", record.id);
    }
    logger->info("任务已创建: {} ({}, {}个航点)", record.id, record.name, record.waypoints.size());
    return record;
}

std::optional<MissionRecord> MissionStore::find(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(missions_.begin(), missions_.end(), [&](const MissionRecord &m)
                           { return m.id == id; });
    if (it == missions_.end())
    {
        return std::nullopt;
    }
    return *it;
}

std::vector<MissionRecord> MissionStore::list() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return missions_;
}

bool MissionStore::updateStatus(const std::string &id, const std::string &status)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(missions_.begin(), missions_.end(), [&](const MissionRecord &m)
                           { return m.id == id; });
    if (it == missions_.end())
    {
        return false;
    }
    it->status = status;
    return saveLocked();
}

bool MissionStore::updateProgress(const std::string &id, int waypoint_index)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(missions_.begin(), missions_.end(), [&](const MissionRecord &m)
                           { return m.id == id; });
    if (it == missions_.end() || waypoint_index < 0)
    {
        return false;
    }
    if (it->current_waypoint == waypoint_index)
    {
        return true;
    }
    it->current_waypoint = waypoint_index;
    return saveLocked();
}

bool MissionStore::setHome(const std::string &id, const GeoPoint &home)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(missions_.begin(), missions_.end(), [&](const MissionRecord &m)
                           { return m.id == id; });
    if (it == missions_.end())
    {
        return false;
    }
    it->home = home;
    if (!it->waypoints.empty())
    {
        it->waypoints.front().latitude_deg = home.latitude_deg;
        it->waypoints.front().longitude_deg = home.longitude_deg;
    }
    logging::get_logger()->info("任务 {} 起始点更新为 ({:.7f}, {:.7f})", id, home.latitude_deg, home.longitude_deg);
    return saveLocked();
}

bool MissionStore::remove(const std::string &id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::remove_if(missions_.begin(), missions_.end(), [&](const MissionRecord &m)
                             { return m.id == id; });
    if (it == missions_.end())
    {
        return false;
    }
    missions_.erase(it, missions_.end());
    return saveLocked();
}
