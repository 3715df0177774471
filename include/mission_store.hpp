#ifndef MISSION_STORE_HPP
#define MISSION_STORE_HPP

#include "mission_plan.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// 任务记录
struct MissionRecord
{
    std::string id;
    std::string name;
    std::vector<Waypoint> waypoints;
    int64_t created_at = 0;       // 创建时间(Unix 秒)
    std::string status{"created"}; // created | running | paused | completed | aborted | error
    int current_waypoint = 0;      // 最近一次记录的航点序号
    std::optional<GeoPoint> home;  // 起始点
};

void to_json(nlohmann::json &j, const MissionRecord &record);
void from_json(const nlohmann::json &j, MissionRecord &record);

/**
 * @brief 基于单个 JSON 文件的任务存储
 * 每次修改后整体写回文件(先写临时文件再重命名)
 */
class MissionStore
{
public:
    explicit MissionStore(std::string path);

    bool load(); // 文件不存在视为空存储
    bool save() const;

    /**
     * @brief 创建任务
     * @param home 起始点，有值时替换第一个航点的经纬度(保留其高度)
     * @return 新任务记录，航点为空时返回空
     */
    std::optional<MissionRecord> create(const std::string &name, std::vector<Waypoint> waypoints, const std::optional<GeoPoint> &home);

    std::optional<MissionRecord> find(const std::string &id) const;
    std::vector<MissionRecord> list() const;
    bool updateStatus(const std::string &id, const std::string &status);
    bool updateProgress(const std::string &id, int waypoint_index);

    // 设置起始点，同时替换第一个航点的经纬度
    bool setHome(const std::string &id, const GeoPoint &home);
    bool remove(const std::string &id);

    const std::string &path() const { return path_; }

private:
    bool saveLocked() const;
    std::string nextId(int64_t now) const;

    std::string path_;
    mutable std::mutex mutex_;
    std::vector<MissionRecord> missions_;
};

#endif // MISSION_STORE_HPP
