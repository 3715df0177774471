#ifndef MISSION_PLAN_HPP
#define MISSION_PLAN_HPP

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// 地理位置
struct GeoPoint
{
    double latitude_deg = 0.0;
    double longitude_deg = 0.0;
    float relative_altitude_m = 0.0f;
};

// 航点
struct Waypoint
{
    double latitude_deg = 0.0;
    double longitude_deg = 0.0;
    float relative_altitude_m = 0.0f;
    float speed_m_s = 5.0f;
    float yaw_deg = 0.0f;          // NaN 表示不指定航向
    bool is_fly_through = true;    // 是否直接飞过(不停留)
    float loiter_time_s = 0.0f;    // 到达后停留时间
};

void to_json(nlohmann::json &j, const Waypoint &wp);
void from_json(const nlohmann::json &j, Waypoint &wp);

/**
 * @brief 从 QGroundControl 导出的 .plan 文件读取任务航点
 *
 * 文件格式要求：
 * {
 *   "mission": {
 *     "items": [
 *       {
 *         "autoContinue": true, // 是否自动继续到下一个航点
 *         "command": 16,        // 任务命令字段，16=航点，22=起飞，178=改变速度
 *         "frame": 3,           // 坐标系(相对高度)
 *         "params": [ ... ],    // [hold, accept, pass, yaw, lat, lon, alt]
 *       },
 *       ...
 *     ]
 *   }
 * }
 *
 * @param filename .plan 文件路径
 * @param default_speed_m_s 未出现 178 命令时的速度
 * @return 航点列表，解析失败时返回空列表
 */
std::vector<Waypoint> read_qgroundcontrol_plan(const std::string &filename, float default_speed_m_s = 5.0f, float default_altitude_m = 20.0f);

// 从 JSON 内容解析(读取文件后调用，也用于通过消息下发的 plan)；高度为 null 的航点使用 default_altitude_m
std::vector<Waypoint> parse_qgroundcontrol_plan(const nlohmann::json &plan, float default_speed_m_s = 5.0f, float default_altitude_m = 20.0f);

/**
 * @brief 解析操作员指令中的航点数组 [{"lat":..,"lon":..,"alt":..,"speed":..}, ...]
 * 未给出 alt / speed 的航点使用默认值；不是数组时返回空，字段类型错误时抛出 nlohmann::json::exception
 */
std::vector<Waypoint> parse_waypoints(const nlohmann::json &items, float default_speed_m_s, float default_altitude_m);

#endif // MISSION_PLAN_HPP
