#ifndef OPERATOR_COMMANDS_HPP
#define OPERATOR_COMMANDS_HPP

#include "mission_api.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

/**
 * @brief 操作员指令处理
 *
 * 指令格式：
 * {
 *   "command": "start_sequence", // 指令名
 *   "mission_id": "mission_1700000000",
 *   ...                          // 指令参数
 * }
 * 回复格式：{"command": ..., "ok": true/false, "message": ..., "data": {...}}
 */
class OperatorCommandHandler
{
public:
    OperatorCommandHandler(MissionApi &api, float default_speed_m_s, float default_altitude_m);

    // 处理已解析的指令
    nlohmann::json handle(const nlohmann::json &msg);

    // 处理 MQTT/HTTP 原始负载，返回序列化后的回复
    std::string handlePayload(const std::vector<unsigned char> &payload);
    std::string handlePayload(const std::string &payload);

private:
    ApiResult createMission(const nlohmann::json &msg);
    ApiResult setHome(const nlohmann::json &msg);

    MissionApi &api_;
    float default_speed_m_s_;
    float default_altitude_m_;
};

#endif // OPERATOR_COMMANDS_HPP
