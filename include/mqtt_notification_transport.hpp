#ifndef MQTT_NOTIFICATION_TRANSPORT_HPP
#define MQTT_NOTIFICATION_TRANSPORT_HPP

#include "mqtt_client.hpp"
#include "notification_transport.hpp"

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// 图片 MD5 校验值(小写十六进制)
std::string md5_hex(const std::vector<unsigned char> &data);

std::string base64_encode(const std::vector<unsigned char> &data);

/**
 * @brief 告警消息体
 * {
 *   "channel": "fire",
 *   "text": "...",            // 告警正文
 *   "geo_link": "..." | null,
 *   "image": "<base64 jpeg>", // 无图片时为空字符串
 *   "image_size": 12345,
 *   "image_md5": "...",
 *   "sent_at": "2024-05-01T12:00:00.000"
 * }
 */
nlohmann::json build_alert_payload(const std::string &channel,
                                   const std::string &text,
                                   const std::vector<unsigned char> &image,
                                   const std::optional<std::string> &geo_link);

/**
 * @brief 通过 MQTT 发布告警，主题 <prefix>/alerts/<channel>，QoS 1
 */
class MqttNotificationTransport : public NotificationTransport
{
public:
    MqttNotificationTransport(Mqtt &client, std::chrono::milliseconds send_timeout);

    bool send(const std::string &channel,
              const std::string &text,
              const std::vector<unsigned char> &image,
              const std::optional<std::string> &geo_link) override;

private:
    Mqtt &client_;
    std::chrono::milliseconds send_timeout_;
};

#endif // MQTT_NOTIFICATION_TRANSPORT_HPP
