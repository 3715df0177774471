#include "mqtt_notification_transport.hpp"
#include "detection_types.hpp"
#include "logger.hpp"

#include <cstdio>

#include <openssl/evp.h>
#include <openssl/md5.h>

using json = nlohmann::json;

/**
 * @brief 计算数据的MD5校验和
 */
std::string md5_hex(const std::vector<unsigned char> &data)
{
    MD5_CTX md5Context;
    MD5_Init(&md5Context);
    MD5_Update(&md5Context, data.data(), data.size());

    unsigned char digest[MD5_DIGEST_LENGTH];
    MD5_Final(digest, &md5Context);

    char mdString[33];
    for (int i = 0; i < 16; i++)
    {
        std::snprintf(&mdString[i * 2], 3, "%02x", static_cast<unsigned int>(digest[i]));
    }
    return std::string(mdString, 32);
}

std::string base64_encode(const std::vector<unsigned char> &data)
{
    if (data.empty())
    {
        return std::string();
    }

    std::string out(4 * ((data.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]), data.data(), static_cast<int>(data.size()));
    out.resize(written > 0 ? static_cast<std::size_t>(written) : 0);
    return out;
}

json build_alert_payload(const std::string &channel,
                         const std::string &text,
                         const std::vector<unsigned char> &image,
                         const std::optional<std::string> &geo_link)
{
    json j;
    j["channel"] = channel;
    j["text"] = text;
    j["geo_link"] = geo_link ? json(*geo_link) : json(nullptr);
    j["image"] = base64_encode(image);
    j["image_size"] = image.size();
    j["image_md5"] = image.empty() ? std::string() : md5_hex(image);
    j["sent_at"] = format_iso_time(Clock::now());
    return j;
}

MqttNotificationTransport::MqttNotificationTransport(Mqtt &client, std::chrono::milliseconds send_timeout)
    : client_(client), send_timeout_(send_timeout)
{
}

bool MqttNotificationTransport::send(const std::string &channel,
                                     const std::string &text,
                                     const std::vector<unsigned char> &image,
                                     const std::optional<std::string> &geo_link)
{
    const std::string payload = build_alert_payload(channel, text, image, geo_link).dump();
    const std::string topic = client_.topic("alerts/" + channel);

    const bool ok = client_.sendMessage(topic, payload.data(), payload.size(), 1, send_timeout_);
    if (!ok)
    {
        logging::get_logger()->warn("[alert] MQTT 发布 {} 失败 ({} 字节)", topic, payload.size());
    }
    return ok;
}
