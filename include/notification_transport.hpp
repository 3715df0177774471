#pragma once

#include <optional>
#include <string>
#include <vector>

/**
 * @brief 告警发送通道
 * send 同步返回，实现内部自行限定等待时间
 */
class NotificationTransport
{
public:
    virtual ~NotificationTransport() = default;

    virtual bool send(const std::string &channel,
                      const std::string &text,
                      const std::vector<unsigned char> &image,
                      const std::optional<std::string> &geo_link) = 0;
};
