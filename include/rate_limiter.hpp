#pragma once

#include "detection_types.hpp"

#include <map>
#include <string>

/**
 * @brief 按通道冷却的限流器
 * 只由告警线程访问，不加锁
 */
class RateLimiter
{
public:
    void setCooldown(const std::string &channel, double cooldown_sec);

    // 距离上次发送不少于冷却时间时允许
    bool allow(const std::string &channel, TimePoint ts) const;

    // 记录一次成功发送
    void record(const std::string &channel, TimePoint ts);

    double cooldown(const std::string &channel) const;

private:
    struct Entry
    {
        double cooldown_sec = 0.0;
        bool has_sent = false;
        TimePoint last_sent;
    };

    std::map<std::string, Entry> entries_;
};
