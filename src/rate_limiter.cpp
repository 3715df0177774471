#include "rate_limiter.hpp"

void RateLimiter::setCooldown(const std::string &channel, double cooldown_sec)
{
    entries_[channel].cooldown_sec = cooldown_sec;
}

bool RateLimiter::allow(const std::string &channel, TimePoint ts) const
{
    auto it = entries_.find(channel);
    if (it == entries_.end() || !it->second.has_sent)
    {
        return true;
    }
    return seconds_between(it->second.last_sent, ts) >= it->second.cooldown_sec;
}

void RateLimiter::record(const std::string &channel, TimePoint ts)
{
    Entry &entry = entries_[channel];
    entry.has_sent = true;
    entry.last_sent = ts;
}

double RateLimiter::cooldown(const std::string &channel) const
{
    auto it = entries_.find(channel);
    return it == entries_.end() ? 0.0 : it->second.cooldown_sec;
}
