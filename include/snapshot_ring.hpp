#pragma once

#include "detection_types.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

// 明火确认时的抓拍
struct Snapshot
{
    std::shared_ptr<const std::vector<unsigned char>> jpeg;
    TimePoint captured_at;
    uint64_t frame_seq = 0;
};

/**
 * @brief 最近 N 张明火抓拍
 * get(0) 为最新一张
 */
class SnapshotRing
{
public:
    explicit SnapshotRing(std::size_t slots);

    void push(std::vector<unsigned char> jpeg, TimePoint captured_at, uint64_t frame_seq);
    std::optional<Snapshot> get(std::size_t n) const;

    std::size_t size() const;
    std::size_t slots() const { return slots_; }

private:
    std::size_t slots_;
    mutable std::mutex mutex_;
    std::deque<Snapshot> items_; // 头部为最新
};
