#include "snapshot_ring.hpp"

#include <algorithm>

SnapshotRing::SnapshotRing(std::size_t slots) : slots_(std::max<std::size_t>(1, slots))
{
}

void SnapshotRing::push(std::vector<unsigned char> jpeg, TimePoint captured_at, uint64_t frame_seq)
{
    if (jpeg.empty())
    {
        return;
    }

    Snapshot snap;
    snap.jpeg = std::make_shared<const std::vector<unsigned char>>(std::move(jpeg));
    snap.captured_at = captured_at;
    snap.frame_seq = frame_seq;

    std::lock_guard<std::mutex> lock(mutex_);
    items_.push_front(std::move(snap));
    while (items_.size() > slots_)
    {
        items_.pop_back();
    }
}

std::optional<Snapshot> SnapshotRing::get(std::size_t n) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (n >= items_.size())
    {
        return std::nullopt;
    }
    return items_[n];
}

std::size_t SnapshotRing::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}
