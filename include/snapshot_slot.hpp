/*
 * Snapshot Slot
 *
 * Single-writer / multiple-reader handoff of immutable values. The writer
 * publishes a new shared_ptr<const T>; readers grab the current pointer and
 * keep using it without further locking. Only the newest value is kept.
 */

#ifndef DECK_RELAY_SNAPSHOT_SLOT_HPP
#define DECK_RELAY_SNAPSHOT_SLOT_HPP

#include <cstdint>
#include <memory>
#include <mutex>

namespace deck_relay {

template <typename T>
class SnapshotSlot {
public:
    SnapshotSlot() = default;
    explicit SnapshotSlot(T initial)
        : value_(std::make_shared<const T>(std::move(initial))), version_(1) {}

    SnapshotSlot(const SnapshotSlot&) = delete;
    SnapshotSlot& operator=(const SnapshotSlot&) = delete;

    // Returns the version assigned to the published value
    uint64_t publish(T value) {
        auto next = std::make_shared<const T>(std::move(value));
        std::lock_guard<std::mutex> lock(mutex_);
        value_ = std::move(next);
        return ++version_;
    }

    std::shared_ptr<const T> latest() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

    std::shared_ptr<const T> latest(uint64_t& version) const {
        std::lock_guard<std::mutex> lock(mutex_);
        version = version_;
        return value_;
    }

    uint64_t version() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return version_;
    }

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const T> value_;
    uint64_t version_ = 0;
};

}  // namespace deck_relay

#endif  // DECK_RELAY_SNAPSHOT_SLOT_HPP
