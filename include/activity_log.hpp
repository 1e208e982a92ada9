/*
 * Activity Log
 *
 * Rolling record of input changes seen by the sink, read by the debug
 * console. Button edges are always logged; analog values only when they
 * move by more than ANALOG_THRESHOLD.
 */

#ifndef DECK_RELAY_ACTIVITY_LOG_HPP
#define DECK_RELAY_ACTIVITY_LOG_HPP

#include "state_model.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace deck_relay {

constexpr float ANALOG_THRESHOLD = 0.1f;
constexpr size_t ACTIVITY_LOG_CAPACITY = 100;

enum class ActivityKind {
    Button,
    Axis,
    Info,  // connection and controller list events
};

struct ActivityEntry {
    uint64_t received_at = 0;
    ActivityKind kind = ActivityKind::Button;
    std::string details;  // "Button A: PRESSED", "Left-X: 0.50"
};

// Lines describing what changed between two consecutive states
std::vector<std::string> describeButtonChanges(const StateModel& previous, const StateModel& current);
std::vector<std::string> describeAxisChanges(const StateModel& previous, const StateModel& current);

class ActivityLog {
public:
    explicit ActivityLog(size_t capacity = ACTIVITY_LOG_CAPACITY);

    // Diffs against the previously recorded state; returns entries added
    size_t record(const StateModel& state, uint64_t received_at);

    void add(ActivityKind kind, std::string details, uint64_t received_at);

    // Oldest first
    std::vector<ActivityEntry> snapshot() const;

    size_t size() const;
    uint64_t totalRecorded() const;
    void clear();

private:
    const size_t capacity_;

    mutable std::mutex mutex_;
    std::deque<ActivityEntry> entries_;
    StateModel previous_;
    uint64_t total_ = 0;

    void push(ActivityEntry entry);
};

}  // namespace deck_relay

#endif  // DECK_RELAY_ACTIVITY_LOG_HPP
