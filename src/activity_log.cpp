/*
 * Activity Log Implementation
 */

#include "activity_log.hpp"

#include <cmath>
#include <cstdio>

namespace deck_relay {

namespace {

struct AxisField {
    const char* name;
    float (StateModel::*get)() const;
};

const AxisField AXIS_FIELDS[] = {
    {"Left-X", &StateModel::leftStickX},
    {"Left-Y", &StateModel::leftStickY},
    {"Right-X", &StateModel::rightStickX},
    {"Right-Y", &StateModel::rightStickY},
    {"LT", &StateModel::leftTrigger},
    {"RT", &StateModel::rightTrigger},
};

std::string format_axis(const char* name, float value) {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%s: %.2f", name, static_cast<double>(value));
    return buf;
}

}  // namespace

std::vector<std::string> describeButtonChanges(const StateModel& previous, const StateModel& current) {
    std::vector<std::string> lines;
    for (Button b : kAllButtons) {
        bool was = previous.pressed(b);
        bool is = current.pressed(b);
        if (was != is) {
            lines.push_back(std::string("Button ") + buttonName(b) + (is ? ": PRESSED" : ": RELEASED"));
        }
    }
    return lines;
}

std::vector<std::string> describeAxisChanges(const StateModel& previous, const StateModel& current) {
    std::vector<std::string> lines;
    for (const auto& field : AXIS_FIELDS) {
        float before = (previous.*field.get)();
        float after = (current.*field.get)();
        if (std::fabs(after - before) > ANALOG_THRESHOLD) {
            lines.push_back(format_axis(field.name, after));
        }
    }
    return lines;
}

ActivityLog::ActivityLog(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
}

size_t ActivityLog::record(const StateModel& state, uint64_t received_at) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t added = 0;
    for (auto& line : describeButtonChanges(previous_, state)) {
        push(ActivityEntry{received_at, ActivityKind::Button, std::move(line)});
        ++added;
    }

    // Each axis is compared against its last logged value, so a slow drift
    // is still reported once it adds up past the threshold.
    float logged[6];
    for (size_t i = 0; i < 6; ++i) {
        logged[i] = (previous_.*AXIS_FIELDS[i].get)();
        float now = (state.*AXIS_FIELDS[i].get)();
        if (std::fabs(now - logged[i]) > ANALOG_THRESHOLD) {
            push(ActivityEntry{received_at, ActivityKind::Axis, format_axis(AXIS_FIELDS[i].name, now)});
            logged[i] = now;
            ++added;
        }
    }

    previous_ = StateModel(logged[0], logged[1], logged[2], logged[3], logged[4], logged[5],
                           state.buttons(), state.timestamp());
    return added;
}

void ActivityLog::add(ActivityKind kind, std::string details, uint64_t received_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    push(ActivityEntry{received_at, kind, std::move(details)});
}

void ActivityLog::push(ActivityEntry entry) {
    entries_.push_back(std::move(entry));
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }
    ++total_;
}

std::vector<ActivityEntry> ActivityLog::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<ActivityEntry>(entries_.begin(), entries_.end());
}

size_t ActivityLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

uint64_t ActivityLog::totalRecorded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

void ActivityLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    previous_ = StateModel();
}

}  // namespace deck_relay
