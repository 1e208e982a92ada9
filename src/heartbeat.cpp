/*
 * Heartbeat and Reconnect Timing Implementation
 */

#include "heartbeat.hpp"

namespace deck_relay {

HeartbeatMonitor::HeartbeatMonitor(uint64_t interval_ms, uint64_t timeout_ms)
    : interval_ms_(interval_ms), timeout_ms_(timeout_ms) {
}

void HeartbeatMonitor::reset(uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_traffic_ = now;
    last_ping_ = now;
    ping_sent_ = false;
    timed_out_ = false;
}

void HeartbeatMonitor::onTraffic(uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (now > last_traffic_) {
        last_traffic_ = now;
    }
}

bool HeartbeatMonitor::pingDue(uint64_t now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ping_sent_) {
        return true;
    }
    return now >= last_ping_ + interval_ms_;
}

void HeartbeatMonitor::onPingSent(uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_ping_ = now;
    ping_sent_ = true;
}

uint64_t HeartbeatMonitor::onPong(uint64_t echoed_at, uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    latency_ = now >= echoed_at ? now - echoed_at : 0;
    has_latency_ = true;
    if (now > last_traffic_) {
        last_traffic_ = now;
    }
    return latency_;
}

bool HeartbeatMonitor::checkTimeout(uint64_t now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (timed_out_) {
        return false;
    }
    if (now > last_traffic_ && now - last_traffic_ > timeout_ms_) {
        timed_out_ = true;
        return true;
    }
    return false;
}

bool HeartbeatMonitor::hasLatency() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return has_latency_;
}

uint64_t HeartbeatMonitor::lastLatency() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latency_;
}

ReconnectBackoff::ReconnectBackoff(uint64_t initial_ms, uint64_t max_ms, double multiplier)
    : initial_ms_(initial_ms), max_ms_(max_ms < initial_ms ? initial_ms : max_ms),
      multiplier_(multiplier < 1.0 ? 1.0 : multiplier) {
}

uint64_t ReconnectBackoff::delay(unsigned attempt) const {
    double value = static_cast<double>(initial_ms_);
    for (unsigned i = 1; i < attempt; ++i) {
        value *= multiplier_;
        if (value >= static_cast<double>(max_ms_)) {
            return max_ms_;
        }
    }
    return static_cast<uint64_t>(value);
}

}  // namespace deck_relay
