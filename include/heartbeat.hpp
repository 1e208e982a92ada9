/*
 * Heartbeat and Reconnect Timing
 *
 * HeartbeatMonitor tracks one connection's liveness: when the next Ping is
 * due, when traffic was last seen, and the latest round-trip latency.
 * All times are monotonic milliseconds supplied by the caller.
 */

#ifndef DECK_RELAY_HEARTBEAT_HPP
#define DECK_RELAY_HEARTBEAT_HPP

#include <cstdint>
#include <mutex>

namespace deck_relay {

class HeartbeatMonitor {
public:
    HeartbeatMonitor(uint64_t interval_ms, uint64_t timeout_ms);

    // Start tracking a new connection
    void reset(uint64_t now);

    // Any received message proves the peer is alive
    void onTraffic(uint64_t now);

    bool pingDue(uint64_t now) const;
    void onPingSent(uint64_t now);

    // Records latency = now - echoed_at (0 if the clock went backwards)
    uint64_t onPong(uint64_t echoed_at, uint64_t now);

    // True exactly once per connection, when the silence exceeds the timeout
    bool checkTimeout(uint64_t now);

    bool hasLatency() const;
    uint64_t lastLatency() const;
    uint64_t intervalMs() const { return interval_ms_; }
    uint64_t timeoutMs() const { return timeout_ms_; }

private:
    const uint64_t interval_ms_;
    const uint64_t timeout_ms_;

    mutable std::mutex mutex_;
    uint64_t last_traffic_ = 0;
    uint64_t last_ping_ = 0;
    bool ping_sent_ = false;
    bool timed_out_ = false;
    bool has_latency_ = false;
    uint64_t latency_ = 0;
};

class ReconnectBackoff {
public:
    ReconnectBackoff(uint64_t initial_ms, uint64_t max_ms, double multiplier);

    // Delay before retry number `attempt` (1-based), capped at max_ms
    uint64_t delay(unsigned attempt) const;

private:
    uint64_t initial_ms_;
    uint64_t max_ms_;
    double multiplier_;
};

}  // namespace deck_relay

#endif  // DECK_RELAY_HEARTBEAT_HPP
