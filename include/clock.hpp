/*
 * Monotonic Clock
 *
 * Millisecond timestamps used for StateModel, heartbeat and backoff timing.
 * The epoch is arbitrary (steady_clock); values are only compared on the
 * host that produced them.
 */

#ifndef DECK_RELAY_CLOCK_HPP
#define DECK_RELAY_CLOCK_HPP

#include <chrono>
#include <cstdint>

namespace deck_relay {

inline uint64_t monotonicMillis() {
    auto now = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

}  // namespace deck_relay

#endif  // DECK_RELAY_CLOCK_HPP
