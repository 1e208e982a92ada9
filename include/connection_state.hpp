/*
 * Connection State
 *
 * Owned and published by Session only. Everything else sees immutable
 * snapshots.
 */

#ifndef DECK_RELAY_CONNECTION_STATE_HPP
#define DECK_RELAY_CONNECTION_STATE_HPP

#include <cstdint>
#include <type_traits>
#include <variant>

namespace deck_relay {

struct Disconnected {
    bool operator==(const Disconnected&) const { return true; }
};

struct Connecting {
    bool operator==(const Connecting&) const { return true; }
};

struct Connected {
    uint64_t since = 0;

    bool operator==(const Connected& o) const { return since == o.since; }
};

struct Reconnecting {
    unsigned attempt = 0;
    uint64_t next_retry_at = 0;

    bool operator==(const Reconnecting& o) const {
        return attempt == o.attempt && next_retry_at == o.next_retry_at;
    }
};

using ConnectionState = std::variant<Disconnected, Connecting, Connected, Reconnecting>;

inline const char* connectionStateName(const ConnectionState& state) {
    return std::visit([](const auto& s) -> const char* {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Disconnected>) {
            return "Disconnected";
        } else if constexpr (std::is_same_v<T, Connecting>) {
            return "Connecting";
        } else if constexpr (std::is_same_v<T, Connected>) {
            return "Connected";
        } else {
            static_assert(std::is_same_v<T, Reconnecting>, "unhandled connection state");
            return "Reconnecting";
        }
    }, state);
}

enum class SessionPhase {
    Idle,
    Discovering,
    Listening,
    Connected,
    Reconnecting,
    Terminated,
};

inline const char* sessionPhaseName(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::Idle: return "Idle";
        case SessionPhase::Discovering: return "Discovering";
        case SessionPhase::Listening: return "Listening";
        case SessionPhase::Connected: return "Connected";
        case SessionPhase::Reconnecting: return "Reconnecting";
        case SessionPhase::Terminated: return "Terminated";
    }
    return "Unknown";
}

}  // namespace deck_relay

#endif  // DECK_RELAY_CONNECTION_STATE_HPP
