/*
 * Relay Session
 *
 * Orchestrates one role of the relay.
 *
 * Source: Sampler -> Codec -> Transport. Listens on the configured port,
 * greets every new peer with its ControllerList and streams the newest
 * StateModel; older unsent samples are dropped.
 *
 * Sink: Transport -> Codec -> Applier. Discovers or dials the source,
 * applies every received state to the virtual pad and keeps the activity
 * log, redialing with capped exponential backoff when the link drops.
 *
 * Both roles run the Ping/Pong heartbeat. Session is the only writer of the
 * ConnectionState; readers get immutable snapshots.
 *
 * Threads: the I/O thread accepts/dials and receives, the writer thread is
 * the only one sending, the Sampler has its own. No lock is held while a
 * socket call blocks.
 */

#ifndef DECK_RELAY_SESSION_HPP
#define DECK_RELAY_SESSION_HPP

#include "activity_log.hpp"
#include "address_range.hpp"
#include "applier.hpp"
#include "connection_state.hpp"
#include "discovery.hpp"
#include "heartbeat.hpp"
#include "input_source.hpp"
#include "relay_config.hpp"
#include "sampler.hpp"
#include "snapshot_slot.hpp"
#include "transport.hpp"
#include "virtual_pad.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace deck_relay {

enum class SessionError {
    None,
    InvalidConfig,
    BindFailed,
    MissingComponent,
};

const char* sessionErrorName(SessionError error);

// Collaborators owned by the caller; they must outlive the Session
struct SessionComponents {
    InputSource* input = nullptr;     // required for the source role
    VirtualPadSink* sink = nullptr;   // required for the sink role
};

class Session {
public:
    // Called on every ConnectionState change, from the thread that caused it.
    // Must not call stop().
    using StateListener = std::function<void(SessionPhase, const ConnectionState&)>;

    Session(RelayConfig config, SessionComponents components);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void setStateListener(StateListener listener) { listener_ = std::move(listener); }

    // Terminal configuration problems are returned here; everything after
    // start() is recovered internally.
    SessionError start();
    void stop();
    bool isRunning() const { return running_; }

    const RelayConfig& config() const { return config_; }

    SessionPhase phase() const { return phase_; }
    std::shared_ptr<const ConnectionState> connectionState() const { return connection_state_.latest(); }
    std::shared_ptr<const StateModel> latestState() const { return latest_state_.latest(); }
    std::shared_ptr<const ControllerList> peerControllers() const { return peer_controllers_.latest(); }
    const ActivityLog& activity() const { return activity_; }

    uint16_t boundPort() const { return transport_.listenPort(); }
    std::string peerAddress() const { return transport_.peerAddress(); }
    bool hasLatency() const { return heartbeat_.hasLatency(); }
    uint64_t lastLatency() const { return heartbeat_.lastLatency(); }
    uint64_t malformedCount() const { return transport_.malformedCount(); }
    uint64_t statesSent() const { return states_sent_; }
    uint64_t statesApplied() const { return states_applied_; }
    uint64_t connectionsLost() const { return connections_lost_; }
    size_t discoveryAttempts() const { return discovery_.attempts(); }
    SamplerStatus samplerStatus() const;

private:
    RelayConfig config_;
    SessionComponents components_;
    StateListener listener_;

    Transport transport_;
    Discovery discovery_;
    HeartbeatMonitor heartbeat_;
    ReconnectBackoff backoff_;
    AddressRange range_;
    std::unique_ptr<Sampler> sampler_;
    std::unique_ptr<Applier> applier_;
    ActivityLog activity_;

    SnapshotSlot<ConnectionState> connection_state_;
    SnapshotSlot<StateModel> latest_state_;
    SnapshotSlot<ControllerList> peer_controllers_;

    std::atomic<SessionPhase> phase_{SessionPhase::Idle};
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};

    // Connection bookkeeping, guarded by transition_mutex_
    std::mutex transition_mutex_;
    std::atomic<uint64_t> connected_generation_{0};
    unsigned reconnect_attempt_ = 0;
    uint64_t next_retry_at_ = 0;
    uint32_t last_peer_ = 0;
    bool have_peer_ = false;

    // Writer hand-off, guarded by wake_mutex_
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    std::deque<std::pair<uint64_t, uint64_t>> pending_pongs_;  // generation, echoed_at
    bool state_dirty_ = false;
    std::vector<std::string> handshake_names_;

    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;

    std::atomic<uint64_t> states_sent_{0};
    std::atomic<uint64_t> states_applied_{0};
    std::atomic<uint64_t> connections_lost_{0};
    bool sink_warned_ = false;

    std::thread io_thread_;
    std::thread writer_thread_;

    void sourceLoop();
    void sinkLoop();
    void writerLoop();

    bool establishSink();
    bool findSource(DiscoveryResult& result);
    void receiveOne(int timeout_ms);
    void dispatch(const Message& message, uint64_t generation);
    void handleState(const StateModel& state);

    void onConnected(TcpSocket socket, FrameDecoder decoder, std::vector<std::string> handshake_names);
    void connectionLost(uint64_t generation, const char* reason);
    void publishState(SessionPhase phase, ConnectionState state);

    bool sendOrDrop(const Message& message, uint64_t generation);
    void wakeWriter();

    // Sleeps up to `ms`; false if the session is stopping
    bool waitFor(uint64_t ms);
};

}  // namespace deck_relay

#endif  // DECK_RELAY_SESSION_HPP
