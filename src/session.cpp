/*
 * Relay Session Implementation
 */

#include "session.hpp"
#include "clock.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <type_traits>
#include <variant>

namespace deck_relay {

namespace {

// Upper bound for any blocking wait on the I/O thread, keeps stop() prompt
const int IO_POLL_MS = 50;

const uint32_t LOOPBACK = 0x7F000001;

// At most this many Pongs wait for the writer; older ones are stale anyway
const size_t MAX_PENDING_PONGS = 8;

}  // namespace

const char* sessionErrorName(SessionError error) {
    switch (error) {
        case SessionError::None: return "none";
        case SessionError::InvalidConfig: return "invalid configuration";
        case SessionError::BindFailed: return "could not bind the relay port";
        case SessionError::MissingComponent: return "missing input source or virtual pad";
    }
    return "unknown";
}

Session::Session(RelayConfig config, SessionComponents components)
    : config_(std::move(config)),
      components_(components),
      discovery_(static_cast<uint16_t>(config_.port),
                 static_cast<int>(config_.discovery.connect_timeout_ms),
                 static_cast<int>(config_.discovery.handshake_timeout_ms)),
      heartbeat_(config_.heartbeat.interval_ms, config_.heartbeat.timeoutMs()),
      backoff_(config_.reconnect.initial_delay_ms, config_.reconnect.max_delay_ms,
               config_.reconnect.multiplier),
      connection_state_(ConnectionState(Disconnected{})),
      peer_controllers_(ControllerList{}) {
}

Session::~Session() {
    stop();
}

SamplerStatus Session::samplerStatus() const {
    return sampler_ ? sampler_->status() : SamplerStatus::NoControllerAvailable;
}

SessionError Session::start() {
    if (running_) {
        return SessionError::None;
    }

    std::string error;
    if (!config_.validate(error)) {
        std::cerr << "session: " << error << std::endl;
        return SessionError::InvalidConfig;
    }

    stopping_ = false;
    discovery_.reset();

    if (config_.role == Role::Source) {
        if (components_.input == nullptr) {
            std::cerr << "session: source role needs an input source" << std::endl;
            return SessionError::MissingComponent;
        }
        if (!transport_.listen(static_cast<uint16_t>(config_.port))) {
            return SessionError::BindFailed;
        }

        sampler_ = std::make_unique<Sampler>(*components_.input, config_.sample_rate_hz);
        sampler_->setEmitCallback([this](const StateModel& state) {
            latest_state_.publish(state);
            {
                std::lock_guard<std::mutex> lock(wake_mutex_);
                state_dirty_ = true;
            }
            wake_cv_.notify_one();
        });

        running_ = true;
        publishState(SessionPhase::Listening, Disconnected{});
        sampler_->start();
        io_thread_ = std::thread(&Session::sourceLoop, this);
    } else {
        if (components_.sink == nullptr) {
            std::cerr << "session: sink role needs a virtual pad" << std::endl;
            return SessionError::MissingComponent;
        }
        if (!config_.discovery.range.empty()) {
            AddressRange::parse(config_.discovery.range, range_);
        }
        applier_ = std::make_unique<Applier>(*components_.sink);

        running_ = true;
        publishState(SessionPhase::Discovering, Connecting{});
        io_thread_ = std::thread(&Session::sinkLoop, this);
    }

    writer_thread_ = std::thread(&Session::writerLoop, this);
    std::cout << "session: started as " << roleName(config_.role) << std::endl;
    return SessionError::None;
}

void Session::stop() {
    if (!running_) {
        return;
    }

    stopping_ = true;
    discovery_.cancel();
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
    }
    stop_cv_.notify_all();
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
    }
    wake_cv_.notify_all();

    if (sampler_) {
        sampler_->stop();
    }
    transport_.disconnect();

    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }
    transport_.disconnect();
    transport_.stopListening();

    {
        std::lock_guard<std::mutex> lock(transition_mutex_);
        connected_generation_ = 0;
        publishState(SessionPhase::Terminated, Disconnected{});
    }
    running_ = false;
    std::cout << "session: stopped" << std::endl;
}

void Session::publishState(SessionPhase phase, ConnectionState state) {
    phase_ = phase;
    connection_state_.publish(state);
    if (listener_) {
        listener_(phase, state);
    }
}

bool Session::waitFor(uint64_t ms) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return !stop_cv_.wait_for(lock, std::chrono::milliseconds(ms), [this] { return stopping_.load(); });
}

void Session::wakeWriter() {
    wake_cv_.notify_one();
}

void Session::onConnected(TcpSocket socket, FrameDecoder decoder, std::vector<std::string> handshake_names) {
    const std::string peer = socket.peerAddress();
    uint64_t generation = transport_.adopt(std::move(socket), std::move(decoder));
    uint64_t now = monotonicMillis();
    heartbeat_.reset(now);

    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        handshake_names_ = std::move(handshake_names);
        pending_pongs_.clear();
    }
    {
        std::lock_guard<std::mutex> lock(transition_mutex_);
        connected_generation_ = generation;
        reconnect_attempt_ = 0;
        publishState(SessionPhase::Connected, Connected{now});
    }

    std::cout << "session: connected to " << peer << std::endl;
    activity_.add(ActivityKind::Info, "Connected to " + peer, now);
    sink_warned_ = false;
    wakeWriter();
}

void Session::connectionLost(uint64_t generation, const char* reason) {
    {
        std::lock_guard<std::mutex> lock(transition_mutex_);
        if (generation == 0 || generation != connected_generation_ || stopping_) {
            // Already handled, or a connection that was replaced
            return;
        }
        connected_generation_ = 0;
        ++connections_lost_;

        if (config_.role == Role::Sink) {
            reconnect_attempt_ = 1;
            next_retry_at_ = monotonicMillis() + backoff_.delay(1);
            publishState(SessionPhase::Reconnecting, Reconnecting{reconnect_attempt_, next_retry_at_});
        } else {
            // The source cannot redial; it waits for the sink to come back
            publishState(SessionPhase::Reconnecting, Reconnecting{0, 0});
        }
    }

    std::cerr << "session: connection lost (" << reason << ")" << std::endl;
    activity_.add(ActivityKind::Info, std::string("Connection lost: ") + reason, monotonicMillis());
    transport_.disconnectIf(generation);
}

void Session::sourceLoop() {
    while (!stopping_) {
        TcpSocket incoming;
        int accept_wait = transport_.isConnected() ? 0 : IO_POLL_MS;
        IoStatus status = transport_.acceptPending(accept_wait, incoming);

        if (status == IoStatus::Ok) {
            ControllerList list{components_.input->controllerNames()};
            if (sendControllerList(incoming, list) == IoStatus::Ok) {
                onConnected(std::move(incoming), FrameDecoder(), list.names);
            } else {
                std::cerr << "session: handshake with " << incoming.peerAddress() << " failed" << std::endl;
            }
        } else if (status == IoStatus::Error && !transport_.isConnected()) {
            waitFor(IO_POLL_MS);
            continue;
        }

        if (transport_.isConnected()) {
            receiveOne(IO_POLL_MS);
        }
    }
}

void Session::sinkLoop() {
    while (!stopping_) {
        if (!transport_.isConnected()) {
            establishSink();
            continue;
        }
        receiveOne(IO_POLL_MS);
    }
}

bool Session::findSource(DiscoveryResult& result) {
    if (!config_.discovery.peer.empty()) {
        uint32_t address = 0;
        parseIpv4(config_.discovery.peer, address);
        return discovery_.probe(address, result);
    }
    if (config_.discovery.localhost_first && discovery_.probe(LOOPBACK, result)) {
        return true;
    }
    return discovery_.scan(range_, result);
}

bool Session::establishSink() {
    unsigned attempt;
    uint64_t retry_at;
    uint32_t peer;
    bool have_peer;
    {
        std::lock_guard<std::mutex> lock(transition_mutex_);
        attempt = reconnect_attempt_;
        retry_at = next_retry_at_;
        peer = last_peer_;
        have_peer = have_peer_;
    }

    DiscoveryResult result;
    bool found;

    if (attempt == 0) {
        // Initial discovery, repeated until something answers
        found = findSource(result);
        if (!found) {
            waitFor(backoff_.delay(1));
            return false;
        }
    } else {
        uint64_t now = monotonicMillis();
        if (retry_at > now && !waitFor(retry_at - now)) {
            return false;
        }
        if (stopping_) {
            return false;
        }

        const unsigned every = config_.reconnect.rediscover_after;
        bool rediscover = !have_peer ||
                          (every > 0 && attempt % every == 0 && config_.discovery.peer.empty());
        if (rediscover) {
            std::cout << "session: reconnect attempt " << attempt << ", rescanning" << std::endl;
            found = findSource(result);
        } else {
            std::cout << "session: reconnect attempt " << attempt << " to " << formatIpv4(peer) << std::endl;
            found = discovery_.probe(peer, result);
        }

        if (!found) {
            std::lock_guard<std::mutex> lock(transition_mutex_);
            if (stopping_) {
                return false;
            }
            ++reconnect_attempt_;
            next_retry_at_ = monotonicMillis() + backoff_.delay(reconnect_attempt_);
            publishState(SessionPhase::Reconnecting, Reconnecting{reconnect_attempt_, next_retry_at_});
            return false;
        }
    }

    if (stopping_) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(transition_mutex_);
        last_peer_ = result.address;
        have_peer_ = true;
    }
    peer_controllers_.publish(result.controllers);
    onConnected(std::move(result.socket), std::move(result.decoder), {});
    return true;
}

void Session::receiveOne(int timeout_ms) {
    Message message;
    uint64_t generation = 0;
    TransportError error = transport_.receive(message, timeout_ms, generation);

    switch (error) {
        case TransportError::None:
            heartbeat_.onTraffic(monotonicMillis());
            dispatch(message, generation);
            break;
        case TransportError::IoFailure:
            connectionLost(generation, "receive failed");
            break;
        case TransportError::Timeout:
        case TransportError::NotConnected:
            // Liveness is the heartbeat's call
            break;
    }
}

void Session::dispatch(const Message& message, uint64_t generation) {
    std::visit([this, generation](const auto& msg) {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, ControllerList>) {
            peer_controllers_.publish(msg);
            std::string joined;
            for (const auto& name : msg.names) {
                joined += (joined.empty() ? "" : ", ") + name;
            }
            activity_.add(ActivityKind::Info, "Controllers: " + (joined.empty() ? std::string("none") : joined),
                          monotonicMillis());
            std::cout << "session: peer controllers: " << (joined.empty() ? "none" : joined) << std::endl;
        } else if constexpr (std::is_same_v<T, ControllerState>) {
            if (config_.role == Role::Sink) {
                handleState(msg.state);
            }
        } else if constexpr (std::is_same_v<T, Ping>) {
            {
                std::lock_guard<std::mutex> lock(wake_mutex_);
                if (pending_pongs_.size() >= MAX_PENDING_PONGS) {
                    pending_pongs_.pop_front();
                }
                pending_pongs_.emplace_back(generation, msg.sent_at);
            }
            wakeWriter();
        } else {
            static_assert(std::is_same_v<T, Pong>, "unhandled message type");
            heartbeat_.onPong(msg.echoed_at, monotonicMillis());
        }
    }, message);
}

void Session::handleState(const StateModel& state) {
    latest_state_.publish(state);
    activity_.record(state, monotonicMillis());

    SinkError error = applier_->apply(state);
    if (error == SinkError::None) {
        ++states_applied_;
        if (sink_warned_) {
            std::cout << "session: virtual pad accepting input again" << std::endl;
            sink_warned_ = false;
        }
    } else if (!sink_warned_) {
        std::cerr << "session: apply failed (" << sinkErrorName(error) << "), will retry" << std::endl;
        sink_warned_ = true;
    }
}

bool Session::sendOrDrop(const Message& message, uint64_t generation) {
    uint64_t used = 0;
    TransportError error = transport_.send(message, used);
    if (error == TransportError::None) {
        return true;
    }
    if (error != TransportError::NotConnected) {
        connectionLost(used == 0 ? generation : used, transportErrorName(error));
    }
    return false;
}

void Session::writerLoop() {
    const uint64_t tick_ms = std::max<uint64_t>(5, std::min<uint64_t>(50, config_.heartbeat.interval_ms / 4));

    uint64_t generation = 0;
    uint64_t sent_version = 0;
    std::vector<std::string> sent_names;

    while (!stopping_) {
        std::deque<std::pair<uint64_t, uint64_t>> pongs;
        bool state_dirty;
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, std::chrono::milliseconds(tick_ms), [this] {
                return stopping_ || state_dirty_ || !pending_pongs_.empty();
            });
            if (stopping_) {
                break;
            }
            pongs.swap(pending_pongs_);
            state_dirty = state_dirty_;
            state_dirty_ = false;

            uint64_t current = connected_generation_;
            if (current != 0 && current != generation) {
                generation = current;
                sent_version = 0;
                sent_names = handshake_names_;
                state_dirty = true;
            }
        }

        if (generation == 0 || connected_generation_ != generation) {
            continue;
        }

        bool alive = true;
        for (const auto& pong : pongs) {
            if (pong.first != generation) {
                continue;
            }
            if (!sendOrDrop(Pong{pong.second}, generation)) {
                alive = false;
                break;
            }
        }

        if (alive && state_dirty && config_.role == Role::Source) {
            uint64_t version = 0;
            auto state = latest_state_.latest(version);
            if (state && version != sent_version) {
                if (sendOrDrop(ControllerState{*state}, generation)) {
                    sent_version = version;
                    ++states_sent_;
                } else {
                    alive = false;
                }
            }
        }

        uint64_t now = monotonicMillis();
        if (alive && heartbeat_.pingDue(now)) {
            if (config_.role == Role::Source) {
                std::vector<std::string> names = components_.input->controllerNames();
                if (names != sent_names) {
                    if (!sendOrDrop(ControllerList{names}, generation)) {
                        continue;
                    }
                    sent_names = std::move(names);
                }
            }
            if (sendOrDrop(Ping{now}, generation)) {
                heartbeat_.onPingSent(now);
            } else {
                continue;
            }
        }

        if (alive && heartbeat_.checkTimeout(monotonicMillis())) {
            connectionLost(generation, "heartbeat timeout");
        }
    }
}

}  // namespace deck_relay
