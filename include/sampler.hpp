/*
 * Sampler
 *
 * Polls an InputSource at a fixed rate and emits one StateModel per tick,
 * unchanged samples included so the receiver's view stays fresh.
 * When no controller is present nothing is emitted and the status callback
 * reports NoControllerAvailable; sampling keeps running.
 */

#ifndef DECK_RELAY_SAMPLER_HPP
#define DECK_RELAY_SAMPLER_HPP

#include "input_source.hpp"
#include "state_model.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace deck_relay {

enum class SamplerStatus {
    Active,
    NoControllerAvailable,
};

const char* samplerStatusName(SamplerStatus status);

class Sampler {
public:
    using EmitCallback = std::function<void(const StateModel&)>;
    using StatusCallback = std::function<void(SamplerStatus)>;

    Sampler(InputSource& source, double rate_hz);
    ~Sampler();

    Sampler(const Sampler&) = delete;
    Sampler& operator=(const Sampler&) = delete;

    void setEmitCallback(EmitCallback callback) { emit_callback_ = std::move(callback); }
    void setStatusCallback(StatusCallback callback) { status_callback_ = std::move(callback); }

    void start();
    void stop();
    bool isRunning() const { return running_; }

    // One sampling tick at time `now`; returns true if a snapshot was emitted
    bool sampleOnce(uint64_t now);

    SamplerStatus status() const { return status_; }
    uint64_t emittedCount() const { return emitted_; }

private:
    InputSource& source_;
    double rate_hz_;
    EmitCallback emit_callback_;
    StatusCallback status_callback_;

    std::atomic<bool> running_{false};
    std::atomic<SamplerStatus> status_{SamplerStatus::Active};
    std::atomic<uint64_t> emitted_{0};
    bool status_reported_ = false;
    uint64_t last_timestamp_ = 0;

    std::thread thread_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    void run();
    void reportStatus(SamplerStatus status);
};

}  // namespace deck_relay

#endif  // DECK_RELAY_SAMPLER_HPP
