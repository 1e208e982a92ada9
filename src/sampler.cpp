/*
 * Sampler Implementation
 */

#include "sampler.hpp"
#include "clock.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

namespace deck_relay {

const char* samplerStatusName(SamplerStatus status) {
    switch (status) {
        case SamplerStatus::Active: return "active";
        case SamplerStatus::NoControllerAvailable: return "no controller available";
    }
    return "unknown";
}

Sampler::Sampler(InputSource& source, double rate_hz)
    : source_(source), rate_hz_(rate_hz > 0.0 ? rate_hz : 60.0) {
}

Sampler::~Sampler() {
    stop();
}

void Sampler::start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread(&Sampler::run, this);
}

void Sampler::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wait_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool Sampler::sampleOnce(uint64_t now) {
    RawInput raw;
    if (!source_.readState(raw)) {
        reportStatus(SamplerStatus::NoControllerAvailable);
        return false;
    }
    reportStatus(SamplerStatus::Active);

    // Timestamps never go backwards for one source
    last_timestamp_ = std::max(last_timestamp_, now);
    StateModel state = StateModel::fromRaw(raw, last_timestamp_);
    ++emitted_;
    if (emit_callback_) {
        emit_callback_(state);
    }
    return true;
}

void Sampler::reportStatus(SamplerStatus status) {
    if (status_reported_ && status_ == status) {
        return;
    }
    status_reported_ = true;
    status_ = status;
    if (status == SamplerStatus::NoControllerAvailable) {
        std::cerr << "sampler: no controller available, waiting" << std::endl;
    } else {
        std::cout << "sampler: controller active, sampling at " << rate_hz_ << " Hz" << std::endl;
    }
    if (status_callback_) {
        status_callback_(status);
    }
}

void Sampler::run() {
    using clock = std::chrono::steady_clock;
    const auto period = std::chrono::duration_cast<clock::duration>(
        std::chrono::duration<double>(1.0 / rate_hz_));
    auto next_tick = clock::now();

    while (running_) {
        sampleOnce(monotonicMillis());

        next_tick += period;
        auto now = clock::now();
        if (next_tick < now) {
            // Fell behind (slow device read); skip missed ticks instead of bursting
            next_tick = now;
        }

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_until(lock, next_tick, [this] { return !running_; });
    }
}

}  // namespace deck_relay
