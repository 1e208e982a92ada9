/*
 * Applier
 *
 * Drives a VirtualPadSink from received StateModel snapshots. Every field
 * maps 1:1 onto the report, so applying the same state twice submits the
 * same report twice.
 */

#ifndef DECK_RELAY_APPLIER_HPP
#define DECK_RELAY_APPLIER_HPP

#include "state_model.hpp"
#include "virtual_pad.hpp"

#include <cstdint>

namespace deck_relay {

// Sticks scale to +-32767, triggers to 0..255, rounding to nearest
PadReport toReport(const StateModel& state);

class Applier {
public:
    explicit Applier(VirtualPadSink& sink);

    SinkError apply(const StateModel& state);

    const PadReport& lastReport() const { return last_report_; }
    uint64_t appliedCount() const { return applied_; }

private:
    VirtualPadSink& sink_;
    PadReport last_report_;
    uint64_t applied_ = 0;
};

}  // namespace deck_relay

#endif  // DECK_RELAY_APPLIER_HPP
