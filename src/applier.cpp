/*
 * Applier Implementation
 */

#include "applier.hpp"

#include <cmath>

namespace deck_relay {

namespace {

int16_t scale_thumb(float value) {
    return static_cast<int16_t>(std::lround(static_cast<double>(value) * 32767.0));
}

uint8_t scale_trigger(float value) {
    return static_cast<uint8_t>(std::lround(static_cast<double>(value) * 255.0));
}

}  // namespace

PadReport toReport(const StateModel& state) {
    PadReport report;
    report.buttons = state.buttons().mask();
    report.left_trigger = scale_trigger(state.leftTrigger());
    report.right_trigger = scale_trigger(state.rightTrigger());
    report.thumb_lx = scale_thumb(state.leftStickX());
    report.thumb_ly = scale_thumb(state.leftStickY());
    report.thumb_rx = scale_thumb(state.rightStickX());
    report.thumb_ry = scale_thumb(state.rightStickY());
    return report;
}

Applier::Applier(VirtualPadSink& sink)
    : sink_(sink) {
}

SinkError Applier::apply(const StateModel& state) {
    if (!sink_.isReady()) {
        return SinkError::NotReady;
    }

    PadReport report = toReport(state);
    SinkError result = sink_.submit(report);
    if (result == SinkError::None) {
        last_report_ = report;
        ++applied_;
    }
    return result;
}

}  // namespace deck_relay
