/*
 * Virtual Pad Sink
 *
 * Boundary to the virtual Xbox 360 controller. A sink accepts one fixed-shape
 * report at a time; how it reaches the OS is up to the implementation.
 */

#ifndef DECK_RELAY_VIRTUAL_PAD_HPP
#define DECK_RELAY_VIRTUAL_PAD_HPP

#include <cstdint>

namespace deck_relay {

// XUSB-style report: button mask uses the Button bit layout,
// thumbs are -32768..32767 with positive Y meaning up.
struct PadReport {
    uint16_t buttons = 0;
    uint8_t left_trigger = 0;
    uint8_t right_trigger = 0;
    int16_t thumb_lx = 0;
    int16_t thumb_ly = 0;
    int16_t thumb_rx = 0;
    int16_t thumb_ry = 0;

    bool operator==(const PadReport& o) const;
    bool operator!=(const PadReport& o) const { return !(*this == o); }
};

enum class SinkError {
    None,
    NotReady,      // virtual device not created
    WriteFailure,  // device rejected the report
};

const char* sinkErrorName(SinkError error);

class VirtualPadSink {
public:
    virtual ~VirtualPadSink() = default;

    virtual bool isReady() const = 0;
    virtual SinkError submit(const PadReport& report) = 0;
};

}  // namespace deck_relay

#endif  // DECK_RELAY_VIRTUAL_PAD_HPP
