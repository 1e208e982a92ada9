/*
 * uinput Xbox 360 Pad
 *
 * Linux VirtualPadSink: a virtual "Microsoft X-Box 360 pad" created through
 * /dev/uinput. Games and SDL pick it up like a wired 360 controller.
 */

#ifndef DECK_RELAY_UINPUT_PAD_HPP
#define DECK_RELAY_UINPUT_PAD_HPP

#include "virtual_pad.hpp"

#include <atomic>
#include <string>

namespace deck_relay {

class UinputPad : public VirtualPadSink {
public:
    static constexpr uint16_t VENDOR_ID = 0x045e;
    static constexpr uint16_t PRODUCT_ID = 0x028e;
    static constexpr uint64_t RETRY_INTERVAL_MS = 5000;

    explicit UinputPad(std::string device_path = "/dev/uinput");
    ~UinputPad() override;

    UinputPad(const UinputPad&) = delete;
    UinputPad& operator=(const UinputPad&) = delete;

    // Opens uinput and registers the device; false with a message on stderr
    bool create(const std::string& name = "Microsoft X-Box 360 pad");
    void destroy();

    // Retries create() at most every RETRY_INTERVAL_MS until the device exists
    bool ensureCreated(uint64_t now);
    unsigned createAttempts() const { return create_attempts_; }

    bool isReady() const override { return fd_ >= 0; }
    SinkError submit(const PadReport& report) override;

private:
    std::string device_path_;
    std::atomic<int> fd_{-1};  // created on the main thread, written by the session
    unsigned create_attempts_ = 0;
    uint64_t last_attempt_ = 0;
};

}  // namespace deck_relay

#endif  // DECK_RELAY_UINPUT_PAD_HPP
