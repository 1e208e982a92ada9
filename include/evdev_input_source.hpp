/*
 * Evdev Input Source
 *
 * Finds Xbox (and compatible) controllers via evdev, including the Steam
 * Deck's built-in gamepad, and exposes the first one found as an InputSource.
 * Rescans periodically while no controller is open.
 */

#ifndef DECK_RELAY_EVDEV_INPUT_SOURCE_HPP
#define DECK_RELAY_EVDEV_INPUT_SOURCE_HPP

#include "controller_profile.hpp"
#include "gamepad_device.hpp"
#include "input_source.hpp"

#include <ctime>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace deck_relay {

class EvdevInputSource : public InputSource {
public:
    explicit EvdevInputSource(std::string profile_dir, std::string input_dir = "/dev/input");
    ~EvdevInputSource() override;

    bool readState(RawInput& out) override;
    std::vector<std::string> controllerNames() const override;

    // Open the first usable controller; false if none was found
    bool rescan();

private:
    ProfileLibrary profiles_;
    std::string input_dir_;
    std::unique_ptr<GamepadDevice> device_;
    time_t last_rescan_ = 0;
    mutable std::mutex names_mutex_;
    std::vector<std::string> names_;

    void drainEvents();
    void closeDevice();
};

}  // namespace deck_relay

#endif  // DECK_RELAY_EVDEV_INPUT_SOURCE_HPP
