/*
 * Gamepad Device
 *
 * Wraps one opened evdev controller and folds its input events into a
 * RawInput snapshot. Devices with a matching ControllerProfile are mapped
 * through it, everything else falls back to the standard evdev gamepad
 * layout.
 */

#ifndef DECK_RELAY_GAMEPAD_DEVICE_HPP
#define DECK_RELAY_GAMEPAD_DEVICE_HPP

#include "controller_profile.hpp"
#include "state_model.hpp"

#include <libevdev/libevdev.h>
#include <linux/input.h>
#include <memory>
#include <string>

namespace deck_relay {

struct ControllerHandle {
    int fd = -1;
    std::string path;
    std::string name;
    libevdev* dev = nullptr;
    std::shared_ptr<const ControllerProfile> profile;
};

class GamepadDevice {
public:
    explicit GamepadDevice(ControllerHandle handle);
    virtual ~GamepadDevice();

    GamepadDevice(const GamepadDevice&) = delete;
    GamepadDevice& operator=(const GamepadDevice&) = delete;

    // ProfiledGamepad when the handle carries a profile, GenericGamepad otherwise
    static std::unique_ptr<GamepadDevice> create(ControllerHandle handle);

    // Apply one input event to the accumulated state; true if it changed
    virtual bool processEvent(const struct input_event& ev) = 0;

    const RawInput& state() const { return state_; }

    const std::string& getName() const { return handle_.name; }
    const std::string& getPath() const { return handle_.path; }
    int getFd() const { return handle_.fd; }
    libevdev* getDevice() const { return handle_.dev; }

protected:
    ControllerHandle handle_;
    RawInput state_;

    bool setAxis(AxisTarget target, double value);
    bool setButton(Button button, bool pressed);
};

// Mapping driven by a ControllerProfile
class ProfiledGamepad : public GamepadDevice {
public:
    explicit ProfiledGamepad(ControllerHandle handle);

    bool processEvent(const struct input_event& ev) override;
};

// Standard evdev gamepad codes with ranges taken from the device absinfo
class GenericGamepad : public GamepadDevice {
public:
    explicit GenericGamepad(ControllerHandle handle);

    bool processEvent(const struct input_event& ev) override;

private:
    double normalizeStick(unsigned code, int32_t value) const;
    double normalizeTrigger(unsigned code, int32_t value) const;
};

}  // namespace deck_relay

#endif // DECK_RELAY_GAMEPAD_DEVICE_HPP
