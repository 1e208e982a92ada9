/*
 * Gamepad Device Implementation
 */

#include "gamepad_device.hpp"

#include <linux/input-event-codes.h>
#include <unistd.h>

#include <cmath>

namespace deck_relay {

namespace {

bool buttonForKeyCode(unsigned code, Button& out) {
    // xpad layout: BTN_X / BTN_Y are the X and Y face buttons
    switch (code) {
        case BTN_A: out = Button::A; return true;
        case BTN_B: out = Button::B; return true;
        case BTN_X: out = Button::X; return true;
        case BTN_Y: out = Button::Y; return true;
        case BTN_TL: out = Button::LB; return true;
        case BTN_TR: out = Button::RB; return true;
        case BTN_SELECT: out = Button::Back; return true;
        case BTN_START: out = Button::Start; return true;
        case BTN_MODE: out = Button::Guide; return true;
        case BTN_THUMBL: out = Button::L3; return true;
        case BTN_THUMBR: out = Button::R3; return true;
        case BTN_DPAD_UP: out = Button::DpadUp; return true;
        case BTN_DPAD_DOWN: out = Button::DpadDown; return true;
        case BTN_DPAD_LEFT: out = Button::DpadLeft; return true;
        case BTN_DPAD_RIGHT: out = Button::DpadRight; return true;
        default: return false;
    }
}

}  // namespace

GamepadDevice::GamepadDevice(ControllerHandle handle)
    : handle_(std::move(handle)) {
}

GamepadDevice::~GamepadDevice() {
    if (handle_.dev) {
        libevdev_grab(handle_.dev, LIBEVDEV_UNGRAB);
        libevdev_free(handle_.dev);
        handle_.dev = nullptr;
    }
    if (handle_.fd >= 0) {
        close(handle_.fd);
        handle_.fd = -1;
    }
}

std::unique_ptr<GamepadDevice> GamepadDevice::create(ControllerHandle handle) {
    if (handle.profile) {
        return std::make_unique<ProfiledGamepad>(std::move(handle));
    }
    return std::make_unique<GenericGamepad>(std::move(handle));
}

bool GamepadDevice::setAxis(AxisTarget target, double value) {
    double* slot = nullptr;
    switch (target) {
        case AxisTarget::LeftStickX: slot = &state_.left_stick_x; break;
        case AxisTarget::LeftStickY: slot = &state_.left_stick_y; break;
        case AxisTarget::RightStickX: slot = &state_.right_stick_x; break;
        case AxisTarget::RightStickY: slot = &state_.right_stick_y; break;
        case AxisTarget::LeftTrigger: slot = &state_.left_trigger; break;
        case AxisTarget::RightTrigger: slot = &state_.right_trigger; break;
        case AxisTarget::None: return false;
    }
    if (*slot == value) {
        return false;
    }
    *slot = value;
    return true;
}

bool GamepadDevice::setButton(Button button, bool pressed) {
    if (state_.buttons.has(button) == pressed) {
        return false;
    }
    state_.buttons.set(button, pressed);
    return true;
}

ProfiledGamepad::ProfiledGamepad(ControllerHandle handle)
    : GamepadDevice(std::move(handle)) {
}

bool ProfiledGamepad::processEvent(const struct input_event& ev) {
    const ControllerProfile& profile = *handle_.profile;

    if (ev.type == EV_KEY) {
        const ButtonMapping* mapping = profile.button(ev.code);
        // value 2 is autorepeat, still held
        return mapping && setButton(mapping->button, ev.value != 0);
    }
    if (ev.type != EV_ABS) {
        return false;
    }

    if (profile.isDpadAxis(ev.code)) {
        bool changed = false;
        for (const auto& dpad : profile.dpadMappings(ev.code)) {
            changed |= setButton(dpad.button, dpad.value == ev.value);
        }
        return changed;
    }

    const AxisMapping* mapping = profile.axis(ev.code);
    return mapping && setAxis(mapping->target, profile.normalize(ev.code, ev.value));
}

GenericGamepad::GenericGamepad(ControllerHandle handle)
    : GamepadDevice(std::move(handle)) {
}

double GenericGamepad::normalizeStick(unsigned code, int32_t value) const {
    const struct input_absinfo* info = handle_.dev ? libevdev_get_abs_info(handle_.dev, code) : nullptr;
    if (!info || info->maximum <= info->minimum) {
        return 0.0;
    }
    double center = (static_cast<double>(info->maximum) + info->minimum) / 2.0;
    double half = (static_cast<double>(info->maximum) - info->minimum) / 2.0;
    double offset = value - center;
    if (std::abs(offset) <= info->flat) {
        return 0.0;
    }
    return offset / half;
}

double GenericGamepad::normalizeTrigger(unsigned code, int32_t value) const {
    const struct input_absinfo* info = handle_.dev ? libevdev_get_abs_info(handle_.dev, code) : nullptr;
    if (!info || info->maximum <= info->minimum) {
        return 0.0;
    }
    return static_cast<double>(value - info->minimum) / (info->maximum - info->minimum);
}

bool GenericGamepad::processEvent(const struct input_event& ev) {
    if (ev.type == EV_KEY) {
        // Digital-only triggers report full travel
        if (ev.code == BTN_TL2) return setAxis(AxisTarget::LeftTrigger, ev.value ? 1.0 : 0.0);
        if (ev.code == BTN_TR2) return setAxis(AxisTarget::RightTrigger, ev.value ? 1.0 : 0.0);

        Button button;
        if (!buttonForKeyCode(ev.code, button)) return false;
        return setButton(button, ev.value != 0);
    }

    if (ev.type != EV_ABS) {
        return false;
    }

    switch (ev.code) {
        case ABS_X: return setAxis(AxisTarget::LeftStickX, normalizeStick(ev.code, ev.value));
        case ABS_Y: return setAxis(AxisTarget::LeftStickY, -normalizeStick(ev.code, ev.value));
        case ABS_RX: return setAxis(AxisTarget::RightStickX, normalizeStick(ev.code, ev.value));
        case ABS_RY: return setAxis(AxisTarget::RightStickY, -normalizeStick(ev.code, ev.value));
        case ABS_Z: return setAxis(AxisTarget::LeftTrigger, normalizeTrigger(ev.code, ev.value));
        case ABS_RZ: return setAxis(AxisTarget::RightTrigger, normalizeTrigger(ev.code, ev.value));
        case ABS_HAT0X: {
            bool changed = setButton(Button::DpadLeft, ev.value < 0);
            changed |= setButton(Button::DpadRight, ev.value > 0);
            return changed;
        }
        case ABS_HAT0Y: {
            bool changed = setButton(Button::DpadUp, ev.value < 0);
            changed |= setButton(Button::DpadDown, ev.value > 0);
            return changed;
        }
        default:
            return false;
    }
}

}  // namespace deck_relay
