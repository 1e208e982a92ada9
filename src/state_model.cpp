/*
 * Controller State Model Implementation
 */

#include "state_model.hpp"

#include <algorithm>
#include <cmath>

namespace deck_relay {

namespace {

struct ButtonNameEntry {
    Button button;
    const char* name;
};

const ButtonNameEntry BUTTON_NAMES[] = {
    {Button::A, "A"},
    {Button::B, "B"},
    {Button::X, "X"},
    {Button::Y, "Y"},
    {Button::LB, "LB"},
    {Button::RB, "RB"},
    {Button::Start, "Start"},
    {Button::Back, "Back"},
    {Button::Guide, "Guide"},
    {Button::DpadUp, "Dpad-Up"},
    {Button::DpadDown, "Dpad-Down"},
    {Button::DpadLeft, "Dpad-Left"},
    {Button::DpadRight, "Dpad-Right"},
    {Button::L3, "L3"},
    {Button::R3, "R3"},
};

float clampTo(double value, double lo, double hi) {
    if (std::isnan(value)) {
        return 0.0f;
    }
    return static_cast<float>(std::max(lo, std::min(hi, value)));
}

}  // namespace

const char* buttonName(Button button) {
    for (const auto& entry : BUTTON_NAMES) {
        if (entry.button == button) {
            return entry.name;
        }
    }
    return "?";
}

bool buttonFromName(const std::string& name, Button& out) {
    for (const auto& entry : BUTTON_NAMES) {
        if (name == entry.name) {
            out = entry.button;
            return true;
        }
    }
    // Aliases seen in evdev-style configs
    if (name == "Select") { out = Button::Back; return true; }
    if (name == "Mode" || name == "Home") { out = Button::Guide; return true; }
    if (name == "LS" || name == "LSB") { out = Button::L3; return true; }
    if (name == "RS" || name == "RSB") { out = Button::R3; return true; }
    return false;
}

void ButtonSet::set(Button b, bool pressed) {
    if (pressed) {
        mask_ = static_cast<uint16_t>(mask_ | static_cast<uint16_t>(b));
    } else {
        mask_ = static_cast<uint16_t>(mask_ & ~static_cast<uint16_t>(b));
    }
}

float clampStick(double value) {
    return clampTo(value, -1.0, 1.0);
}

float clampTrigger(double value) {
    return clampTo(value, 0.0, 1.0);
}

StateModel::StateModel(float left_stick_x, float left_stick_y,
                       float right_stick_x, float right_stick_y,
                       float left_trigger, float right_trigger,
                       ButtonSet buttons, uint64_t timestamp)
    : left_stick_x_(clampStick(left_stick_x)),
      left_stick_y_(clampStick(left_stick_y)),
      right_stick_x_(clampStick(right_stick_x)),
      right_stick_y_(clampStick(right_stick_y)),
      left_trigger_(clampTrigger(left_trigger)),
      right_trigger_(clampTrigger(right_trigger)),
      buttons_(buttons),
      timestamp_(timestamp) {
}

StateModel StateModel::fromRaw(const RawInput& raw, uint64_t timestamp) {
    return StateModel(clampStick(raw.left_stick_x), clampStick(raw.left_stick_y),
                      clampStick(raw.right_stick_x), clampStick(raw.right_stick_y),
                      clampTrigger(raw.left_trigger), clampTrigger(raw.right_trigger),
                      raw.buttons, timestamp);
}

bool StateModel::operator==(const StateModel& other) const {
    return left_stick_x_ == other.left_stick_x_ &&
           left_stick_y_ == other.left_stick_y_ &&
           right_stick_x_ == other.right_stick_x_ &&
           right_stick_y_ == other.right_stick_y_ &&
           left_trigger_ == other.left_trigger_ &&
           right_trigger_ == other.right_trigger_ &&
           buttons_ == other.buttons_ &&
           timestamp_ == other.timestamp_;
}

}  // namespace deck_relay
