/*
 * Controller State Model
 *
 * Canonical, transport-agnostic snapshot of one controller: four stick axes,
 * two triggers, the Xbox button set and a monotonic timestamp.
 * Values are clamped at construction; a StateModel never changes afterwards.
 */

#ifndef DECK_RELAY_STATE_MODEL_HPP
#define DECK_RELAY_STATE_MODEL_HPP

#include <cstdint>
#include <string>

namespace deck_relay {

// Bit values follow the XUSB wButtons layout so the mask maps 1:1 onto
// an Xbox 360 report.
enum class Button : uint16_t {
    DpadUp    = 0x0001,
    DpadDown  = 0x0002,
    DpadLeft  = 0x0004,
    DpadRight = 0x0008,
    Start     = 0x0010,
    Back      = 0x0020,
    L3        = 0x0040,
    R3        = 0x0080,
    LB        = 0x0100,
    RB        = 0x0200,
    Guide     = 0x0400,
    A         = 0x1000,
    B         = 0x2000,
    X         = 0x4000,
    Y         = 0x8000,
};

constexpr Button kAllButtons[] = {
    Button::A, Button::B, Button::X, Button::Y,
    Button::LB, Button::RB, Button::Start, Button::Back, Button::Guide,
    Button::DpadUp, Button::DpadDown, Button::DpadLeft, Button::DpadRight,
    Button::L3, Button::R3,
};

// Mask of every defined button bit
constexpr uint16_t kButtonMask = 0xF7FF;

const char* buttonName(Button button);

// Parses names used in controller configs ("A", "LB", "Dpad-Up", "L3", ...)
bool buttonFromName(const std::string& name, Button& out);

class ButtonSet {
public:
    ButtonSet() = default;
    explicit ButtonSet(uint16_t mask) : mask_(mask & kButtonMask) {}

    bool has(Button b) const { return (mask_ & static_cast<uint16_t>(b)) != 0; }
    void set(Button b, bool pressed);
    uint16_t mask() const { return mask_; }
    bool empty() const { return mask_ == 0; }

    bool operator==(const ButtonSet& other) const { return mask_ == other.mask_; }
    bool operator!=(const ButtonSet& other) const { return mask_ != other.mask_; }

private:
    uint16_t mask_ = 0;
};

// Unclamped values as read from a physical device
struct RawInput {
    double left_stick_x = 0.0;
    double left_stick_y = 0.0;
    double right_stick_x = 0.0;
    double right_stick_y = 0.0;
    double left_trigger = 0.0;
    double right_trigger = 0.0;
    ButtonSet buttons;
};

class StateModel {
public:
    StateModel() = default;
    StateModel(float left_stick_x, float left_stick_y,
               float right_stick_x, float right_stick_y,
               float left_trigger, float right_trigger,
               ButtonSet buttons, uint64_t timestamp);

    static StateModel fromRaw(const RawInput& raw, uint64_t timestamp);

    float leftStickX() const { return left_stick_x_; }
    float leftStickY() const { return left_stick_y_; }
    float rightStickX() const { return right_stick_x_; }
    float rightStickY() const { return right_stick_y_; }
    float leftTrigger() const { return left_trigger_; }
    float rightTrigger() const { return right_trigger_; }
    ButtonSet buttons() const { return buttons_; }
    bool pressed(Button b) const { return buttons_.has(b); }
    uint64_t timestamp() const { return timestamp_; }

    bool operator==(const StateModel& other) const;
    bool operator!=(const StateModel& other) const { return !(*this == other); }

private:
    float left_stick_x_ = 0.0f;
    float left_stick_y_ = 0.0f;
    float right_stick_x_ = 0.0f;
    float right_stick_y_ = 0.0f;
    float left_trigger_ = 0.0f;
    float right_trigger_ = 0.0f;
    ButtonSet buttons_;
    uint64_t timestamp_ = 0;
};

// Clamp helpers; NaN maps to 0
float clampStick(double value);
float clampTrigger(double value);

}  // namespace deck_relay

#endif  // DECK_RELAY_STATE_MODEL_HPP
