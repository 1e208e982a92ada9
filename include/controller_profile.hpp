/*
 * Controller Profile
 *
 * Per-device YAML description of how evdev codes turn into relay input:
 * key codes to buttons, hat axis values to D-pad buttons, and absolute axes
 * to sticks and triggers with their bounds, deadzone and output range.
 *
 * ProfileLibrary holds every profile of a directory and picks the one whose
 * name patterns match an evdev device name.
 */

#ifndef DECK_RELAY_CONTROLLER_PROFILE_HPP
#define DECK_RELAY_CONTROLLER_PROFILE_HPP

#include "state_model.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace YAML {
class Node;
}

namespace deck_relay {

// Where a mapped axis ends up in the RawInput
enum class AxisTarget {
    None,
    LeftStickX,
    LeftStickY,
    RightStickX,
    RightStickY,
    LeftTrigger,
    RightTrigger,
};

AxisTarget axisTargetFromName(const std::string& name);

struct ButtonMapping {
    unsigned code = 0;
    Button button = Button::A;
};

// A hat axis reporting `value` presses `button`
struct DpadMapping {
    unsigned axis_code = 0;
    int32_t value = 0;
    Button button = Button::DpadUp;
};

struct AxisMapping {
    unsigned code = 0;
    std::string name;
    AxisTarget target = AxisTarget::None;
    int32_t min = 0;
    int32_t max = 0;
    int32_t deadzone = 0;
    bool normalize = false;
    bool invert = false;       // evdev Y axes grow downwards
    double output_min = -1.0;  // 0.0 for triggers
    double output_max = 1.0;

    bool centered() const { return output_min < 0.0; }
};

class ControllerProfile {
public:
    bool loadFromFile(const std::string& path);
    bool loadFromString(const std::string& yaml_text);

    // Case-insensitive substring match on the evdev device name
    bool matches(const std::string& device_name) const;

    const ButtonMapping* button(unsigned code) const;
    const AxisMapping* axis(unsigned code) const;
    bool isDpadAxis(unsigned code) const;

    // Every D-pad mapping on one hat axis; pressing one releases the rest
    std::vector<DpadMapping> dpadMappings(unsigned axis_code) const;

    // Raw evdev value -> output range. Unmapped or non-normalized axes
    // return the raw value unchanged.
    double normalize(unsigned code, int32_t raw_value) const;

    const std::string& name() const { return name_; }
    size_t buttonCount() const { return buttons_.size(); }
    size_t axisCount() const { return axes_.size(); }

private:
    std::string name_;
    std::vector<std::string> include_patterns_;
    std::vector<std::string> exclude_patterns_;
    bool apply_deadzone_ = true;

    std::map<unsigned, ButtonMapping> buttons_;
    std::map<unsigned, AxisMapping> axes_;
    std::multimap<unsigned, DpadMapping> dpad_;

    bool parse(const YAML::Node& root, const std::string& origin);
};

class ProfileLibrary {
public:
    explicit ProfileLibrary(std::string directory);

    // Reads every *.yaml in the directory; returns how many loaded
    size_t load();

    void add(std::string name, std::shared_ptr<const ControllerProfile> profile);

    // First profile (by file name) matching the device, or nullptr
    std::shared_ptr<const ControllerProfile> find(const std::string& device_name);

    size_t size() const { return profiles_.size(); }
    const std::string& directory() const { return directory_; }

private:
    std::string directory_;
    bool loaded_ = false;
    std::vector<std::pair<std::string, std::shared_ptr<const ControllerProfile>>> profiles_;
};

}  // namespace deck_relay

#endif  // DECK_RELAY_CONTROLLER_PROFILE_HPP
