/*
 * Controller Profile Implementation
 */

#include "controller_profile.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace deck_relay {

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool contains_any(const std::string& lower_text, const std::vector<std::string>& lower_patterns) {
    for (const auto& pattern : lower_patterns) {
        if (lower_text.find(pattern) != std::string::npos) {
            return true;
        }
    }
    return false;
}

double scale_centered(const AxisMapping& axis, int32_t value, bool deadzone) {
    int32_t lo = axis.min;
    int32_t hi = axis.max;
    if (deadzone) {
        if (std::abs(value) <= axis.deadzone) {
            return 0.0;
        }
        // Travel starts at the deadzone edge
        value += value > 0 ? -axis.deadzone : axis.deadzone;
        lo += axis.deadzone;
        hi -= axis.deadzone;
    }

    const int32_t reach = std::max(std::abs(lo), std::abs(hi));
    if (reach == 0) {
        return 0.0;
    }
    double n = std::max(-1.0, std::min(1.0, static_cast<double>(value) / reach));
    return axis.output_min + (n + 1.0) / 2.0 * (axis.output_max - axis.output_min);
}

double scale_one_sided(const AxisMapping& axis, int32_t value, bool deadzone) {
    int32_t hi = axis.max;
    if (deadzone) {
        if (value - axis.min <= axis.deadzone) {
            return axis.output_min;
        }
        value -= axis.deadzone;
        hi -= axis.deadzone;
    }

    if (hi <= axis.min) {
        return axis.output_min;
    }
    double n = static_cast<double>(value - axis.min) / (hi - axis.min);
    n = std::max(0.0, std::min(1.0, n));
    return axis.output_min + n * (axis.output_max - axis.output_min);
}

}  // namespace

AxisTarget axisTargetFromName(const std::string& name) {
    if (name == "Left-X") return AxisTarget::LeftStickX;
    if (name == "Left-Y") return AxisTarget::LeftStickY;
    if (name == "Right-X") return AxisTarget::RightStickX;
    if (name == "Right-Y") return AxisTarget::RightStickY;
    if (name == "LT") return AxisTarget::LeftTrigger;
    if (name == "RT") return AxisTarget::RightTrigger;
    return AxisTarget::None;
}

bool ControllerProfile::loadFromFile(const std::string& path) {
    try {
        return parse(YAML::LoadFile(path), path);
    } catch (const YAML::Exception& e) {
        std::cerr << "profile: cannot load " << path << ": " << e.what() << std::endl;
        return false;
    }
}

bool ControllerProfile::loadFromString(const std::string& yaml_text) {
    try {
        return parse(YAML::Load(yaml_text), "<string>");
    } catch (const YAML::Exception& e) {
        std::cerr << "profile: cannot parse: " << e.what() << std::endl;
        return false;
    }
}

bool ControllerProfile::parse(const YAML::Node& root, const std::string& origin) {
    try {
        double default_min = -1.0;
        double default_max = 1.0;
        if (const YAML::Node norm = root["normalization"]) {
            default_min = norm["output_min"].as<double>(default_min);
            default_max = norm["output_max"].as<double>(default_max);
            apply_deadzone_ = norm["apply_deadzone"].as<bool>(apply_deadzone_);
        }

        if (const YAML::Node controller = root["controller"]) {
            name_ = controller["name"].as<std::string>(name_);
            for (const auto& p : controller["vendor_patterns"]) {
                include_patterns_.push_back(lowercase(p.as<std::string>()));
            }
            for (const auto& p : controller["exclude_patterns"]) {
                exclude_patterns_.push_back(lowercase(p.as<std::string>()));
            }
        }

        for (const auto& node : root["buttons"]) {
            std::string label = node["name"].as<std::string>();
            ButtonMapping mapping;
            mapping.code = node["code"].as<unsigned>();
            if (!buttonFromName(label, mapping.button)) {
                std::cerr << origin << ": unknown button '" << label << "', ignored" << std::endl;
                continue;
            }
            buttons_[mapping.code] = mapping;
        }

        for (const auto& node : root["dpad_buttons"]) {
            std::string label = node["name"].as<std::string>();
            DpadMapping mapping;
            mapping.axis_code = node["axis_code"].as<unsigned>();
            mapping.value = node["value"].as<int32_t>();
            if (!buttonFromName(label, mapping.button)) {
                std::cerr << origin << ": unknown D-pad button '" << label << "', ignored" << std::endl;
                continue;
            }
            dpad_.emplace(mapping.axis_code, mapping);
        }

        for (const auto& node : root["axes"]) {
            AxisMapping mapping;
            mapping.code = node["code"].as<unsigned>();
            mapping.name = node["name"].as<std::string>();
            mapping.target = axisTargetFromName(mapping.name);
            mapping.min = node["min"].as<int32_t>();
            mapping.max = node["max"].as<int32_t>();
            mapping.deadzone = node["deadzone"].as<int32_t>(0);
            mapping.normalize = node["normalize"].as<bool>(false);
            mapping.invert = node["invert"].as<bool>(false);
            mapping.output_min = node["output_min"].as<double>(default_min);
            mapping.output_max = node["output_max"].as<double>(default_max);
            if (mapping.min >= mapping.max) {
                std::cerr << origin << ": axis '" << mapping.name << "' has an empty range, ignored" << std::endl;
                continue;
            }
            axes_[mapping.code] = mapping;
        }
        return true;
    } catch (const YAML::Exception& e) {
        std::cerr << "profile: " << origin << ": " << e.what() << std::endl;
        return false;
    }
}

bool ControllerProfile::matches(const std::string& device_name) const {
    const std::string lower = lowercase(device_name);
    return !contains_any(lower, exclude_patterns_) && contains_any(lower, include_patterns_);
}

const ButtonMapping* ControllerProfile::button(unsigned code) const {
    auto it = buttons_.find(code);
    return it == buttons_.end() ? nullptr : &it->second;
}

const AxisMapping* ControllerProfile::axis(unsigned code) const {
    auto it = axes_.find(code);
    return it == axes_.end() ? nullptr : &it->second;
}

bool ControllerProfile::isDpadAxis(unsigned code) const {
    return dpad_.count(code) > 0;
}

std::vector<DpadMapping> ControllerProfile::dpadMappings(unsigned axis_code) const {
    std::vector<DpadMapping> out;
    auto range = dpad_.equal_range(axis_code);
    for (auto it = range.first; it != range.second; ++it) {
        out.push_back(it->second);
    }
    return out;
}

double ControllerProfile::normalize(unsigned code, int32_t raw_value) const {
    const AxisMapping* mapping = axis(code);
    if (!mapping || !mapping->normalize) {
        return static_cast<double>(raw_value);
    }

    const bool deadzone = apply_deadzone_ && mapping->deadzone > 0;
    double result = mapping->centered() ? scale_centered(*mapping, raw_value, deadzone)
                                        : scale_one_sided(*mapping, raw_value, deadzone);
    return mapping->invert ? -result : result;
}

ProfileLibrary::ProfileLibrary(std::string directory)
    : directory_(std::move(directory)) {
}

size_t ProfileLibrary::load() {
    loaded_ = true;

    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        std::cerr << "profile: directory not found: " << directory_ << std::endl;
        return 0;
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".yaml") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    size_t loaded = 0;
    for (const auto& path : files) {
        auto profile = std::make_shared<ControllerProfile>();
        if (profile->loadFromFile(path.string())) {
            add(path.stem().string(), std::move(profile));
            ++loaded;
        }
    }
    return loaded;
}

void ProfileLibrary::add(std::string name, std::shared_ptr<const ControllerProfile> profile) {
    for (auto& entry : profiles_) {
        if (entry.first == name) {
            entry.second = std::move(profile);
            return;
        }
    }
    profiles_.emplace_back(std::move(name), std::move(profile));
}

std::shared_ptr<const ControllerProfile> ProfileLibrary::find(const std::string& device_name) {
    if (!loaded_) {
        load();
    }
    for (const auto& entry : profiles_) {
        if (entry.second->matches(device_name)) {
            return entry.second;
        }
    }
    return nullptr;
}

}  // namespace deck_relay
