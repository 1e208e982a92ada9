/*
 * Tests for controller_profile.hpp: YAML mappings, normalization and lookup.
 */

#include <catch2/catch.hpp>
#include "controller_profile.hpp"

using namespace deck_relay;

namespace {

const char* kTestPad = R"(
controller:
  name: "Test Pad"
  vendor_patterns: ["test pad", "steam deck"]
  exclude_patterns: ["motion sensors"]

normalization:
  output_min: -1.0
  output_max: 1.0
  apply_deadzone: true

buttons:
  - { code: 304, name: "A" }
  - { code: 310, name: "LB" }
  - { code: 999, name: "Turbo" }

dpad_buttons:
  - { axis_code: 16, value: -1, name: "Dpad-Left" }
  - { axis_code: 16, value: 1, name: "Dpad-Right" }

axes:
  - { code: 0, name: "Left-X", min: -32768, max: 32767, deadzone: 4000, normalize: true }
  - { code: 1, name: "Left-Y", min: -32768, max: 32767, deadzone: 4000, normalize: true, invert: true }
  - { code: 2, name: "LT", min: 0, max: 255, normalize: true, output_min: 0.0, output_max: 1.0 }
  - { code: 5, name: "Broken", min: 10, max: 10, normalize: true }
)";

}  // namespace

TEST_CASE("controller_profile - loads mappings from YAML", "[controller_profile]") {
    ControllerProfile profile;
    REQUIRE(profile.loadFromString(kTestPad));
    REQUIRE(profile.name() == "Test Pad");

    // Unknown button names are dropped
    REQUIRE(profile.buttonCount() == 2);
    const ButtonMapping* a = profile.button(304);
    REQUIRE(a != nullptr);
    REQUIRE(a->button == Button::A);
    REQUIRE(profile.button(999) == nullptr);

    REQUIRE(profile.isDpadAxis(16));
    REQUIRE_FALSE(profile.isDpadAxis(17));
    auto hat = profile.dpadMappings(16);
    REQUIRE(hat.size() == 2);
    REQUIRE(hat[0].button == Button::DpadLeft);
    REQUIRE(hat[0].value == -1);
    REQUIRE(hat[1].button == Button::DpadRight);

    // Axis with an empty range is ignored
    REQUIRE(profile.axisCount() == 3);
    REQUIRE(profile.axis(1)->target == AxisTarget::LeftStickY);
    REQUIRE(profile.axis(2)->target == AxisTarget::LeftTrigger);
    REQUIRE(profile.axis(5) == nullptr);
}

TEST_CASE("controller_profile - device matching honours exclusions", "[controller_profile]") {
    ControllerProfile profile;
    REQUIRE(profile.loadFromString(kTestPad));

    REQUIRE(profile.matches("Valve Software Steam Deck Controller"));
    REQUIRE(profile.matches("TEST PAD v2"));
    REQUIRE_FALSE(profile.matches("Steam Deck Motion Sensors"));
    REQUIRE_FALSE(profile.matches("Logitech Keyboard"));
}

TEST_CASE("controller_profile - stick normalization with deadzone", "[controller_profile][normalize]") {
    ControllerProfile profile;
    REQUIRE(profile.loadFromString(kTestPad));

    REQUIRE(profile.normalize(0, 0) == 0.0);
    REQUIRE(profile.normalize(0, 3999) == 0.0);
    REQUIRE(profile.normalize(0, -4000) == 0.0);
    REQUIRE(profile.normalize(0, 32767) == Approx(1.0).margin(0.001));
    REQUIRE(profile.normalize(0, -32768) == Approx(-1.0).margin(0.001));
    REQUIRE(profile.normalize(0, 4000 + 14384) == Approx(0.5).margin(0.001));
}

TEST_CASE("controller_profile - inverted axis flips the sign", "[controller_profile][normalize]") {
    ControllerProfile profile;
    REQUIRE(profile.loadFromString(kTestPad));

    // evdev Y grows downwards; pushing up must read positive
    REQUIRE(profile.normalize(1, -32768) == Approx(1.0).margin(0.001));
    REQUIRE(profile.normalize(1, 32767) == Approx(-1.0).margin(0.001));
}

TEST_CASE("controller_profile - trigger normalization", "[controller_profile][normalize]") {
    ControllerProfile profile;
    REQUIRE(profile.loadFromString(kTestPad));

    REQUIRE(profile.normalize(2, 0) == 0.0);
    REQUIRE(profile.normalize(2, 255) == Approx(1.0));
    REQUIRE(profile.normalize(2, 300) == Approx(1.0));
    REQUIRE(profile.normalize(2, 51) == Approx(0.2));
}

TEST_CASE("controller_profile - unmapped codes pass through raw", "[controller_profile][normalize]") {
    ControllerProfile profile;
    REQUIRE(profile.loadFromString(kTestPad));
    REQUIRE(profile.normalize(42, 1234) == 1234.0);
}

TEST_CASE("controller_profile - broken YAML is rejected", "[controller_profile]") {
    ControllerProfile profile;
    REQUIRE_FALSE(profile.loadFromString("buttons: [ { code: 1 ]"));
    REQUIRE_FALSE(profile.loadFromString("buttons:\n  - { name: A }\n"));  // code missing
    REQUIRE_FALSE(profile.loadFromFile(DECK_RELAY_CONFIG_DIR "/missing.yaml"));
}

TEST_CASE("controller_profile - shipped profiles load and match", "[controller_profile][files]") {
    ProfileLibrary library(DECK_RELAY_CONFIG_DIR);
    REQUIRE(library.load() == 2);

    auto deck = library.find("Steam Deck");
    REQUIRE(deck != nullptr);
    REQUIRE(deck->axisCount() > 0);

    auto xbox = library.find("Microsoft X-Box 360 pad");
    REQUIRE(xbox != nullptr);
    REQUIRE(xbox->buttonCount() > 0);
    REQUIRE(xbox != deck);

    REQUIRE(library.find("Logitech USB Keyboard") == nullptr);
}

TEST_CASE("controller_profile - library lookup without a directory", "[controller_profile]") {
    ProfileLibrary library("/nonexistent/profiles");
    REQUIRE(library.find("Steam Deck") == nullptr);

    auto custom = std::make_shared<ControllerProfile>();
    REQUIRE(custom->loadFromString(kTestPad));
    library.add("custom", custom);
    REQUIRE(library.size() == 1);
    REQUIRE(library.find("test pad") == custom);
}
