/*
Calibration tests: field-by-field merge and control routing.
*/
#include "core/calibration.hpp"
#include "test_support.hpp"

#include <cstdlib>

using namespace calibration;

static Profile default_profile(void)
{
    Profile p;
    p.has_deadzone = true;
    p.deadzone = 0.1;
    p.has_scale_factor = true;
    p.scale_factor = 2.0;
    p.axis_mapping["x"] = "unity_rotation";
    p.axis_mapping["y"] = "unity_movement";
    return p;
}

static int test_merge_without_device_profile(void)
{
    Effective e = merge(default_profile(), nullptr);
    EXPECT(e.deadzone == 0.1, "default deadzone");
    EXPECT(e.scale_factor == 2.0, "default scale");
    EXPECT(e.has_deadzone && e.has_scale_factor, "fields set by the default profile");
    EXPECT(e.axis_mapping.size() == 2, "default axis mapping");

    Effective bare = merge(Profile(), nullptr);
    EXPECT(!bare.has_deadzone && !bare.has_scale_factor, "nothing set by either profile");
    EXPECT(bare.deadzone == kDefaultDeadzone, "built-in deadzone");
    EXPECT(bare.scale_factor == kDefaultScaleFactor, "built-in scale");

    Profile only_device;
    only_device.has_scale_factor = true;
    only_device.scale_factor = 0.5;
    Effective partial = merge(Profile(), &only_device);
    EXPECT(partial.has_scale_factor && !partial.has_deadzone, "device field marked, absent one not");
    return 0;
}

static int test_merge_partial_override(void)
{
    Profile device;
    device.has_deadzone = true;
    device.deadzone = 0.0;
    device.axis_mapping["x"] = "mouse";
    device.button_mapping["left_click"] = "unity_brake";

    Effective e = merge(default_profile(), &device);
    EXPECT(e.deadzone == 0.0, "device deadzone wins, even when zero");
    EXPECT(e.scale_factor == 2.0, "absent field inherits the default");
    EXPECT(e.axis_mapping.at("x") == "mouse", "mapping entry overridden");
    EXPECT(e.axis_mapping.at("y") == "unity_movement", "other entries inherited");
    EXPECT(e.button_mapping.at("left_click") == "unity_brake", "device-only entry added");
    return 0;
}

static int test_resolve_routes(void)
{
    Profile device;
    device.button_mapping["press"] = kActionSensitivityStep;
    device.button_mapping["menu"] = "";
    device.button_mapping["select"] = kActionNextCommand;
    Effective e = merge(default_profile(), &device);

    Route r = resolve_axis(e, "mouse", "x");
    EXPECT(r.command_key == "unity_rotation" && r.overridden && r.action == Action::None, "axis override");

    r = resolve_axis(e, "mouse", "wheel");
    EXPECT(r.command_key == "mouse" && !r.overridden, "unmapped axis uses the default key");

    r = resolve_button(e, "mouse", "press");
    EXPECT(r.action == Action::SensitivityStep && r.overridden, "sensitivity step action");

    r = resolve_button(e, "mouse", "select");
    EXPECT(r.action == Action::NextCommand && r.command_key == kActionNextCommand, "next command action");

    r = resolve_button(e, "mouse", "menu");
    EXPECT(r.command_key == "mouse" && !r.overridden, "empty mapping entry falls back");
    return 0;
}

static int test_resolve_channel(void)
{
    std::vector<std::string> axes = {"x", "y", "z"};
    EXPECT(resolve_channel(-1, axes, "y") == 1, "declared position");
    EXPECT(resolve_channel(3, axes, "y") == 3, "explicit channel wins");
    EXPECT(resolve_channel(-1, axes, "roll") == -1, "undeclared control");
    return 0;
}

extern "C" void app_main(void)
{
    int failures = 0;
    failures += test_merge_without_device_profile();
    failures += test_merge_partial_override();
    failures += test_resolve_routes();
    failures += test_resolve_channel();
    std::printf("test_calibration: %d failed\n", failures);
    std::exit(failures ? 1 : 0);
}
