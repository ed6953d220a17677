#pragma once

#include <map>
#include <string>
#include <vector>

namespace calibration
{

    constexpr double kDefaultDeadzone = 0.1;
    constexpr double kDefaultScaleFactor = 1.0;

    // Reserved button_mapping targets. The first cycles the session
    // sensitivity step, the second the visualisation command template.
    constexpr const char *kActionSensitivityStep = "sensitivity_step";
    constexpr const char *kActionNextCommand = "next_command";

    enum class Action
    {
        None,
        SensitivityStep,
        NextCommand,
    };

    using Mapping = std::map<std::string, std::string>;

    // Profile as written in the configuration; every field is optional.
    struct Profile
    {
        bool has_deadzone = false;
        double deadzone = 0.0;
        bool has_scale_factor = false;
        double scale_factor = 0.0;
        Mapping axis_mapping;
        Mapping button_mapping;
    };

    // Merged profile. The has_* flags say whether either profile set the
    // field; unset fields hold the built-in values and are not pushed into
    // transform parameters.
    struct Effective
    {
        bool has_deadzone = false;
        double deadzone = kDefaultDeadzone;
        bool has_scale_factor = false;
        double scale_factor = kDefaultScaleFactor;
        Mapping axis_mapping;
        Mapping button_mapping;
    };

    // Default profile overridden field by field (and mapping entry by mapping
    // entry) by the device profile. `device` may be null.
    Effective merge(const Profile &defaults, const Profile *device);

    struct Route
    {
        std::string command_key;
        bool overridden = false; // true when a mapping entry redirected the control
        Action action = Action::None;
    };

    Route resolve_axis(const Effective &cal, const std::string &default_key, const std::string &axis);
    Route resolve_button(const Effective &cal, const std::string &default_key, const std::string &button);

    // Output channel of a control: the explicit mapping channel when given
    // (>= 0), else the control's position in the declared list, else -1.
    int resolve_channel(int mapped_channel, const std::vector<std::string> &declared, const std::string &control);

} // namespace calibration
