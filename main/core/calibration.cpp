#include "core/calibration.hpp"

namespace calibration
{

    namespace
    {
        Route resolve(const Mapping &mapping, const std::string &default_key, const std::string &control)
        {
            Route route;
            auto it = mapping.find(control);
            if (it == mapping.end() || it->second.empty())
            {
                route.command_key = default_key;
                return route;
            }
            route.command_key = it->second;
            route.overridden = true;
            if (it->second == kActionSensitivityStep)
                route.action = Action::SensitivityStep;
            else if (it->second == kActionNextCommand)
                route.action = Action::NextCommand;
            return route;
        }

        void overlay(Mapping &dst, const Mapping &src)
        {
            for (const auto &kv : src)
            {
                dst[kv.first] = kv.second;
            }
        }
    } // namespace

    Effective merge(const Profile &defaults, const Profile *device)
    {
        Effective out;
        if (defaults.has_deadzone)
        {
            out.has_deadzone = true;
            out.deadzone = defaults.deadzone;
        }
        if (defaults.has_scale_factor)
        {
            out.has_scale_factor = true;
            out.scale_factor = defaults.scale_factor;
        }
        out.axis_mapping = defaults.axis_mapping;
        out.button_mapping = defaults.button_mapping;

        if (device)
        {
            if (device->has_deadzone)
            {
                out.has_deadzone = true;
                out.deadzone = device->deadzone;
            }
            if (device->has_scale_factor)
            {
                out.has_scale_factor = true;
                out.scale_factor = device->scale_factor;
            }
            overlay(out.axis_mapping, device->axis_mapping);
            overlay(out.button_mapping, device->button_mapping);
        }
        return out;
    }

    Route resolve_axis(const Effective &cal, const std::string &default_key, const std::string &axis)
    {
        return resolve(cal.axis_mapping, default_key, axis);
    }

    Route resolve_button(const Effective &cal, const std::string &default_key, const std::string &button)
    {
        return resolve(cal.button_mapping, default_key, button);
    }

    int resolve_channel(int mapped_channel, const std::vector<std::string> &declared, const std::string &control)
    {
        if (mapped_channel >= 0)
            return mapped_channel;
        for (std::size_t i = 0; i < declared.size(); ++i)
        {
            if (declared[i] == control)
                return static_cast<int>(i);
        }
        return -1;
    }

} // namespace calibration
