#include "config/registry.hpp"

#include "core/mdof_err.hpp"
#include "esp_log.h"

#include <algorithm>
#include <set>

namespace config
{

    namespace
    {
        constexpr const char *TAG = "registry";

        using Problems = std::vector<std::string>;

        bool contains(const std::vector<std::string> &list, const std::string &s)
        {
            return std::find(list.begin(), list.end(), s) != list.end();
        }

        void check_profile(const calibration::Profile &profile, const std::string &path,
                           const std::vector<std::string> &valid_axes, const std::vector<std::string> &valid_buttons,
                           Problems &problems)
        {
            if (profile.has_deadzone && profile.deadzone < 0.0)
                problems.push_back(path + ".deadzone must not be negative");
            for (const auto &kv : profile.axis_mapping)
            {
                if (!contains(valid_axes, kv.first))
                    problems.push_back(path + ".axis_mapping." + kv.first + " is not a declared axis");
            }
            for (const auto &kv : profile.button_mapping)
            {
                if (!contains(valid_buttons, kv.first))
                    problems.push_back(path + ".button_mapping." + kv.first + " is not a declared button");
            }
        }

        const ControlMapping *find_mapping(const Document &doc, const std::string &type, const std::string &control)
        {
            auto t = doc.device_mappings.find(type);
            if (t == doc.device_mappings.end())
                return nullptr;
            auto c = t->second.find(control);
            return c == t->second.end() ? nullptr : &c->second;
        }
    } // namespace

    const ControlBinding *DeviceBinding::find_binding(const std::string &control, bool button) const
    {
        for (const auto &b : bindings)
        {
            if (b.button == button && b.control == control)
                return &b;
        }
        return nullptr;
    }

    // Builder state kept out of the public header.
    struct RegistryBuilder
    {
        const Document &doc;
        Registry &reg;
        Problems &problems;
        bool visualisation_ok = false;

        void check_globals()
        {
            if (doc.send_every < 1)
                problems.push_back("actuation.config.send_every must be at least 1");
            if (doc.poll_wait_ms < 0)
                problems.push_back("actuation.config.poll_wait_ms must not be negative");
            reg.send_every_ = std::max(doc.send_every, 1);
            reg.poll_wait_ms_ = std::max(doc.poll_wait_ms, 0);
        }

        void check_catalog()
        {
            for (const auto &kv : doc.catalog)
            {
                std::unique_ptr<transform::Transform> built;
                std::string problem;
                if (!transform::find_kind(kv.first))
                {
                    problems.push_back("transformations." + kv.first + " is not a transform kind this engine provides");
                    continue;
                }
                if (transform::make(kv.first, kv.second.params, built, problem) != ESP_OK)
                {
                    problems.push_back("transformations." + kv.first + ": " + problem);
                    continue;
                }
                reg.catalog_[kv.first] = kv.second;
            }
        }

        void check_commands()
        {
            for (const auto &kv : doc.commands)
            {
                command::Template t;
                std::string problem;
                if (command::Template::parse(kv.second, t, problem) != ESP_OK)
                {
                    problems.push_back("actuation.commands." + kv.first + ": " + problem);
                    continue;
                }
                reg.commands_[kv.first] = std::move(t);
            }
        }

        void check_visualisation()
        {
            reg.options_ = doc.visualisation_options;
            for (const auto &opt : doc.visualisation_options)
            {
                if (doc.visualisations.find(opt) == doc.visualisations.end())
                    problems.push_back("visualisation.options lists '" + opt + "' which has no target");
            }

            for (const auto &kv : doc.visualisations)
            {
                const VisualisationTarget &t = kv.second;
                std::string path = "visualisation.targets." + kv.first;
                if (!doc.visualisation_types.empty() && !t.type.empty() && !contains(doc.visualisation_types, t.type))
                    problems.push_back(path + ".type '" + t.type + "' is not an ontology visualisation type");
                command::Template parsed;
                std::string problem;
                if (!t.command.empty() && command::Template::parse(t.command, parsed, problem) != ESP_OK)
                    problems.push_back(path + ".command: " + problem);
            }

            const std::string &name = doc.selected_visualisation;
            if (name.empty())
            {
                problems.push_back("visualisation.selected is not set");
                return;
            }
            if (!doc.visualisation_options.empty() && !contains(doc.visualisation_options, name))
                problems.push_back("visualisation.selected '" + name + "' is not one of visualisation.options");

            auto it = doc.visualisations.find(name);
            if (it == doc.visualisations.end())
            {
                problems.push_back("visualisation.selected '" + name + "' has no target");
                return;
            }

            const VisualisationTarget &t = it->second;
            std::string path = "visualisation.targets." + name;
            std::size_t before = problems.size();
            if (t.udp_ip.empty())
                problems.push_back(path + ".udp_ip is missing");
            if (t.udp_port < 1 || t.udp_port > 65535)
                problems.push_back(path + ".udp_port must be 1..65535");
            if (t.command.empty())
                problems.push_back(path + ".command is missing");

            ActiveVisualisation &vis = reg.visualisation_;
            std::string problem;
            if (!t.command.empty() && command::Template::parse(t.command, vis.command, problem) != ESP_OK)
                return; // reported above

            std::size_t arity = vis.command.arity();
            if (!t.channel_signs.empty())
            {
                if (t.channel_signs.size() != arity)
                    problems.push_back(path + ".channel_signs needs one entry per placeholder (" + std::to_string(arity) + ")");
                for (double s : t.channel_signs)
                {
                    if (s != 1.0 && s != -1.0)
                    {
                        problems.push_back(path + ".channel_signs entries must be 1 or -1");
                        break;
                    }
                }
            }
            if (t.step_slot != -1 && (t.step_slot < 0 || static_cast<std::size_t>(t.step_slot) >= arity))
                problems.push_back(path + ".step_slot must name a placeholder (0.." + std::to_string(arity) + ")");

            vis.alternates.clear();
            for (std::size_t i = 0; i < t.command_cycle.size(); ++i)
            {
                std::string item = path + ".command_cycle[" + std::to_string(i) + "]";
                command::Template alt;
                if (command::Template::parse(t.command_cycle[i], alt, problem) != ESP_OK)
                {
                    problems.push_back(item + ": " + problem);
                    continue;
                }
                if (alt.arity() != arity)
                {
                    problems.push_back(item + " must take " + std::to_string(arity) + " values like .command");
                    continue;
                }
                vis.alternates.push_back(alt);
            }

            if (problems.size() != before)
                return;

            vis.name = name;
            vis.type = t.type;
            vis.endpoint.host = t.udp_ip;
            vis.endpoint.port = static_cast<std::uint16_t>(t.udp_port);
            vis.channel_signs = t.channel_signs;
            vis.step_slot = t.step_slot;
            visualisation_ok = true;
        }

        void check_calibration()
        {
            std::vector<std::string> all_axes;
            std::vector<std::string> all_buttons;
            for (const auto &kv : doc.device_types)
            {
                all_axes.insert(all_axes.end(), kv.second.axes.begin(), kv.second.axes.end());
                all_buttons.insert(all_buttons.end(), kv.second.buttons.begin(), kv.second.buttons.end());
            }
            check_profile(doc.default_calibration, "calibration.default", all_axes, all_buttons, problems);
            reg.default_profile_ = doc.default_calibration;

            for (const auto &kv : doc.device_calibrations)
            {
                std::string path = "calibration.devices." + kv.first;
                auto dev = std::find_if(doc.input_devices.begin(), doc.input_devices.end(),
                                        [&](const InputDevice &d) { return d.name == kv.first; });
                if (dev == doc.input_devices.end())
                {
                    problems.push_back(path + " does not name an input device");
                    continue;
                }
                auto type = doc.device_types.find(dev->type);
                if (type != doc.device_types.end())
                    check_profile(kv.second, path, type->second.axes, type->second.buttons, problems);
                reg.device_profiles_[kv.first] = kv.second;
            }
        }

        void check_device_mappings()
        {
            for (const auto &t : doc.device_mappings)
            {
                std::string tpath = "device_mappings." + t.first;
                auto type = doc.device_types.find(t.first);
                if (type == doc.device_types.end())
                {
                    problems.push_back(tpath + " is not an ontology device type");
                    continue;
                }
                for (const auto &c : t.second)
                {
                    std::string path = tpath + "." + c.first;
                    if (!contains(type->second.axes, c.first) && !contains(type->second.buttons, c.first))
                        problems.push_back(path + " is not a declared axis or button of '" + t.first + "'");
                    if (c.second.has_transform && doc.catalog.find(c.second.transform.name) == doc.catalog.end())
                        problems.push_back(path + ".transform '" + c.second.transform.name + "' is not in the transformation catalog");
                }
            }
        }

        int target_for(DeviceBinding &dev, const std::string &key, const std::string &path)
        {
            for (std::size_t i = 0; i < dev.targets.size(); ++i)
            {
                if (dev.targets[i].key == key)
                    return static_cast<int>(i);
            }

            CommandTarget target;
            target.key = key;
            if (key == dev.default_command)
            {
                if (!visualisation_ok)
                    return -1;
                target.tmpl = &reg.visualisation_.command;
                target.visualisation = true;
            }
            else
            {
                auto it = reg.commands_.find(key);
                if (it == reg.commands_.end())
                {
                    if (doc.commands.find(key) == doc.commands.end())
                        problems.push_back(path + " routes to unknown command '" + key + "'");
                    return -1;
                }
                target.tmpl = &it->second;
            }
            dev.targets.push_back(target);
            return static_cast<int>(dev.targets.size() - 1);
        }

        void bind_control(DeviceBinding &dev, const std::string &control, bool button)
        {
            std::string path = "input_devices." + dev.name + "." + control;
            calibration::Route route = button ? calibration::resolve_button(dev.calibration, dev.default_command, control)
                                              : calibration::resolve_axis(dev.calibration, dev.default_command, control);
            const ControlMapping *mapping = find_mapping(doc, dev.type, control);

            ControlBinding binding;
            binding.control = control;
            binding.button = button;

            if (route.action != calibration::Action::None)
            {
                if (!button)
                {
                    problems.push_back(path + " is an axis but is mapped to action '" + route.command_key + "'");
                    return;
                }
                binding.kind = BindingKind::Action;
                binding.action = route.action;
                if (route.action == calibration::Action::NextCommand && reg.visualisation_.alternates.empty())
                    ESP_LOGW(TAG, "%s: visualisation '%s' has no command_cycle, next_command does nothing", path.c_str(),
                             reg.visualisation_.name.c_str());
            }
            else
            {
                int target = target_for(dev, route.command_key, path);
                if (target < 0)
                    return;
                binding.target = static_cast<std::size_t>(target);
                const CommandTarget &ct = dev.targets[binding.target];

                if (ct.tmpl->is_literal())
                {
                    if (!button)
                    {
                        problems.push_back(path + " is an axis but routes to literal command '" + route.command_key + "'");
                        return;
                    }
                    binding.kind = BindingKind::Literal;
                }
                else
                {
                    binding.kind = BindingKind::Numeric;
                    static const std::vector<std::string> kNoDeclaredOrder;
                    binding.channel = calibration::resolve_channel(mapping ? mapping->channel : -1,
                                                                   button ? kNoDeclaredOrder : dev.axes, control);
                    if (binding.channel < 0)
                    {
                        ESP_LOGW(TAG, "%s: button has no channel in command '%s', ignored", path.c_str(), route.command_key.c_str());
                        return;
                    }
                    if (static_cast<std::size_t>(binding.channel) >= ct.tmpl->arity())
                    {
                        problems.push_back(path + " channel " + std::to_string(binding.channel) + " is outside command '" +
                                           route.command_key + "' (" + std::to_string(ct.tmpl->arity()) + " values)");
                        return;
                    }
                    if (ct.visualisation && binding.channel == reg.visualisation_.step_slot)
                    {
                        problems.push_back(path + " channel " + std::to_string(binding.channel) + " is the step slot");
                        return;
                    }
                }
            }

            std::string name = (mapping && mapping->has_transform) ? mapping->transform.name : "linear.direct";
            const transform::KindInfo *kind = transform::find_kind(name);
            if (!kind)
                return; // reported by check_device_mappings / check_catalog

            transform::ParamMap params;
            auto cat = doc.catalog.find(name);
            if (cat != doc.catalog.end())
                params = cat->second.params;
            if (kind->has_param("deadzone") && dev.calibration.has_deadzone)
                params["deadzone"] = dev.calibration.deadzone;
            if (kind->has_param("scale") && dev.calibration.has_scale_factor)
                params["scale"] = dev.calibration.scale_factor;
            if (mapping && mapping->has_transform)
            {
                for (const auto &kv : mapping->transform.params)
                    params[kv.first] = kv.second;
            }

            std::string problem;
            if (transform::make(name, params, binding.transform, problem) != ESP_OK)
            {
                problems.push_back(path + ": " + problem);
                return;
            }
            dev.bindings.push_back(std::move(binding));
        }

        void bind_devices()
        {
            std::map<devices::DeviceIdentity, std::string> seen;
            for (const InputDevice &d : doc.input_devices)
            {
                std::string path = "input_devices." + d.name;
                DeviceBinding dev;
                dev.name = d.name;
                dev.type = d.type;
                dev.library = d.library;
                dev.default_command = d.command;
                dev.axes = d.axes;
                dev.buttons = d.buttons;
                dev.active = d.active;

                bool ids_ok = true;
                if (devices::parse_hex_id(d.vid, dev.identity.vid) != ESP_OK)
                {
                    problems.push_back(path + ".vid '" + d.vid + "' is not a 16-bit hex id");
                    ids_ok = false;
                }
                if (devices::parse_hex_id(d.pid, dev.identity.pid) != ESP_OK)
                {
                    problems.push_back(path + ".pid '" + d.pid + "' is not a 16-bit hex id");
                    ids_ok = false;
                }
                if (ids_ok)
                {
                    auto dup = seen.find(dev.identity);
                    if (dup != seen.end())
                        problems.push_back(path + " has the same vid/pid as '" + dup->second + "'");
                    else
                        seen[dev.identity] = d.name;
                }
                if (d.command.empty())
                    problems.push_back(path + ".command is empty");

                auto type = doc.device_types.find(d.type);
                if (type == doc.device_types.end())
                {
                    problems.push_back(path + ".type '" + d.type + "' is not an ontology device type");
                    continue;
                }

                bool controls_ok = true;
                for (const auto &a : d.axes)
                {
                    if (!contains(type->second.axes, a))
                    {
                        problems.push_back(path + ".axes '" + a + "' is not an axis of '" + d.type + "'");
                        controls_ok = false;
                    }
                }
                for (const auto &b : d.buttons)
                {
                    if (!contains(type->second.buttons, b))
                    {
                        problems.push_back(path + ".buttons '" + b + "' is not a button of '" + d.type + "'");
                        controls_ok = false;
                    }
                }
                if (!controls_ok)
                    continue;

                dev.calibration = reg.calibration_for(d.name);
                for (const auto &a : dev.axes)
                    bind_control(dev, a, false);
                for (const auto &b : dev.buttons)
                    bind_control(dev, b, true);

                reg.devices_.push_back(std::move(dev));
            }
        }
    };

    esp_err_t Registry::build(const Document &doc, std::unique_ptr<Registry> &out, std::vector<std::string> &problems)
    {
        std::unique_ptr<Registry> reg(new Registry());
        std::size_t before = problems.size();

        RegistryBuilder builder{doc, *reg, problems};
        builder.check_globals();
        builder.check_catalog();
        builder.check_commands();
        builder.check_visualisation();
        builder.check_calibration();
        builder.check_device_mappings();
        builder.bind_devices();

        if (problems.size() != before)
        {
            for (std::size_t i = before; i < problems.size(); ++i)
            {
                ESP_LOGE(TAG, "%s", problems[i].c_str());
            }
            ESP_LOGE(TAG, "configuration rejected: %u problem(s)", static_cast<unsigned>(problems.size() - before));
            return MDOF_ERR_CONFIG;
        }

        ESP_LOGI(TAG, "visualisation '%s' -> %s:%u, %u device(s)",
                 reg->visualisation_.name.c_str(), reg->visualisation_.endpoint.host.c_str(),
                 reg->visualisation_.endpoint.port, static_cast<unsigned>(reg->devices_.size()));
        out = std::move(reg);
        return ESP_OK;
    }

    const DeviceBinding *Registry::find_device(const devices::DeviceIdentity &identity) const
    {
        for (const auto &d : devices_)
        {
            if (d.identity == identity)
                return &d;
        }
        return nullptr;
    }

    const DeviceBinding *Registry::find_device(const std::string &name) const
    {
        for (const auto &d : devices_)
        {
            if (d.name == name)
                return &d;
        }
        return nullptr;
    }

    const CatalogEntry *Registry::find_transform(const std::string &qualified_name) const
    {
        auto it = catalog_.find(qualified_name);
        return it == catalog_.end() ? nullptr : &it->second;
    }

    const command::Template *Registry::find_command(const std::string &key) const
    {
        auto it = commands_.find(key);
        return it == commands_.end() ? nullptr : &it->second;
    }

    calibration::Effective Registry::calibration_for(const std::string &device_name) const
    {
        auto it = device_profiles_.find(device_name);
        return calibration::merge(default_profile_, it == device_profiles_.end() ? nullptr : &it->second);
    }

} // namespace config
