#pragma once

#include "esp_err.h"

#include "config/config.hpp"
#include "core/calibration.hpp"
#include "core/command_template.hpp"
#include "core/transform.hpp"
#include "devices/input_driver.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace config
{

    struct Endpoint
    {
        std::string host;
        std::uint16_t port = 0;
    };

    // Selected visualisation: where every datagram goes and the template the
    // devices' default command keys render through.
    struct ActiveVisualisation
    {
        std::string name;
        std::string type;
        Endpoint endpoint;
        command::Template command;
        std::vector<command::Template> alternates; // next_command cycle after `command`
        std::vector<double> channel_signs;         // empty, or one per placeholder
        int step_slot = -1;

        std::size_t cycle_length() const { return 1 + alternates.size(); }
        // Template at `index` in the cycle: 0 is `command`.
        const command::Template &template_at(std::size_t index) const
        {
            return index == 0 ? command : alternates[index - 1];
        }
    };

    // A command key a device can emit, with the template it renders through.
    struct CommandTarget
    {
        std::string key;
        const command::Template *tmpl = nullptr;
        bool visualisation = false; // default key: apply channel signs and step slot
    };

    enum class BindingKind
    {
        Numeric, // value lands in a channel of a numeric frame
        Literal, // rising edge sends a literal command
        Action,  // rising edge runs `action`
    };

    struct ControlBinding
    {
        std::string control;
        bool button = false;
        BindingKind kind = BindingKind::Numeric;
        std::size_t target = 0; // index into DeviceBinding::targets
        int channel = -1;
        calibration::Action action = calibration::Action::None;
        std::unique_ptr<transform::Transform> transform;
    };

    struct DeviceBinding
    {
        std::string name;
        devices::DeviceIdentity identity;
        std::string type;
        std::string library;
        std::string default_command;
        std::vector<std::string> axes;
        std::vector<std::string> buttons;
        bool active = true;

        calibration::Effective calibration;
        std::vector<CommandTarget> targets;
        std::vector<ControlBinding> bindings;

        const ControlBinding *find_binding(const std::string &control, bool button) const;
    };

    struct RegistryBuilder;

    // Validated, read-only view of the whole configuration. Built once at
    // startup and shared by reference with every session; nothing changes
    // it afterwards.
    class Registry
    {
    public:
        Registry(const Registry &) = delete;
        Registry &operator=(const Registry &) = delete;

        // Resolve and check every reference in `doc`. All problems are
        // collected in `problems` and logged; any problem fails the whole
        // build with MDOF_ERR_CONFIG.
        static esp_err_t build(const Document &doc, std::unique_ptr<Registry> &out, std::vector<std::string> &problems);

        const DeviceBinding *find_device(const devices::DeviceIdentity &identity) const;
        const DeviceBinding *find_device(const std::string &name) const;
        const std::vector<DeviceBinding> &devices() const { return devices_; }

        // Catalog entry for "family.kind", or null.
        const CatalogEntry *find_transform(const std::string &qualified_name) const;

        const ActiveVisualisation &visualisation() const { return visualisation_; }
        const std::vector<std::string> &visualisation_options() const { return options_; }

        // Named actuation command, or null.
        const command::Template *find_command(const std::string &key) const;

        // Default profile merged with the device's own profile.
        calibration::Effective calibration_for(const std::string &device_name) const;

        int send_every() const { return send_every_; }
        int poll_wait_ms() const { return poll_wait_ms_; }

    private:
        friend struct RegistryBuilder;
        Registry() = default;

        std::vector<DeviceBinding> devices_;
        std::map<std::string, CatalogEntry> catalog_;
        std::map<std::string, command::Template> commands_;
        calibration::Profile default_profile_;
        std::map<std::string, calibration::Profile> device_profiles_;
        ActiveVisualisation visualisation_;
        std::vector<std::string> options_;
        int send_every_ = 1;
        int poll_wait_ms_ = 20;
    };

} // namespace config
