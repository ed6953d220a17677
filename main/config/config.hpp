#pragma once

#include "esp_err.h"

#include "core/calibration.hpp"
#include "core/transform.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

// Typed view of the JSON configuration document. Parsing only checks shape
// and value types; cross references are checked by config::Registry.
namespace config
{

    struct DeviceType
    {
        std::vector<std::string> axes;
        std::vector<std::string> buttons;
        std::vector<std::string> functions;
    };

    struct VisualisationTarget
    {
        std::string name;
        std::string type;
        std::string udp_ip;
        int udp_port = 0;
        std::string command;
        std::vector<std::string> command_cycle; // alternates after `command`
        std::vector<double> channel_signs;
        int step_slot = -1;
    };

    struct TransformRef
    {
        std::string name; // "family.kind"
        transform::ParamMap params;
    };

    struct ControlMapping
    {
        bool has_transform = false;
        TransformRef transform;
        int channel = -1;
    };

    struct CatalogEntry
    {
        std::string description;
        transform::ParamMap params;
    };

    struct InputDevice
    {
        std::string name;
        std::string vid;
        std::string pid;
        std::string type;
        std::string library;
        std::string command;
        std::vector<std::string> axes;
        std::vector<std::string> buttons;
        bool active = true;
    };

    struct Document
    {
        std::map<std::string, DeviceType> device_types;
        std::vector<std::string> visualisation_types;

        std::vector<std::string> visualisation_options;
        std::string selected_visualisation;
        std::map<std::string, VisualisationTarget> visualisations;

        int send_every = 1;
        int poll_wait_ms = 20;
        std::map<std::string, std::string> commands;

        calibration::Profile default_calibration;
        std::map<std::string, calibration::Profile> device_calibrations;

        std::vector<InputDevice> input_devices; // document order
        std::map<std::string, CatalogEntry> catalog; // keyed "family.kind"
        std::map<std::string, std::map<std::string, ControlMapping>> device_mappings; // type -> control
    };

    // Parse a JSON document. Malformed JSON or wrongly typed values fail with
    // MDOF_ERR_CONFIG; every problem found is appended to `problems`.
    esp_err_t parse(const char *text, std::size_t len, Document &out, std::vector<std::string> &problems);

    // Parse the document embedded into the image (data/mdof_config.json).
    esp_err_t load_embedded(Document &out, std::vector<std::string> &problems);

} // namespace config
