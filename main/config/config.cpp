#include "config/config.hpp"

#include "core/mdof_err.hpp"

#include "cJSON.h"
#include "esp_log.h"

#include <cmath>

namespace config
{

    namespace
    {
        constexpr const char *TAG = "config";

        using Problems = std::vector<std::string>;

        void problem(Problems &problems, const std::string &path, const char *what)
        {
            problems.push_back(path + " " + what);
        }

        // Child of an object. A present child of the wrong JSON type counts as
        // a problem; an absent one is only a problem when `required`.
        const cJSON *child(const cJSON *obj, const char *key, const std::string &path, Problems &problems, bool required)
        {
            const cJSON *item = cJSON_GetObjectItemCaseSensitive(obj, key);
            if (!item && required)
            {
                problem(problems, path + "." + key, "is missing");
            }
            return item;
        }

        bool read_string(const cJSON *item, const std::string &path, std::string &out, Problems &problems)
        {
            if (!cJSON_IsString(item) || item->valuestring == nullptr)
            {
                problem(problems, path, "must be a string");
                return false;
            }
            out = item->valuestring;
            return true;
        }

        bool read_number(const cJSON *item, const std::string &path, double &out, Problems &problems)
        {
            if (!cJSON_IsNumber(item) || !std::isfinite(item->valuedouble))
            {
                problem(problems, path, "must be a finite number");
                return false;
            }
            out = item->valuedouble;
            return true;
        }

        bool read_int(const cJSON *item, const std::string &path, int &out, Problems &problems)
        {
            double v = 0.0;
            if (!read_number(item, path, v, problems))
                return false;
            if (v != std::floor(v) || std::fabs(v) > 2147483647.0)
            {
                problem(problems, path, "must be an integer");
                return false;
            }
            out = static_cast<int>(v);
            return true;
        }

        bool read_bool(const cJSON *item, const std::string &path, bool &out, Problems &problems)
        {
            if (!cJSON_IsBool(item))
            {
                problem(problems, path, "must be true or false");
                return false;
            }
            out = cJSON_IsTrue(item);
            return true;
        }

        bool expect_object(const cJSON *item, const std::string &path, Problems &problems)
        {
            if (!cJSON_IsObject(item))
            {
                problem(problems, path, "must be an object");
                return false;
            }
            return true;
        }

        void read_string_list(const cJSON *item, const std::string &path, std::vector<std::string> &out, Problems &problems)
        {
            out.clear();
            if (!cJSON_IsArray(item))
            {
                problem(problems, path, "must be a list of strings");
                return;
            }
            int index = 0;
            const cJSON *el = nullptr;
            cJSON_ArrayForEach(el, item)
            {
                std::string s;
                if (read_string(el, path + "[" + std::to_string(index) + "]", s, problems))
                    out.push_back(s);
                ++index;
            }
        }

        void read_params(const cJSON *item, const std::string &path, transform::ParamMap &out, Problems &problems)
        {
            if (!expect_object(item, path, problems))
                return;
            const cJSON *el = nullptr;
            cJSON_ArrayForEach(el, item)
            {
                double v = 0.0;
                if (read_number(el, path + "." + el->string, v, problems))
                    out[el->string] = v;
            }
        }

        void read_mapping(const cJSON *item, const std::string &path, calibration::Mapping &out, Problems &problems)
        {
            if (!expect_object(item, path, problems))
                return;
            const cJSON *el = nullptr;
            cJSON_ArrayForEach(el, item)
            {
                std::string key;
                if (read_string(el, path + "." + el->string, key, problems))
                    out[el->string] = key;
            }
        }

        void parse_ontology(const cJSON *root, Document &doc, Problems &problems)
        {
            const cJSON *ontology = child(root, "ontology", "", problems, true);
            if (!ontology || !expect_object(ontology, "ontology", problems))
                return;

            const cJSON *types = child(ontology, "device_types", "ontology", problems, true);
            if (types && expect_object(types, "ontology.device_types", problems))
            {
                const cJSON *t = nullptr;
                cJSON_ArrayForEach(t, types)
                {
                    std::string path = std::string("ontology.device_types.") + t->string;
                    if (!expect_object(t, path, problems))
                        continue;
                    DeviceType dt;
                    if (const cJSON *a = child(t, "axes", path, problems, false))
                        read_string_list(a, path + ".axes", dt.axes, problems);
                    if (const cJSON *b = child(t, "buttons", path, problems, false))
                        read_string_list(b, path + ".buttons", dt.buttons, problems);
                    if (const cJSON *f = child(t, "functions", path, problems, false))
                        read_string_list(f, path + ".functions", dt.functions, problems);
                    doc.device_types[t->string] = dt;
                }
            }

            const cJSON *vis = child(ontology, "visualisations", "ontology", problems, false);
            if (vis && expect_object(vis, "ontology.visualisations", problems))
            {
                if (const cJSON *types_list = child(vis, "types", "ontology.visualisations", problems, false))
                    read_string_list(types_list, "ontology.visualisations.types", doc.visualisation_types, problems);
            }
        }

        void parse_visualisation(const cJSON *root, Document &doc, Problems &problems)
        {
            const cJSON *vis = child(root, "visualisation", "", problems, true);
            if (!vis || !expect_object(vis, "visualisation", problems))
                return;

            if (const cJSON *options = child(vis, "options", "visualisation", problems, false))
                read_string_list(options, "visualisation.options", doc.visualisation_options, problems);
            if (const cJSON *selected = child(vis, "selected", "visualisation", problems, true))
                read_string(selected, "visualisation.selected", doc.selected_visualisation, problems);

            const cJSON *targets = child(vis, "targets", "visualisation", problems, true);
            if (!targets || !expect_object(targets, "visualisation.targets", problems))
                return;

            const cJSON *t = nullptr;
            cJSON_ArrayForEach(t, targets)
            {
                std::string path = std::string("visualisation.targets.") + t->string;
                if (!expect_object(t, path, problems))
                    continue;
                VisualisationTarget target;
                target.name = t->string;
                if (const cJSON *v = child(t, "type", path, problems, false))
                    read_string(v, path + ".type", target.type, problems);
                if (const cJSON *v = child(t, "udp_ip", path, problems, false))
                    read_string(v, path + ".udp_ip", target.udp_ip, problems);
                if (const cJSON *v = child(t, "udp_port", path, problems, false))
                    read_int(v, path + ".udp_port", target.udp_port, problems);
                if (const cJSON *v = child(t, "command", path, problems, false))
                    read_string(v, path + ".command", target.command, problems);
                if (const cJSON *v = child(t, "step_slot", path, problems, false))
                    read_int(v, path + ".step_slot", target.step_slot, problems);
                if (const cJSON *v = child(t, "command_cycle", path, problems, false))
                    read_string_list(v, path + ".command_cycle", target.command_cycle, problems);
                if (const cJSON *signs = child(t, "channel_signs", path, problems, false))
                {
                    if (!cJSON_IsArray(signs))
                    {
                        problem(problems, path + ".channel_signs", "must be a list of numbers");
                    }
                    else
                    {
                        int index = 0;
                        const cJSON *el = nullptr;
                        cJSON_ArrayForEach(el, signs)
                        {
                            double s = 0.0;
                            if (read_number(el, path + ".channel_signs[" + std::to_string(index) + "]", s, problems))
                                target.channel_signs.push_back(s);
                            ++index;
                        }
                    }
                }
                doc.visualisations[target.name] = target;
            }
        }

        void parse_actuation(const cJSON *root, Document &doc, Problems &problems)
        {
            const cJSON *act = child(root, "actuation", "", problems, false);
            if (!act || !expect_object(act, "actuation", problems))
                return;

            const cJSON *cfg = child(act, "config", "actuation", problems, false);
            if (cfg && expect_object(cfg, "actuation.config", problems))
            {
                if (const cJSON *v = child(cfg, "send_every", "actuation.config", problems, false))
                    read_int(v, "actuation.config.send_every", doc.send_every, problems);
                if (const cJSON *v = child(cfg, "poll_wait_ms", "actuation.config", problems, false))
                    read_int(v, "actuation.config.poll_wait_ms", doc.poll_wait_ms, problems);
            }

            const cJSON *commands = child(act, "commands", "actuation", problems, false);
            if (commands && expect_object(commands, "actuation.commands", problems))
            {
                const cJSON *c = nullptr;
                cJSON_ArrayForEach(c, commands)
                {
                    std::string text;
                    if (read_string(c, std::string("actuation.commands.") + c->string, text, problems))
                        doc.commands[c->string] = text;
                }
            }
        }

        void parse_profile(const cJSON *item, const std::string &path, calibration::Profile &out, Problems &problems)
        {
            if (!expect_object(item, path, problems))
                return;
            if (const cJSON *v = child(item, "deadzone", path, problems, false))
                out.has_deadzone = read_number(v, path + ".deadzone", out.deadzone, problems);
            if (const cJSON *v = child(item, "scale_factor", path, problems, false))
                out.has_scale_factor = read_number(v, path + ".scale_factor", out.scale_factor, problems);
            if (const cJSON *v = child(item, "axis_mapping", path, problems, false))
                read_mapping(v, path + ".axis_mapping", out.axis_mapping, problems);
            if (const cJSON *v = child(item, "button_mapping", path, problems, false))
                read_mapping(v, path + ".button_mapping", out.button_mapping, problems);
        }

        void parse_calibration(const cJSON *root, Document &doc, Problems &problems)
        {
            const cJSON *cal = child(root, "calibration", "", problems, false);
            if (!cal || !expect_object(cal, "calibration", problems))
                return;

            if (const cJSON *def = child(cal, "default", "calibration", problems, false))
                parse_profile(def, "calibration.default", doc.default_calibration, problems);

            const cJSON *devices = child(cal, "devices", "calibration", problems, false);
            if (devices && expect_object(devices, "calibration.devices", problems))
            {
                const cJSON *d = nullptr;
                cJSON_ArrayForEach(d, devices)
                {
                    calibration::Profile profile;
                    parse_profile(d, std::string("calibration.devices.") + d->string, profile, problems);
                    doc.device_calibrations[d->string] = profile;
                }
            }
        }

        void parse_input_devices(const cJSON *root, Document &doc, Problems &problems)
        {
            const cJSON *devices = child(root, "input_devices", "", problems, true);
            if (!devices || !expect_object(devices, "input_devices", problems))
                return;

            const cJSON *d = nullptr;
            cJSON_ArrayForEach(d, devices)
            {
                std::string path = std::string("input_devices.") + d->string;
                if (!expect_object(d, path, problems))
                    continue;
                InputDevice dev;
                dev.name = d->string;
                if (const cJSON *v = child(d, "vid", path, problems, true))
                    read_string(v, path + ".vid", dev.vid, problems);
                if (const cJSON *v = child(d, "pid", path, problems, true))
                    read_string(v, path + ".pid", dev.pid, problems);
                if (const cJSON *v = child(d, "type", path, problems, true))
                    read_string(v, path + ".type", dev.type, problems);
                if (const cJSON *v = child(d, "library", path, problems, true))
                    read_string(v, path + ".library", dev.library, problems);
                if (const cJSON *v = child(d, "command", path, problems, true))
                    read_string(v, path + ".command", dev.command, problems);
                if (const cJSON *v = child(d, "axes", path, problems, false))
                    read_string_list(v, path + ".axes", dev.axes, problems);
                if (const cJSON *v = child(d, "buttons", path, problems, false))
                    read_string_list(v, path + ".buttons", dev.buttons, problems);
                if (const cJSON *v = child(d, "active", path, problems, false))
                    read_bool(v, path + ".active", dev.active, problems);
                doc.input_devices.push_back(dev);
            }
        }

        void parse_transformations(const cJSON *root, Document &doc, Problems &problems)
        {
            const cJSON *families = child(root, "transformations", "", problems, false);
            if (!families || !expect_object(families, "transformations", problems))
                return;

            const cJSON *family = nullptr;
            cJSON_ArrayForEach(family, families)
            {
                std::string fpath = std::string("transformations.") + family->string;
                if (!expect_object(family, fpath, problems))
                    continue;
                const cJSON *kind = nullptr;
                cJSON_ArrayForEach(kind, family)
                {
                    std::string path = fpath + "." + kind->string;
                    if (!expect_object(kind, path, problems))
                        continue;
                    CatalogEntry entry;
                    if (const cJSON *v = child(kind, "description", path, problems, false))
                        read_string(v, path + ".description", entry.description, problems);
                    if (const cJSON *v = child(kind, "params", path, problems, false))
                        read_params(v, path + ".params", entry.params, problems);
                    doc.catalog[std::string(family->string) + "." + kind->string] = entry;
                }
            }
        }

        void parse_device_mappings(const cJSON *root, Document &doc, Problems &problems)
        {
            const cJSON *types = child(root, "device_mappings", "", problems, false);
            if (!types || !expect_object(types, "device_mappings", problems))
                return;

            const cJSON *type = nullptr;
            cJSON_ArrayForEach(type, types)
            {
                std::string tpath = std::string("device_mappings.") + type->string;
                if (!expect_object(type, tpath, problems))
                    continue;
                auto &controls = doc.device_mappings[type->string];
                const cJSON *control = nullptr;
                cJSON_ArrayForEach(control, type)
                {
                    std::string path = tpath + "." + control->string;
                    if (!expect_object(control, path, problems))
                        continue;
                    ControlMapping mapping;
                    const cJSON *tr = child(control, "transform", path, problems, false);
                    if (tr && expect_object(tr, path + ".transform", problems))
                    {
                        if (const cJSON *v = child(tr, "name", path + ".transform", problems, true))
                            mapping.has_transform = read_string(v, path + ".transform.name", mapping.transform.name, problems);
                        if (const cJSON *v = child(tr, "params", path + ".transform", problems, false))
                            read_params(v, path + ".transform.params", mapping.transform.params, problems);
                    }
                    if (const cJSON *v = child(control, "channel", path, problems, false))
                    {
                        if (read_int(v, path + ".channel", mapping.channel, problems) && mapping.channel < 0)
                        {
                            problem(problems, path + ".channel", "must not be negative");
                            mapping.channel = -1;
                        }
                    }
                    controls[control->string] = mapping;
                }
            }
        }

    } // namespace

    esp_err_t parse(const char *text, std::size_t len, Document &out, std::vector<std::string> &problems)
    {
        if (!text || len == 0)
        {
            problems.push_back("configuration document is empty");
            return MDOF_ERR_CONFIG;
        }

        cJSON *root = cJSON_ParseWithLength(text, len);
        if (!root)
        {
            const char *where = cJSON_GetErrorPtr();
            std::size_t offset = (where && where >= text && where <= text + len) ? static_cast<std::size_t>(where - text) : 0;
            problems.push_back("malformed JSON near offset " + std::to_string(offset));
            return MDOF_ERR_CONFIG;
        }

        std::size_t before = problems.size();
        Document doc;
        if (expect_object(root, "document", problems))
        {
            parse_ontology(root, doc, problems);
            parse_visualisation(root, doc, problems);
            parse_actuation(root, doc, problems);
            parse_calibration(root, doc, problems);
            parse_input_devices(root, doc, problems);
            parse_transformations(root, doc, problems);
            parse_device_mappings(root, doc, problems);
        }
        cJSON_Delete(root);

        if (problems.size() != before)
        {
            for (std::size_t i = before; i < problems.size(); ++i)
            {
                ESP_LOGE(TAG, "%s", problems[i].c_str());
            }
            return MDOF_ERR_CONFIG;
        }

        ESP_LOGI(TAG, "parsed: %u device types, %u input devices, %u visualisations",
                 static_cast<unsigned>(doc.device_types.size()),
                 static_cast<unsigned>(doc.input_devices.size()),
                 static_cast<unsigned>(doc.visualisations.size()));
        out = std::move(doc);
        return ESP_OK;
    }

} // namespace config
