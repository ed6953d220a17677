#include "esp_err.h"
#include "esp_event.h"
#include "esp_log.h"
#include "esp_timer.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "transport/wifi_manager.h"
#include "app/app_config.hpp"
#include "app/app_events.hpp"
#include "app/app_state.hpp"
#include "app/event_logger.hpp"
#include "app/orchestrator.hpp"
#include "config/config.hpp"
#include "config/registry.hpp"
#include "config_server/config_server.hpp"
#include "config_server/config_store.hpp"
#include "core/mdof_err.hpp"
#include "devices/board_pins.h"
#include "devices/hid_drivers.hpp"
#include "devices/hid_report_link.hpp"
#include "devices/knob_driver.hpp"
#include "devices/usb_hid_host.hpp"
#include "infra/transport/udp_transport.hpp"

static const char *TAG_APP = "app";

AppState g_app_state = AppState::BootStorage;

namespace
{
    constexpr const char *kConfigApSsid = "mdof-bridge-setup";
    constexpr int32_t kMinRssi = -85;

    hid::ReportLink s_report_link;
    usb_hid::UsbHidHost s_usb_host(s_report_link);
    std::unique_ptr<config::Registry> s_registry;
    std::unique_ptr<orchestrator::Orchestrator> s_orchestrator;
} // namespace

static void set_app_state(AppState new_state)
{
    if (g_app_state == new_state)
    {
        return;
    }
    AppState old = g_app_state;
    g_app_state = new_state;
    ESP_LOGI(TAG_APP, "%s -> %s", app_state_to_string(old), app_state_to_string(new_state));
    (void)app_events::post_app_state_changed(old, new_state, esp_timer_get_time());
}

static void park()
{
    for (;;)
    {
        vTaskDelay(portMAX_DELAY);
    }
}

static void halt(const char *reason)
{
    ESP_LOGE(TAG_APP, "Halted: %s", reason);
    set_app_state(AppState::Halted);
    park();
}

// Serve the configuration API on a soft-AP until the user reboots.
static void enter_config_mode(const config::Document *doc)
{
    set_app_state(AppState::ConfigMode);
    esp_err_t err = wifi_manager_start_ap_config(kConfigApSsid, nullptr);
    if (err != ESP_OK)
    {
        halt("config AP failed to start");
    }

    std::vector<std::string> options;
    std::string fallback;
    if (doc)
    {
        options = doc->visualisation_options;
        fallback = doc->selected_visualisation;
    }
    err = config_server::start(options, fallback);
    if (err != ESP_OK)
    {
        halt("config server failed to start");
    }
    ESP_LOGI(TAG_APP, "Config mode: AP '%s' with HTTP config server", kConfigApSsid);
    park();
}

// Replace the document's selected visualisation with the one stored in NVS,
// if it is still one of the options.
static void apply_stored_selection(config::Document &doc)
{
    std::string stored;
    if (config_store::load_visualisation(stored) != ESP_OK || stored.empty())
    {
        return;
    }
    const auto &options = doc.visualisation_options;
    if (std::find(options.begin(), options.end(), stored) == options.end())
    {
        ESP_LOGW(TAG_APP, "Stored visualisation '%s' is not an option, keeping '%s'", stored.c_str(),
                 doc.selected_visualisation.c_str());
        return;
    }
    doc.selected_visualisation = stored;
}

static std::unique_ptr<devices::IInputDriver> make_input_driver(const config::DeviceBinding &device)
{
    if (device.library == knob::kLibraryKnob)
    {
        return std::unique_ptr<devices::IInputDriver>(new knob::KnobDriver(BSP_ENCODER_A, BSP_ENCODER_B, BSP_BTN_PRESS));
    }
    return hid::make_driver(device.library, s_report_link);
}

static std::unique_ptr<transport::ITransport> make_transport()
{
    return std::unique_ptr<transport::ITransport>(new transport::UdpTransport());
}

extern "C" void app_main(void)
{
    set_app_state(AppState::BootStorage);
    if (config_store::init() != ESP_OK)
    {
        halt("NVS init failed");
    }
    ESP_ERROR_CHECK(esp_event_loop_create_default());
    if (event_logger::init() != ESP_OK)
    {
        ESP_LOGW(TAG_APP, "Event logger not registered");
    }

    config::Document doc;
    std::vector<std::string> problems;
    esp_err_t cfg_err = config::load_embedded(doc, problems);

    set_app_state(AppState::BootNetwork);
    if (wifi_manager_init() != ESP_OK)
    {
        halt("WiFi manager init failed");
    }
    if (!config_store::has_basic_config())
    {
        ESP_LOGW(TAG_APP, "No Wi-Fi config stored, entering config mode");
        enter_config_mode(cfg_err == ESP_OK ? &doc : nullptr);
    }
    if (wifi_manager_connect_best_known(kMinRssi) != ESP_OK ||
        !wifi_manager_wait_ip(static_cast<int>(app_config::kWifiConnectTimeoutMs)))
    {
        ESP_LOGW(TAG_APP, "No known network reachable, entering config mode");
        enter_config_mode(cfg_err == ESP_OK ? &doc : nullptr);
    }

    set_app_state(AppState::BootConfig);
    if (cfg_err != ESP_OK)
    {
        ESP_LOGE(TAG_APP, "Embedded configuration invalid (%u problems): %s", static_cast<unsigned>(problems.size()),
                 mdof_err_to_name(cfg_err));
        halt("configuration");
    }
    apply_stored_selection(doc);

    esp_err_t err = config::Registry::build(doc, s_registry, problems);
    if (err != ESP_OK)
    {
        ESP_LOGE(TAG_APP, "Registry build failed (%u problems): %s", static_cast<unsigned>(problems.size()),
                 mdof_err_to_name(err));
        halt("configuration");
    }
    const config::ActiveVisualisation &vis = s_registry->visualisation();
    ESP_LOGI(TAG_APP, "Visualisation '%s' at %s:%u", vis.name.c_str(), vis.endpoint.host.c_str(),
             static_cast<unsigned>(vis.endpoint.port));

    err = s_usb_host.start();
    if (err != ESP_OK)
    {
        ESP_LOGW(TAG_APP, "USB host not started (%s), HID devices unavailable", esp_err_to_name(err));
    }
    else
    {
        vTaskDelay(pdMS_TO_TICKS(app_config::kUsbEnumerationWaitMs));
    }

    s_orchestrator.reset(new orchestrator::Orchestrator(*s_registry, make_input_driver, make_transport));
    std::vector<orchestrator::StartResult> results = s_orchestrator->start();

    std::size_t running = 0;
    for (const auto &r : results)
    {
        if (r.err == ESP_OK)
        {
            ++running;
            ESP_LOGI(TAG_APP, "  %-24s running", r.device.c_str());
        }
        else
        {
            ESP_LOGW(TAG_APP, "  %-24s %s", r.device.c_str(), mdof_err_to_name(r.err));
        }
    }
    ESP_LOGI(TAG_APP, "%u of %u devices running", static_cast<unsigned>(running),
             static_cast<unsigned>(results.size()));

    set_app_state(AppState::Running);
}
