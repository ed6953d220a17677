#pragma once

#include "esp_err.h"
#include <cstddef>
#include <string>

// NVS-backed device-local settings: known Wi-Fi networks and the selected
// visualisation.
namespace config_store
{

    constexpr std::size_t kMaxWifiAps = 8;

    struct WifiAp
    {
        char ssid[32]{};
        char password[64]{};
    };

    // Initialize NVS namespace (must be called before other operations).
    esp_err_t init();

    // Load Wi-Fi AP list into the provided buffer.
    esp_err_t load_wifi(WifiAp *aps, std::size_t max_count, std::size_t &out_count);

    // Replace Wi-Fi AP list with the provided array.
    esp_err_t save_wifi(const WifiAp *aps, std::size_t count);

    // Selected visualisation name; empty when none was stored.
    esp_err_t load_visualisation(std::string &name);
    esp_err_t save_visualisation(const std::string &name);

    // Return true if there is at least one Wi-Fi AP stored.
    bool has_basic_config();

} // namespace config_store
