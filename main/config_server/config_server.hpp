#pragma once

#include "esp_err.h"

#include <string>
#include <vector>

namespace config_server
{

    // Start the configuration HTTP API (in current Wi-Fi mode).
    // `options` are the selectable visualisations, `fallback` the selection
    // used when none is stored.
    esp_err_t start(const std::vector<std::string> &options, const std::string &fallback);

    // Stop configuration HTTP server if running.
    void stop();

} // namespace config_server
