#pragma once

#include "esp_err.h"

namespace event_logger
{

    // Register a handler on the default ESP event loop
    // that logs every BRIDGE_EVENTS event.
    esp_err_t init();

} // namespace event_logger
