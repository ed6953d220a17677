#pragma once

#include "esp_err.h"

// Project error codes, allocated above the ESP-IDF component ranges.
#define MDOF_ERR_BASE 0x7100

#define MDOF_ERR_CONFIG (MDOF_ERR_BASE + 1)              // invalid or unresolvable configuration
#define MDOF_ERR_DEVICE_NOT_FOUND (MDOF_ERR_BASE + 2)    // no descriptor, no driver, or driver failed to open
#define MDOF_ERR_DEVICE_DISCONNECTED (MDOF_ERR_BASE + 3) // driver signalled device removal
#define MDOF_ERR_TRANSMIT (MDOF_ERR_BASE + 4)            // datagram could not be sent

// Like esp_err_to_name(), but also knows the MDOF_ERR_* codes.
const char *mdof_err_to_name(esp_err_t err);
