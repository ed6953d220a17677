#pragma once

#include "esp_err.h"

#include <cstddef>
#include <cstdint>

namespace transport {

// Connectionless, best-effort datagram sender. One call is one datagram;
// nothing is acknowledged or retried.
class ITransport {
public:
    virtual ~ITransport() = default;
    virtual esp_err_t start() = 0;
    virtual esp_err_t send(const char* host, uint16_t port, const char* payload, size_t len) = 0;
    virtual void stop() = 0;
    virtual bool is_started() const = 0;
};

} // namespace transport
