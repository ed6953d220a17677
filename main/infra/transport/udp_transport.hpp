#pragma once

#include "infra/transport/i_transport.hpp"

#include <string>

#include <netinet/in.h>

namespace transport {

// IPv4 UDP sender owning one socket. Not shared between tasks: each device
// session owns its own instance, so datagrams never interleave.
class UdpTransport : public ITransport {
public:
    UdpTransport() = default;
    ~UdpTransport() override;
    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    esp_err_t start() override;
    esp_err_t send(const char* host, uint16_t port, const char* payload, size_t len) override;
    void stop() override;
    bool is_started() const override { return sock_ >= 0; }

private:
    esp_err_t resolve(const char* host, uint16_t port);

    int sock_ = -1;
    std::string cached_host_;
    uint16_t cached_port_ = 0;
    sockaddr_in cached_addr_{};
    bool cached_ = false;
};

} // namespace transport
