#include "infra/transport/udp_transport.hpp"

#include "core/mdof_err.hpp"
#include "esp_log.h"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

namespace transport {

namespace {
const char* TAG = "udp";
}

UdpTransport::~UdpTransport()
{
    stop();
}

esp_err_t UdpTransport::start()
{
    if (sock_ >= 0) {
        return ESP_OK;
    }
    sock_ = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (sock_ < 0) {
        ESP_LOGE(TAG, "socket() failed: errno %d", errno);
        return ESP_FAIL;
    }
    return ESP_OK;
}

void UdpTransport::stop()
{
    if (sock_ >= 0) {
        close(sock_);
        sock_ = -1;
    }
    cached_ = false;
}

esp_err_t UdpTransport::resolve(const char* host, uint16_t port)
{
    if (cached_ && cached_port_ == port && cached_host_ == host) {
        return ESP_OK;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host, &addr.sin_addr) != 1) {
        addrinfo hints{};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_DGRAM;
        addrinfo* res = nullptr;
        int rc = getaddrinfo(host, nullptr, &hints, &res);
        if (rc != 0 || res == nullptr) {
            ESP_LOGW(TAG, "cannot resolve %s (%d)", host, rc);
            if (res) {
                freeaddrinfo(res);
            }
            return MDOF_ERR_TRANSMIT;
        }
        addr.sin_addr = reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
        freeaddrinfo(res);
    }

    cached_host_ = host;
    cached_port_ = port;
    cached_addr_ = addr;
    cached_ = true;
    return ESP_OK;
}

esp_err_t UdpTransport::send(const char* host, uint16_t port, const char* payload, size_t len)
{
    if (!host || !payload) {
        return ESP_ERR_INVALID_ARG;
    }
    if (sock_ < 0) {
        return ESP_ERR_INVALID_STATE;
    }
    esp_err_t err = resolve(host, port);
    if (err != ESP_OK) {
        return err;
    }

    ssize_t sent = sendto(sock_, payload, len, 0, reinterpret_cast<const sockaddr*>(&cached_addr_), sizeof(cached_addr_));
    if (sent < 0 || static_cast<size_t>(sent) != len) {
        ESP_LOGD(TAG, "sendto %s:%u failed: errno %d", host, port, errno);
        return MDOF_ERR_TRANSMIT;
    }
    return ESP_OK;
}

} // namespace transport
