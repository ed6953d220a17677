#pragma once

#include "esp_err.h"

#include "config/registry.hpp"
#include "core/command_template.hpp"
#include "infra/transport/i_transport.hpp"

#include <cstddef>
#include <string>

namespace actuation
{

    constexpr std::size_t kMaxDatagram = 256;

    // Renders a command template and sends the text as one datagram to the
    // active visualisation's endpoint. Not thread safe: one per session.
    class Dispatcher
    {
    public:
        Dispatcher(transport::ITransport &transport, const config::Endpoint &endpoint);

        // Numeric command: exactly tmpl.arity() values, in placeholder order.
        esp_err_t dispatch(const command::Template &tmpl, const command::Value *values, std::size_t count);

        // Literal command (no placeholders).
        esp_err_t dispatch_literal(const command::Template &tmpl);

        // Text of the last datagram handed to the transport.
        const char *last_payload() const { return buf_; }

        std::size_t sent() const { return sent_; }
        std::size_t failed() const { return failed_; }

    private:
        esp_err_t send(std::size_t len);

        transport::ITransport &transport_;
        const config::Endpoint &endpoint_;
        char buf_[kMaxDatagram] = {};
        std::size_t sent_ = 0;
        std::size_t failed_ = 0;
    };

} // namespace actuation
