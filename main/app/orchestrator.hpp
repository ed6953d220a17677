#pragma once

#include "esp_err.h"

#include "app/device_session.hpp"
#include "config/registry.hpp"
#include "devices/input_driver.hpp"
#include "infra/transport/i_transport.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace orchestrator
{

    struct StartResult
    {
        std::string device;
        esp_err_t err = ESP_OK;
    };

    // Returns null when no driver serves the device's library tag.
    using DriverFactory = std::function<std::unique_ptr<devices::IInputDriver>(const config::DeviceBinding &)>;
    using TransportFactory = std::function<std::unique_ptr<transport::ITransport>()>;

    // Runs one DeviceSession per device. Sessions never wait on each other;
    // a failing device only shows up in its own StartResult.
    class Orchestrator
    {
    public:
        Orchestrator(const config::Registry &registry, DriverFactory drivers, TransportFactory transports);
        ~Orchestrator();

        Orchestrator(const Orchestrator &) = delete;
        Orchestrator &operator=(const Orchestrator &) = delete;

        // Start every active device.
        std::vector<StartResult> start();
        // Start the named devices only.
        std::vector<StartResult> start(const std::vector<std::string> &names);

        // Stop one session and wait for it to close. Other sessions keep
        // running. ESP_ERR_NOT_FOUND if no such session, ESP_ERR_TIMEOUT if
        // it did not close within app_config::kSessionStopTimeoutMs. Safe to
        // call concurrently for the same name.
        esp_err_t stop(const std::string &name);
        void stop_all();

        // State of a session; Closed if there is none.
        session::State state(const std::string &name) const;
        bool stats(const std::string &name, session::Stats &out) const;
        std::size_t session_count() const;

    private:
        StartResult start_one(const config::DeviceBinding &device);

        const config::Registry &registry_;
        DriverFactory drivers_;
        TransportFactory transports_;

        mutable std::mutex mutex_;
        // Shared so a stop in progress keeps its session alive while the entry is
        // replaced or erased by another caller.
        std::map<std::string, std::shared_ptr<session::DeviceSession>> sessions_;
    };

} // namespace orchestrator
