#include "orchestrator.hpp"

#include "app/app_config.hpp"
#include "core/mdof_err.hpp"
#include "esp_log.h"

namespace orchestrator
{

    namespace
    {
        static const char *TAG = "orchestrator";
    }

    Orchestrator::Orchestrator(const config::Registry &registry, DriverFactory drivers, TransportFactory transports)
        : registry_(registry), drivers_(std::move(drivers)), transports_(std::move(transports))
    {
    }

    Orchestrator::~Orchestrator()
    {
        stop_all();
    }

    StartResult Orchestrator::start_one(const config::DeviceBinding &device)
    {
        StartResult result;
        result.device = device.name;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = sessions_.find(device.name);
            if (it != sessions_.end())
            {
                if (it->second->state() != session::State::Closed)
                {
                    result.err = ESP_ERR_INVALID_STATE;
                    return result;
                }
                // Left over after a disconnect.
                sessions_.erase(it);
            }
        }

        std::unique_ptr<devices::IInputDriver> driver = drivers_ ? drivers_(device) : nullptr;
        if (!driver)
        {
            ESP_LOGE(TAG, "no driver for '%s' (library '%s')", device.name.c_str(), device.library.c_str());
            result.err = MDOF_ERR_DEVICE_NOT_FOUND;
            return result;
        }
        std::unique_ptr<transport::ITransport> transport = transports_ ? transports_() : nullptr;
        if (!transport)
        {
            result.err = ESP_ERR_NO_MEM;
            return result;
        }

        std::shared_ptr<session::DeviceSession> s =
            std::make_shared<session::DeviceSession>(registry_, device.name, std::move(driver), std::move(transport));
        result.err = s->open();
        if (result.err == ESP_OK)
        {
            result.err = s->start();
        }
        if (result.err != ESP_OK)
        {
            ESP_LOGE(TAG, "'%s' not started: %s", device.name.c_str(), mdof_err_to_name(result.err));
            return result;
        }

        std::shared_ptr<session::DeviceSession> duplicate;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = sessions_.find(device.name);
            if (it != sessions_.end() && it->second->state() != session::State::Closed)
            {
                // Started by another caller meanwhile; ours is stopped outside the lock.
                duplicate = std::move(s);
                result.err = ESP_ERR_INVALID_STATE;
            }
            else
            {
                sessions_[device.name] = std::move(s);
            }
        }
        return result;
    }

    std::vector<StartResult> Orchestrator::start()
    {
        std::vector<StartResult> report;
        for (const auto &device : registry_.devices())
        {
            if (!device.active)
            {
                ESP_LOGI(TAG, "'%s' inactive, skipped", device.name.c_str());
                continue;
            }
            report.push_back(start_one(device));
        }

        std::size_t ok = 0;
        for (const auto &r : report)
        {
            if (r.err == ESP_OK)
                ++ok;
        }
        ESP_LOGI(TAG, "started %u of %u session(s)", static_cast<unsigned>(ok), static_cast<unsigned>(report.size()));
        return report;
    }

    std::vector<StartResult> Orchestrator::start(const std::vector<std::string> &names)
    {
        std::vector<StartResult> report;
        for (const auto &name : names)
        {
            const config::DeviceBinding *device = registry_.find_device(name);
            if (!device)
            {
                StartResult r;
                r.device = name;
                r.err = MDOF_ERR_DEVICE_NOT_FOUND;
                ESP_LOGE(TAG, "'%s' is not a configured device", name.c_str());
                report.push_back(r);
                continue;
            }
            report.push_back(start_one(*device));
        }
        return report;
    }

    esp_err_t Orchestrator::stop(const std::string &name)
    {
        std::shared_ptr<session::DeviceSession> s;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = sessions_.find(name);
            if (it == sessions_.end())
            {
                return ESP_ERR_NOT_FOUND;
            }
            s = it->second;
        }

        s->request_stop();
        esp_err_t err = s->wait_closed(app_config::kSessionStopTimeoutMs);
        if (err == ESP_ERR_TIMEOUT)
        {
            ESP_LOGW(TAG, "'%s' did not stop within %u ms", name.c_str(), static_cast<unsigned>(app_config::kSessionStopTimeoutMs));
            return err;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(name);
        if (it != sessions_.end() && it->second == s)
        {
            sessions_.erase(it);
            ESP_LOGI(TAG, "'%s' stopped", name.c_str());
        }
        return ESP_OK;
    }

    void Orchestrator::stop_all()
    {
        std::vector<std::string> names;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto &kv : sessions_)
            {
                kv.second->request_stop();
                names.push_back(kv.first);
            }
        }
        for (const auto &name : names)
        {
            esp_err_t err = stop(name);
            if (err != ESP_OK && err != ESP_ERR_NOT_FOUND)
            {
                ESP_LOGW(TAG, "stop '%s': %s", name.c_str(), esp_err_to_name(err));
            }
        }
    }

    session::State Orchestrator::state(const std::string &name) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(name);
        return it == sessions_.end() ? session::State::Closed : it->second->state();
    }

    bool Orchestrator::stats(const std::string &name, session::Stats &out) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(name);
        if (it == sessions_.end())
            return false;
        out = it->second->stats();
        return true;
    }

    std::size_t Orchestrator::session_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.size();
    }

} // namespace orchestrator
