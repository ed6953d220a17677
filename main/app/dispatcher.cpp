#include "dispatcher.hpp"

#include "core/mdof_err.hpp"
#include "esp_log.h"

namespace actuation
{

    namespace
    {
        static const char *TAG = "dispatcher";
    }

    Dispatcher::Dispatcher(transport::ITransport &transport, const config::Endpoint &endpoint)
        : transport_(transport), endpoint_(endpoint)
    {
    }

    esp_err_t Dispatcher::dispatch(const command::Template &tmpl, const command::Value *values, std::size_t count)
    {
        std::size_t len = 0;
        esp_err_t err = tmpl.render(values, count, buf_, sizeof(buf_), len);
        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "render '%s' failed: %s", tmpl.text().c_str(), esp_err_to_name(err));
            ++failed_;
            return err;
        }
        return send(len);
    }

    esp_err_t Dispatcher::dispatch_literal(const command::Template &tmpl)
    {
        if (!tmpl.is_literal())
        {
            return ESP_ERR_INVALID_ARG;
        }
        return dispatch(tmpl, nullptr, 0);
    }

    esp_err_t Dispatcher::send(std::size_t len)
    {
        ESP_LOGD(TAG, "-> %s:%u \"%s\"", endpoint_.host.c_str(), endpoint_.port, buf_);
        esp_err_t err = transport_.send(endpoint_.host.c_str(), endpoint_.port, buf_, len);
        if (err != ESP_OK)
        {
            ++failed_;
            ESP_LOGW(TAG, "send to %s:%u failed: %s", endpoint_.host.c_str(), endpoint_.port, mdof_err_to_name(err));
            return err;
        }
        ++sent_;
        return ESP_OK;
    }

} // namespace actuation
