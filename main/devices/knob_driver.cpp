#include "devices/knob_driver.hpp"

#include "app/app_config.hpp"
#include "core/mdof_err.hpp"

#include "esp_log.h"
#include "esp_timer.h"

#include <algorithm>

namespace knob
{

    namespace
    {
        static const char *TAG = "knob";

        constexpr UBaseType_t kQueueLength = 16;

        struct Registration
        {
            const char *what;
            esp_err_t err;
        };

        bool declared(const std::vector<std::string> &list, const char *name)
        {
            return std::find(list.begin(), list.end(), name) != list.end();
        }
    } // namespace

    KnobDriver::KnobDriver(int gpio_encoder_a, int gpio_encoder_b, int gpio_button)
        : gpio_a_(gpio_encoder_a), gpio_b_(gpio_encoder_b), gpio_btn_(gpio_button)
    {
    }

    KnobDriver::~KnobDriver()
    {
        close();
    }

    // iot_knob / iot_button callbacks run in esp_timer task context.
    void KnobDriver::knob_cb(void *arg, void *data)
    {
        auto *self = static_cast<KnobDriver *>(data);
        knob_event_t ev = iot_knob_get_event(arg);
        Event out{Kind::Turn, 0, esp_timer_get_time()};
        if (ev == KNOB_RIGHT)
            out.value = 1;
        else if (ev == KNOB_LEFT)
            out.value = -1;
        else
            return;
        self->push(out);
    }

    void KnobDriver::button_cb(void *arg, void *data)
    {
        auto *self = static_cast<KnobDriver *>(data);
        button_event_t ev = iot_button_get_event(static_cast<button_handle_t>(arg));
        Event out{Kind::Press, 0, esp_timer_get_time()};
        if (ev == BUTTON_PRESS_DOWN)
            out.value = 1;
        else if (ev != BUTTON_PRESS_UP)
            return;
        self->push(out);
    }

    void KnobDriver::push(const Event &ev)
    {
        if (queue_ && xQueueSend(queue_, &ev, 0) != pdTRUE)
        {
            ESP_LOGD(TAG, "event queue full, dropped");
        }
    }

    esp_err_t KnobDriver::open(const devices::OpenParams &params)
    {
        if (queue_)
        {
            return ESP_ERR_INVALID_STATE;
        }
        report_rotation_ = declared(params.axes, "rotation");
        report_press_ = declared(params.buttons, "press");

        queue_ = xQueueCreate(kQueueLength, sizeof(Event));
        if (!queue_)
        {
            return ESP_ERR_NO_MEM;
        }

        knob_config_t cfg = {};
        cfg.default_direction = 0;
        cfg.gpio_encoder_a = static_cast<uint8_t>(gpio_a_);
        cfg.gpio_encoder_b = static_cast<uint8_t>(gpio_b_);
        knob_ = iot_knob_create(&cfg);
        if (!knob_)
        {
            ESP_LOGE(TAG, "iot_knob_create failed");
            close();
            return MDOF_ERR_DEVICE_NOT_FOUND;
        }
        const esp_err_t knob_left = iot_knob_register_cb(knob_, KNOB_LEFT, knob_cb, this);
        const esp_err_t knob_right = iot_knob_register_cb(knob_, KNOB_RIGHT, knob_cb, this);

        button_config_t btn_cfg = {};
        btn_cfg.type = BUTTON_TYPE_GPIO;
        btn_cfg.gpio_button_config.gpio_num = static_cast<gpio_num_t>(gpio_btn_);
        btn_cfg.gpio_button_config.active_level = 0;
        button_ = iot_button_create(&btn_cfg);
        if (!button_)
        {
            ESP_LOGE(TAG, "iot_button_create failed");
            close();
            return MDOF_ERR_DEVICE_NOT_FOUND;
        }
        const esp_err_t press_down = iot_button_register_cb(button_, BUTTON_PRESS_DOWN, button_cb, this);
        const esp_err_t press_up = iot_button_register_cb(button_, BUTTON_PRESS_UP, button_cb, this);

        const Registration registrations[] = {
            {"knob left", knob_left},
            {"knob right", knob_right},
            {"button press down", press_down},
            {"button press up", press_up},
        };
        esp_err_t err = ESP_OK;
        for (const Registration &r : registrations)
        {
            if (r.err != ESP_OK)
            {
                ESP_LOGE(TAG, "%s callback registration failed: %s", r.what, esp_err_to_name(r.err));
                if (err == ESP_OK)
                    err = r.err;
            }
        }
        if (err != ESP_OK)
        {
            close();
            return err;
        }

        ESP_LOGI(TAG, "knob on GPIO %d/%d, button on GPIO %d", gpio_a_, gpio_b_, gpio_btn_);
        return ESP_OK;
    }

    esp_err_t KnobDriver::poll(devices::RawSample &out, std::uint32_t wait_ms)
    {
        if (!queue_)
        {
            return ESP_ERR_INVALID_STATE;
        }
        Event ev{};
        if (xQueueReceive(queue_, &ev, pdMS_TO_TICKS(wait_ms)) != pdTRUE)
        {
            return ESP_ERR_TIMEOUT;
        }
        out.timestamp_us = ev.timestamp_us;
        if (ev.kind == Kind::Turn && report_rotation_)
            out.axes["rotation"] = ev.value * app_config::kKnobStepValue;
        else if (ev.kind == Kind::Press && report_press_)
            out.buttons["press"] = ev.value != 0;
        return ESP_OK;
    }

    void KnobDriver::close()
    {
        if (knob_)
        {
            if (iot_knob_delete(knob_) != ESP_OK)
                ESP_LOGW(TAG, "iot_knob_delete failed");
            knob_ = nullptr;
        }
        if (button_)
        {
            if (iot_button_delete(button_) != ESP_OK)
                ESP_LOGW(TAG, "iot_button_delete failed");
            button_ = nullptr;
        }
        if (queue_)
        {
            vQueueDelete(queue_);
            queue_ = nullptr;
        }
    }

} // namespace knob
