/**
 * Rotary encoder + push button of the board, exposed as an input device.
 *
 * Axis "rotation": +step / -step per detent (app_config::kKnobStepValue).
 * Button "press": encoder push button state.
 */
#pragma once

#include "devices/input_driver.hpp"

#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"

#include "iot_button.h"
#include "iot_knob.h"

namespace knob
{

    constexpr const char *kLibraryKnob = "knob";

    class KnobDriver : public devices::IInputDriver
    {
    public:
        KnobDriver(int gpio_encoder_a, int gpio_encoder_b, int gpio_button);
        ~KnobDriver() override;

        esp_err_t open(const devices::OpenParams &params) override;
        esp_err_t poll(devices::RawSample &out, std::uint32_t wait_ms) override;
        void close() override;
        const char *name() const override { return kLibraryKnob; }

    private:
        enum class Kind : std::uint8_t
        {
            Turn,
            Press,
        };

        struct Event
        {
            Kind kind;
            std::int8_t value; // detent direction or pressed state
            std::int64_t timestamp_us;
        };

        static void knob_cb(void *arg, void *data);
        static void button_cb(void *arg, void *data);
        void push(const Event &ev);

        int gpio_a_;
        int gpio_b_;
        int gpio_btn_;
        QueueHandle_t queue_ = nullptr;
        knob_handle_t knob_ = nullptr;
        button_handle_t button_ = nullptr;
        bool report_rotation_ = false;
        bool report_press_ = false;
    };

} // namespace knob
