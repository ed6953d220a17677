#include "app_events.hpp"

#include "esp_log.h"
#include <cstdio>

ESP_EVENT_DEFINE_BASE(BRIDGE_EVENTS);

namespace app_events
{

    namespace
    {
        static const char *TAG = "app_events";

        esp_err_t post(int32_t id, const void *payload, std::size_t size)
        {
            esp_err_t err = esp_event_post(BRIDGE_EVENTS, id, payload, size, 0);
            if (err != ESP_OK)
            {
                ESP_LOGD(TAG, "post %s failed: %s", id_to_string(id), esp_err_to_name(err));
            }
            return err;
        }

        void copy_name(char (&dst)[kNameLen], const char *src)
        {
            std::snprintf(dst, sizeof(dst), "%s", src ? src : "");
        }
    } // namespace

    esp_err_t post_session_state(const char *device, int old_state, int new_state, std::int64_t timestamp_us)
    {
        SessionStatePayload payload{};
        copy_name(payload.device, device);
        payload.old_state = old_state;
        payload.new_state = new_state;
        payload.timestamp_us = timestamp_us;
        return post(SESSION_STATE_CHANGED, &payload, sizeof(payload));
    }

    esp_err_t post_device_disconnected(const char *device, std::int64_t timestamp_us)
    {
        DevicePayload payload{};
        copy_name(payload.device, device);
        payload.timestamp_us = timestamp_us;
        return post(DEVICE_DISCONNECTED, &payload, sizeof(payload));
    }

    esp_err_t post_dispatch_failed(const char *device, const char *command, esp_err_t error, std::int64_t timestamp_us)
    {
        DispatchFailedPayload payload{};
        copy_name(payload.device, device);
        copy_name(payload.command, command);
        payload.error = error;
        payload.timestamp_us = timestamp_us;
        return post(DISPATCH_FAILED, &payload, sizeof(payload));
    }

    esp_err_t post_button_edge(const char *device, const char *button, bool pressed, std::int64_t timestamp_us)
    {
        ButtonEdgePayload payload{};
        copy_name(payload.device, device);
        copy_name(payload.button, button);
        payload.pressed = pressed;
        payload.timestamp_us = timestamp_us;
        return post(BUTTON_EDGE, &payload, sizeof(payload));
    }

    esp_err_t post_sensitivity_step(const char *device, int step, std::int64_t timestamp_us)
    {
        SensitivityStepPayload payload{};
        copy_name(payload.device, device);
        payload.step = step;
        payload.timestamp_us = timestamp_us;
        return post(SENSITIVITY_STEP_CHANGED, &payload, sizeof(payload));
    }

    esp_err_t post_app_state_changed(AppState old_state, AppState new_state, std::int64_t timestamp_us)
    {
        AppStateChangedPayload payload{};
        payload.old_state = static_cast<int>(old_state);
        payload.new_state = static_cast<int>(new_state);
        payload.timestamp_us = timestamp_us;
        return post(APP_STATE_CHANGED, &payload, sizeof(payload));
    }

    const char *id_to_string(int32_t id)
    {
        switch (id)
        {
        case SESSION_STATE_CHANGED:
            return "SESSION_STATE_CHANGED";
        case DEVICE_DISCONNECTED:
            return "DEVICE_DISCONNECTED";
        case DISPATCH_FAILED:
            return "DISPATCH_FAILED";
        case BUTTON_EDGE:
            return "BUTTON_EDGE";
        case SENSITIVITY_STEP_CHANGED:
            return "SENSITIVITY_STEP_CHANGED";
        case APP_STATE_CHANGED:
            return "APP_STATE_CHANGED";
        default:
            return "UNKNOWN";
        }
    }

} // namespace app_events

const char *app_state_to_string(AppState state)
{
    switch (state)
    {
    case AppState::BootStorage:
        return "BootStorage";
    case AppState::BootNetwork:
        return "BootNetwork";
    case AppState::BootConfig:
        return "BootConfig";
    case AppState::Running:
        return "Running";
    case AppState::ConfigMode:
        return "ConfigMode";
    case AppState::Halted:
        return "Halted";
    }
    return "?";
}
