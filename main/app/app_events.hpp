#pragma once

#include "esp_event.h"
#include <cstddef>
#include <cstdint>

#include "app_state.hpp"

// Application-level event base for internal messages
ESP_EVENT_DECLARE_BASE(BRIDGE_EVENTS);

namespace app_events
{

    enum Id : int32_t
    {
        SESSION_STATE_CHANGED = 1,
        DEVICE_DISCONNECTED = 2,
        DISPATCH_FAILED = 3,
        BUTTON_EDGE = 10,
        SENSITIVITY_STEP_CHANGED = 11,
        APP_STATE_CHANGED = 100,
    };

    constexpr std::size_t kNameLen = 32;

    struct SessionStatePayload
    {
        char device[kNameLen];
        int old_state = 0; // static_cast<int>(SessionState)
        int new_state = 0;
        std::int64_t timestamp_us = 0;
    };

    struct DevicePayload
    {
        char device[kNameLen];
        std::int64_t timestamp_us = 0;
    };

    struct DispatchFailedPayload
    {
        char device[kNameLen];
        char command[kNameLen];
        esp_err_t error = ESP_OK;
        std::int64_t timestamp_us = 0;
    };

    struct ButtonEdgePayload
    {
        char device[kNameLen];
        char button[kNameLen];
        bool pressed = false;
        std::int64_t timestamp_us = 0;
    };

    struct SensitivityStepPayload
    {
        char device[kNameLen];
        int step = 0;
        std::int64_t timestamp_us = 0;
    };

    struct AppStateChangedPayload
    {
        int old_state = 0; // static_cast<int>(AppState)
        int new_state = 0; // static_cast<int>(AppState)
        std::int64_t timestamp_us = 0;
    };

    const char *id_to_string(int32_t id);

    // Posting without a running default event loop fails with
    // ESP_ERR_INVALID_STATE; callers treat every post as best effort.
    esp_err_t post_session_state(const char *device, int old_state, int new_state, std::int64_t timestamp_us);
    esp_err_t post_device_disconnected(const char *device, std::int64_t timestamp_us);
    esp_err_t post_dispatch_failed(const char *device, const char *command, esp_err_t error, std::int64_t timestamp_us);
    esp_err_t post_button_edge(const char *device, const char *button, bool pressed, std::int64_t timestamp_us);
    esp_err_t post_sensitivity_step(const char *device, int step, std::int64_t timestamp_us);
    esp_err_t post_app_state_changed(AppState old_state, AppState new_state, std::int64_t timestamp_us);

} // namespace app_events
