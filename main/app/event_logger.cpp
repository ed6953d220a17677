#include "event_logger.hpp"

#include "esp_event.h"
#include "esp_log.h"
#include "app_events.hpp"
#include "app/device_session.hpp"
#include "core/mdof_err.hpp"

namespace event_logger
{

    namespace
    {
        static const char *TAG = "BRIDGE_EVENT_BUS";
        static esp_event_handler_instance_t s_any_instance = nullptr;

        static void log_event(void * /*arg*/,
                              esp_event_base_t event_base,
                              int32_t event_id,
                              void *event_data)
        {
            if (event_base != BRIDGE_EVENTS || event_data == nullptr)
            {
                return;
            }

            switch (event_id)
            {
            case app_events::SESSION_STATE_CHANGED:
            {
                auto *p = static_cast<const app_events::SessionStatePayload *>(event_data);
                ESP_LOGI(TAG, "session %s: %s -> %s",
                         p->device,
                         session::state_to_string(p->old_state),
                         session::state_to_string(p->new_state));
                break;
            }
            case app_events::DEVICE_DISCONNECTED:
            {
                auto *p = static_cast<const app_events::DevicePayload *>(event_data);
                ESP_LOGW(TAG, "device %s disconnected", p->device);
                break;
            }
            case app_events::DISPATCH_FAILED:
            {
                auto *p = static_cast<const app_events::DispatchFailedPayload *>(event_data);
                ESP_LOGW(TAG, "dispatch %s/%s failed: %s", p->device, p->command, mdof_err_to_name(p->error));
                break;
            }
            case app_events::BUTTON_EDGE:
            {
                auto *p = static_cast<const app_events::ButtonEdgePayload *>(event_data);
                ESP_LOGI(TAG, "button %s/%s %s", p->device, p->button, p->pressed ? "pressed" : "released");
                break;
            }
            case app_events::SENSITIVITY_STEP_CHANGED:
            {
                auto *p = static_cast<const app_events::SensitivityStepPayload *>(event_data);
                ESP_LOGI(TAG, "%s sensitivity step %d", p->device, p->step);
                break;
            }
            case app_events::APP_STATE_CHANGED:
            {
                auto *p = static_cast<const app_events::AppStateChangedPayload *>(event_data);
                ESP_LOGI(TAG, "app state %s -> %s",
                         app_state_to_string(static_cast<AppState>(p->old_state)),
                         app_state_to_string(static_cast<AppState>(p->new_state)));
                break;
            }
            default:
                ESP_LOGI(TAG, "event id=%ld (%s)", static_cast<long>(event_id), app_events::id_to_string(event_id));
                break;
            }
        }
    } // namespace

    esp_err_t init()
    {
        if (s_any_instance)
        {
            return ESP_OK;
        }
        esp_err_t err = esp_event_handler_instance_register(
            BRIDGE_EVENTS,
            ESP_EVENT_ANY_ID,
            &log_event,
            nullptr,
            &s_any_instance);

        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "failed to register event logger: %s", esp_err_to_name(err));
        }

        return err;
    }

} // namespace event_logger
