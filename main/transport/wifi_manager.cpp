#include "wifi_manager.h"

#include "esp_event.h"
#include "esp_log.h"
#include "esp_netif.h"
#include "esp_wifi.h"
#include "freertos/FreeRTOS.h"
#include "freertos/event_groups.h"

#include "config_server/config_store.hpp"

#include <cstring>
#include <vector>

namespace
{
    const char *TAG = "wifi";

    constexpr EventBits_t kGotIp = BIT0;

    EventGroupHandle_t s_events = nullptr;
    esp_netif_t *s_sta = nullptr;
    esp_netif_t *s_ap = nullptr;
    bool s_ap_mode = false;

    void on_wifi_event(void * /*arg*/, esp_event_base_t base, int32_t id, void * /*data*/)
    {
        if (base == WIFI_EVENT && id == WIFI_EVENT_STA_DISCONNECTED)
        {
            xEventGroupClearBits(s_events, kGotIp);
            if (!s_ap_mode)
            {
                ESP_LOGW(TAG, "disconnected, reconnecting");
                esp_err_t err = esp_wifi_connect();
                if (err != ESP_OK)
                {
                    ESP_LOGW(TAG, "esp_wifi_connect failed: %s", esp_err_to_name(err));
                }
            }
        }
        else if (base == IP_EVENT && id == IP_EVENT_STA_GOT_IP)
        {
            ESP_LOGI(TAG, "got IP");
            xEventGroupSetBits(s_events, kGotIp);
        }
    }

    // Pick the strongest scanned network we have credentials for.
    bool pick_best(const config_store::WifiAp *known, std::size_t known_count, int32_t min_rssi, config_store::WifiAp &out)
    {
        uint16_t count = 0;
        if (esp_wifi_scan_start(nullptr, true) != ESP_OK || esp_wifi_scan_get_ap_num(&count) != ESP_OK || count == 0)
        {
            return false;
        }
        std::vector<wifi_ap_record_t> records(count);
        if (esp_wifi_scan_get_ap_records(&count, records.data()) != ESP_OK)
        {
            return false;
        }

        int best_rssi = INT32_MIN;
        bool found = false;
        for (uint16_t i = 0; i < count; ++i)
        {
            const char *ssid = reinterpret_cast<const char *>(records[i].ssid);
            if (records[i].rssi < min_rssi || records[i].rssi <= best_rssi)
                continue;
            for (std::size_t k = 0; k < known_count; ++k)
            {
                if (std::strcmp(ssid, known[k].ssid) == 0)
                {
                    out = known[k];
                    best_rssi = records[i].rssi;
                    found = true;
                    break;
                }
            }
        }
        return found;
    }
} // namespace

extern "C" esp_err_t wifi_manager_init(void)
{
    if (s_events)
    {
        return ESP_OK;
    }
    s_events = xEventGroupCreate();
    if (!s_events)
    {
        return ESP_ERR_NO_MEM;
    }

    esp_err_t err = esp_netif_init();
    if (err != ESP_OK)
    {
        ESP_LOGE(TAG, "esp_netif_init failed: %s", esp_err_to_name(err));
        return err;
    }
    s_sta = esp_netif_create_default_wifi_sta();

    wifi_init_config_t cfg = WIFI_INIT_CONFIG_DEFAULT();
    err = esp_wifi_init(&cfg);
    if (err != ESP_OK)
    {
        ESP_LOGE(TAG, "esp_wifi_init failed: %s", esp_err_to_name(err));
        return err;
    }
    err = esp_event_handler_instance_register(WIFI_EVENT, WIFI_EVENT_STA_DISCONNECTED, &on_wifi_event, nullptr, nullptr);
    if (err == ESP_OK)
    {
        err = esp_event_handler_instance_register(IP_EVENT, IP_EVENT_STA_GOT_IP, &on_wifi_event, nullptr, nullptr);
    }
    if (err != ESP_OK)
    {
        ESP_LOGE(TAG, "event registration failed: %s", esp_err_to_name(err));
        return err;
    }

    err = esp_wifi_set_mode(WIFI_MODE_STA);
    if (err == ESP_OK)
    {
        err = esp_wifi_start();
    }
    if (err != ESP_OK)
    {
        ESP_LOGE(TAG, "station start failed: %s", esp_err_to_name(err));
    }
    return err;
}

extern "C" esp_err_t wifi_manager_connect_best_known(int32_t min_rssi)
{
    config_store::WifiAp known[config_store::kMaxWifiAps];
    std::size_t known_count = 0;
    esp_err_t err = config_store::load_wifi(known, config_store::kMaxWifiAps, known_count);
    if (err != ESP_OK)
    {
        return err;
    }
    if (known_count == 0)
    {
        return ESP_ERR_NOT_FOUND;
    }

    config_store::WifiAp best{};
    if (!pick_best(known, known_count, min_rssi, best))
    {
        ESP_LOGW(TAG, "no known network in range");
        return ESP_ERR_NOT_FOUND;
    }

    wifi_config_t sta = {};
    std::strncpy(reinterpret_cast<char *>(sta.sta.ssid), best.ssid, sizeof(sta.sta.ssid) - 1);
    std::strncpy(reinterpret_cast<char *>(sta.sta.password), best.password, sizeof(sta.sta.password) - 1);
    err = esp_wifi_set_config(WIFI_IF_STA, &sta);
    if (err != ESP_OK)
    {
        ESP_LOGE(TAG, "esp_wifi_set_config failed: %s", esp_err_to_name(err));
        return err;
    }
    ESP_LOGI(TAG, "connecting to '%s'", best.ssid);
    return esp_wifi_connect();
}

extern "C" bool wifi_manager_wait_ip(int wait_ms)
{
    if (!s_events)
    {
        return false;
    }
    EventBits_t bits = xEventGroupWaitBits(s_events, kGotIp, pdFALSE, pdTRUE, pdMS_TO_TICKS(wait_ms));
    return (bits & kGotIp) != 0;
}

extern "C" esp_err_t wifi_manager_start_ap_config(const char *ssid, const char *password)
{
    if (!ssid)
    {
        return ESP_ERR_INVALID_ARG;
    }
    s_ap_mode = true;
    if (!s_ap)
    {
        s_ap = esp_netif_create_default_wifi_ap();
    }

    wifi_config_t ap = {};
    std::strncpy(reinterpret_cast<char *>(ap.ap.ssid), ssid, sizeof(ap.ap.ssid) - 1);
    ap.ap.ssid_len = static_cast<uint8_t>(std::strlen(reinterpret_cast<char *>(ap.ap.ssid)));
    ap.ap.max_connection = 4;
    if (password && std::strlen(password) >= 8)
    {
        std::strncpy(reinterpret_cast<char *>(ap.ap.password), password, sizeof(ap.ap.password) - 1);
        ap.ap.authmode = WIFI_AUTH_WPA2_PSK;
    }
    else
    {
        ap.ap.authmode = WIFI_AUTH_OPEN;
    }

    esp_err_t err = esp_wifi_stop();
    if (err == ESP_OK || err == ESP_ERR_WIFI_NOT_INIT)
    {
        err = esp_wifi_set_mode(WIFI_MODE_AP);
    }
    if (err == ESP_OK)
    {
        err = esp_wifi_set_config(WIFI_IF_AP, &ap);
    }
    if (err == ESP_OK)
    {
        err = esp_wifi_start();
    }
    if (err != ESP_OK)
    {
        ESP_LOGE(TAG, "AP start failed: %s", esp_err_to_name(err));
        return err;
    }
    ESP_LOGI(TAG, "config AP '%s' started", ssid);
    return ESP_OK;
}

extern "C" bool wifi_manager_is_connected(void)
{
    return s_events && (xEventGroupGetBits(s_events) & kGotIp) != 0;
}
