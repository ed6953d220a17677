#include "config_store.hpp"

#include "nvs_flash.h"
#include "nvs.h"
#include "esp_check.h"
#include "esp_log.h"

#include <cstdio>

namespace config_store
{

    namespace
    {
        const char *TAG = "cfg_store";
        const char *NS = "mdof";
        const char *KEY_VIS = "vis_sel";

        esp_err_t open_handle(nvs_handle_t &handle)
        {
            esp_err_t err = nvs_open(NS, NVS_READWRITE, &handle);
            if (err != ESP_OK)
            {
                ESP_LOGE(TAG, "nvs_open failed: %s", esp_err_to_name(err));
            }
            return err;
        }

        template <typename T>
        esp_err_t load_array(const char *count_key, const char *item_key_prefix, T *items, std::size_t max_count, std::size_t &out_count)
        {
            out_count = 0;
            nvs_handle_t handle{};
            ESP_RETURN_ON_ERROR(open_handle(handle), TAG, "open_handle failed");

            uint32_t count = 0;
            esp_err_t err = nvs_get_u32(handle, count_key, &count);
            if (err == ESP_ERR_NVS_NOT_FOUND)
            {
                nvs_close(handle);
                return ESP_OK;
            }
            if (err != ESP_OK)
            {
                ESP_LOGE(TAG, "nvs_get_u32 %s failed: %s", count_key, esp_err_to_name(err));
                nvs_close(handle);
                return err;
            }

            if (count > max_count)
            {
                count = static_cast<uint32_t>(max_count);
            }

            for (uint32_t i = 0; i < count; ++i)
            {
                char key[16];
                std::snprintf(key, sizeof(key), "%s%u", item_key_prefix, static_cast<unsigned>(i));
                size_t len = sizeof(T);
                err = nvs_get_blob(handle, key, &items[i], &len);
                if (err != ESP_OK)
                {
                    ESP_LOGW(TAG, "nvs_get_blob %s failed: %s", key, esp_err_to_name(err));
                    break;
                }
                ++out_count;
            }
            nvs_close(handle);
            return ESP_OK;
        }

        template <typename T>
        esp_err_t save_array(const char *count_key, const char *item_key_prefix, const T *items, std::size_t count)
        {
            nvs_handle_t handle{};
            ESP_RETURN_ON_ERROR(open_handle(handle), TAG, "open_handle failed");

            esp_err_t err = nvs_set_u32(handle, count_key, static_cast<uint32_t>(count));
            if (err != ESP_OK)
            {
                ESP_LOGE(TAG, "nvs_set_u32 %s failed: %s", count_key, esp_err_to_name(err));
                nvs_close(handle);
                return err;
            }

            for (std::size_t i = 0; i < count; ++i)
            {
                char key[16];
                std::snprintf(key, sizeof(key), "%s%u", item_key_prefix, static_cast<unsigned>(i));
                err = nvs_set_blob(handle, key, &items[i], sizeof(T));
                if (err != ESP_OK)
                {
                    ESP_LOGE(TAG, "nvs_set_blob %s failed: %s", key, esp_err_to_name(err));
                    nvs_close(handle);
                    return err;
                }
            }

            err = nvs_commit(handle);
            if (err != ESP_OK)
            {
                ESP_LOGE(TAG, "nvs_commit failed: %s", esp_err_to_name(err));
            }
            nvs_close(handle);
            return err;
        }

    } // namespace

    esp_err_t init()
    {
        esp_err_t err = nvs_flash_init();
        if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND)
        {
            ESP_LOGW(TAG, "NVS partition needs erase: %s", esp_err_to_name(err));
            ESP_RETURN_ON_ERROR(nvs_flash_erase(), TAG, "nvs_flash_erase failed");
            err = nvs_flash_init();
        }
        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "nvs_flash_init failed: %s", esp_err_to_name(err));
        }
        return err;
    }

    esp_err_t load_wifi(WifiAp *aps, std::size_t max_count, std::size_t &out_count)
    {
        return load_array("wifi_count", "wifi_", aps, max_count, out_count);
    }

    esp_err_t save_wifi(const WifiAp *aps, std::size_t count)
    {
        return save_array("wifi_count", "wifi_", aps, count);
    }

    esp_err_t load_visualisation(std::string &name)
    {
        name.clear();
        nvs_handle_t handle{};
        ESP_RETURN_ON_ERROR(open_handle(handle), TAG, "open_handle failed");

        char buf[64];
        size_t len = sizeof(buf);
        esp_err_t err = nvs_get_str(handle, KEY_VIS, buf, &len);
        nvs_close(handle);
        if (err == ESP_ERR_NVS_NOT_FOUND)
        {
            return ESP_OK;
        }
        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "nvs_get_str %s failed: %s", KEY_VIS, esp_err_to_name(err));
            return err;
        }
        name = buf;
        return ESP_OK;
    }

    esp_err_t save_visualisation(const std::string &name)
    {
        nvs_handle_t handle{};
        ESP_RETURN_ON_ERROR(open_handle(handle), TAG, "open_handle failed");

        esp_err_t err = name.empty() ? nvs_erase_key(handle, KEY_VIS) : nvs_set_str(handle, KEY_VIS, name.c_str());
        if (err == ESP_ERR_NVS_NOT_FOUND)
        {
            err = ESP_OK;
        }
        if (err == ESP_OK)
        {
            err = nvs_commit(handle);
        }
        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "saving %s failed: %s", KEY_VIS, esp_err_to_name(err));
        }
        nvs_close(handle);
        return err;
    }

    bool has_basic_config()
    {
        WifiAp aps[1];
        std::size_t wifi_count = 0;
        if (load_wifi(aps, 1, wifi_count) != ESP_OK)
        {
            return false;
        }
        return wifi_count > 0;
    }

} // namespace config_store
