#include "config_server.hpp"

#include "esp_http_server.h"
#include "esp_log.h"
#include "esp_system.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include "config_store.hpp"
#include "cJSON.h"

#include <algorithm>
#include <cstdlib>
#include <cstring>

namespace config_server
{

    namespace
    {
        const char *TAG = "cfg_http";

        constexpr std::size_t kMaxBody = 2048;

        httpd_handle_t s_httpd = nullptr;
        std::vector<std::string> s_options;
        std::string s_fallback;

        esp_err_t send_json(httpd_req_t *req, cJSON *root)
        {
            char *json = cJSON_PrintUnformatted(root);
            if (!json)
            {
                return httpd_resp_send_err(req, HTTPD_500_INTERNAL_SERVER_ERROR, "No memory");
            }
            httpd_resp_set_type(req, "application/json");
            esp_err_t err = httpd_resp_send(req, json, std::strlen(json));
            cJSON_free(json);
            return err;
        }

        esp_err_t handle_get_config(httpd_req_t *req)
        {
            config_store::WifiAp aps[config_store::kMaxWifiAps];
            std::size_t wifi_count = 0;
            esp_err_t err = config_store::load_wifi(aps, config_store::kMaxWifiAps, wifi_count);
            if (err != ESP_OK)
            {
                return httpd_resp_send_err(req, HTTPD_500_INTERNAL_SERVER_ERROR, "Failed to load WiFi");
            }
            std::string selected;
            if (config_store::load_visualisation(selected) != ESP_OK || selected.empty())
            {
                selected = s_fallback;
            }

            cJSON *root = cJSON_CreateObject();
            if (!root)
            {
                return httpd_resp_send_err(req, HTTPD_500_INTERNAL_SERVER_ERROR, "No memory");
            }
            cJSON *wifi = cJSON_AddArrayToObject(root, "wifi");
            for (std::size_t i = 0; wifi && i < wifi_count; ++i)
            {
                cJSON *item = cJSON_CreateObject();
                if (!item)
                    break;
                cJSON_AddStringToObject(item, "ssid", aps[i].ssid);
                cJSON_AddStringToObject(item, "password", aps[i].password);
                cJSON_AddItemToArray(wifi, item);
            }
            cJSON *vis = cJSON_AddObjectToObject(root, "visualisation");
            if (vis)
            {
                cJSON *options = cJSON_AddArrayToObject(vis, "options");
                for (std::size_t i = 0; options && i < s_options.size(); ++i)
                {
                    cJSON_AddItemToArray(options, cJSON_CreateString(s_options[i].c_str()));
                }
                cJSON_AddStringToObject(vis, "selected", selected.c_str());
            }

            err = send_json(req, root);
            cJSON_Delete(root);
            return err;
        }

        esp_err_t handle_post_config(httpd_req_t *req)
        {
            const size_t content_len = static_cast<size_t>(req->content_len);
            if (content_len == 0 || content_len > kMaxBody)
            {
                return httpd_resp_send_err(req, HTTPD_400_BAD_REQUEST, "Invalid body length");
            }

            char *buf = static_cast<char *>(std::malloc(content_len + 1));
            if (!buf)
            {
                return httpd_resp_send_err(req, HTTPD_500_INTERNAL_SERVER_ERROR, "No memory");
            }

            size_t received = 0;
            while (received < content_len)
            {
                const int r = httpd_req_recv(req, buf + received, content_len - received);
                if (r <= 0)
                {
                    std::free(buf);
                    return httpd_resp_send_err(req, HTTPD_400_BAD_REQUEST, "Failed to read body");
                }
                received += static_cast<size_t>(r);
            }
            buf[received] = '\0';

            ESP_LOGI(TAG, "Received config body (%u bytes)", static_cast<unsigned>(received));

            cJSON *root = cJSON_Parse(buf);
            std::free(buf);
            if (!root)
            {
                return httpd_resp_send_err(req, HTTPD_400_BAD_REQUEST, "Invalid JSON");
            }

            config_store::WifiAp wifi_items[config_store::kMaxWifiAps];
            std::size_t wifi_count = 0;

            cJSON *wifi = cJSON_GetObjectItem(root, "wifi");
            if (wifi && cJSON_IsArray(wifi))
            {
                const int arr_size = cJSON_GetArraySize(wifi);
                for (int i = 0; i < arr_size && wifi_count < config_store::kMaxWifiAps; ++i)
                {
                    cJSON *item = cJSON_GetArrayItem(wifi, i);
                    if (!cJSON_IsObject(item))
                        continue;
                    cJSON *ssid = cJSON_GetObjectItem(item, "ssid");
                    cJSON *password = cJSON_GetObjectItem(item, "password");
                    if (!cJSON_IsString(ssid) || ssid->valuestring == nullptr)
                        continue;
                    config_store::WifiAp ap{};
                    std::strncpy(ap.ssid, ssid->valuestring, sizeof(ap.ssid) - 1);
                    if (cJSON_IsString(password) && password->valuestring)
                    {
                        std::strncpy(ap.password, password->valuestring, sizeof(ap.password) - 1);
                    }
                    wifi_items[wifi_count++] = ap;
                }
            }

            std::string selected;
            bool has_selection = false;
            cJSON *vis = cJSON_GetObjectItem(root, "visualisation");
            if (cJSON_IsString(vis) && vis->valuestring)
            {
                selected = vis->valuestring;
                has_selection = true;
            }
            cJSON_Delete(root);

            if (has_selection && !selected.empty() &&
                std::find(s_options.begin(), s_options.end(), selected) == s_options.end())
            {
                return httpd_resp_send_err(req, HTTPD_400_BAD_REQUEST, "Unknown visualisation");
            }

            esp_err_t err = config_store::save_wifi(wifi_items, wifi_count);
            if (err != ESP_OK)
            {
                ESP_LOGE(TAG, "save_wifi failed: %s", esp_err_to_name(err));
                return httpd_resp_send_err(req, HTTPD_500_INTERNAL_SERVER_ERROR, "Failed to save WiFi");
            }

            if (has_selection)
            {
                err = config_store::save_visualisation(selected);
                if (err != ESP_OK)
                {
                    ESP_LOGE(TAG, "save_visualisation failed: %s", esp_err_to_name(err));
                    return httpd_resp_send_err(req, HTTPD_500_INTERNAL_SERVER_ERROR, "Failed to save visualisation");
                }
            }

            httpd_resp_set_type(req, "application/json");
            const char *ok = "{\"status\":\"ok\"}";
            return httpd_resp_send(req, ok, std::strlen(ok));
        }

        esp_err_t handle_reboot(httpd_req_t *req)
        {
            httpd_resp_set_type(req, "application/json");
            const char *body = "{\"status\":\"rebooting\"}";
            // Try to send response before restarting
            (void)httpd_resp_send(req, body, std::strlen(body));
            ESP_LOGI(TAG, "Reboot requested via HTTP config API");
            vTaskDelay(pdMS_TO_TICKS(100));
            esp_restart();
            return ESP_OK;
        }

        esp_err_t register_uri(const char *uri, httpd_method_t method, esp_err_t (*handler)(httpd_req_t *))
        {
            httpd_uri_t desc = {};
            desc.uri = uri;
            desc.method = method;
            desc.handler = handler;
            desc.user_ctx = nullptr;
            esp_err_t err = httpd_register_uri_handler(s_httpd, &desc);
            if (err != ESP_OK)
            {
                ESP_LOGE(TAG, "register %s failed: %s", uri, esp_err_to_name(err));
            }
            return err;
        }

    } // namespace

    esp_err_t start(const std::vector<std::string> &options, const std::string &fallback)
    {
        if (s_httpd)
        {
            return ESP_OK;
        }
        s_options = options;
        s_fallback = fallback;

        httpd_config_t cfg = HTTPD_DEFAULT_CONFIG();
        cfg.server_port = 80;
        // Increase stack size to handle JSON parsing comfortably
        cfg.stack_size = 8192;

        esp_err_t err = httpd_start(&s_httpd, &cfg);
        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "httpd_start failed: %s", esp_err_to_name(err));
            s_httpd = nullptr;
            return err;
        }

        err = register_uri("/api/config", HTTP_GET, handle_get_config);
        if (err == ESP_OK)
            err = register_uri("/api/config", HTTP_POST, handle_post_config);
        if (err == ESP_OK)
            err = register_uri("/api/reboot", HTTP_POST, handle_reboot);
        if (err != ESP_OK)
        {
            stop();
            return err;
        }

        ESP_LOGI(TAG, "Config HTTP server started on port %d", cfg.server_port);
        return ESP_OK;
    }

    void stop()
    {
        if (s_httpd)
        {
            esp_err_t err = httpd_stop(s_httpd);
            if (err != ESP_OK)
            {
                ESP_LOGW(TAG, "httpd_stop failed: %s", esp_err_to_name(err));
            }
            s_httpd = nullptr;
        }
    }

} // namespace config_server
