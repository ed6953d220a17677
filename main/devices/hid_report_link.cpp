#include "devices/hid_report_link.hpp"

#include "app/app_config.hpp"
#include "esp_log.h"

#include <cstring>

namespace hid
{

    namespace
    {
        static const char *TAG = "hid";
    }

    ReportLink::~ReportLink()
    {
        for (auto &kv : entries_)
        {
            if (kv.second.queue)
            {
                vQueueDelete(kv.second.queue);
            }
        }
    }

    void ReportLink::drop_if_unused(std::map<devices::DeviceIdentity, Entry>::iterator it)
    {
        if (!it->second.attached && !it->second.claimed)
        {
            vQueueDelete(it->second.queue);
            entries_.erase(it);
        }
    }

    esp_err_t ReportLink::attach(const devices::DeviceIdentity &id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it != entries_.end())
        {
            // Still attached, or re-plugged before the previous driver
            // consumed the removal marker.
            return ESP_ERR_INVALID_STATE;
        }

        Entry e;
        e.queue = xQueueCreate(app_config::kHidReportQueueLength, sizeof(Report));
        if (!e.queue)
        {
            return ESP_ERR_NO_MEM;
        }
        e.attached = true;
        entries_[id] = e;
        ESP_LOGI(TAG, "attached %04x:%04x", id.vid, id.pid);
        return ESP_OK;
    }

    esp_err_t ReportLink::push_report(const devices::DeviceIdentity &id, const std::uint8_t *data, std::size_t len, std::int64_t timestamp_us)
    {
        if (!data || len == 0)
        {
            return ESP_ERR_INVALID_ARG;
        }

        Report r;
        r.timestamp_us = timestamp_us;
        r.len = static_cast<std::uint8_t>(len < kMaxReportLen ? len : kMaxReportLen);
        std::memcpy(r.data, data, r.len);

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end() || !it->second.attached)
        {
            return ESP_ERR_NOT_FOUND;
        }
        if (xQueueSend(it->second.queue, &r, 0) != pdTRUE)
        {
            ESP_LOGD(TAG, "%04x:%04x queue full, report dropped", id.vid, id.pid);
            return ESP_ERR_TIMEOUT;
        }
        return ESP_OK;
    }

    esp_err_t ReportLink::detach(const devices::DeviceIdentity &id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end() || !it->second.attached)
        {
            return ESP_ERR_NOT_FOUND;
        }
        it->second.attached = false;
        ESP_LOGI(TAG, "detached %04x:%04x", id.vid, id.pid);

        if (it->second.claimed)
        {
            Report marker;
            marker.removed = true;
            // The marker must get through even when the queue is full.
            if (xQueueSend(it->second.queue, &marker, 0) != pdTRUE)
            {
                xQueueReset(it->second.queue);
                (void)xQueueSend(it->second.queue, &marker, 0);
            }
            return ESP_OK;
        }
        drop_if_unused(it);
        return ESP_OK;
    }

    bool ReportLink::attached(const devices::DeviceIdentity &id) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        return it != entries_.end() && it->second.attached;
    }

    QueueHandle_t ReportLink::claim(const devices::DeviceIdentity &id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end() || !it->second.attached || it->second.claimed)
        {
            return nullptr;
        }
        it->second.claimed = true;
        return it->second.queue;
    }

    void ReportLink::release(const devices::DeviceIdentity &id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end())
        {
            return;
        }
        it->second.claimed = false;
        drop_if_unused(it);
    }

} // namespace hid
