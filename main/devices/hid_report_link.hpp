#pragma once

#include "esp_err.h"

#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"

#include "devices/input_driver.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>

namespace hid
{

    constexpr std::size_t kMaxReportLen = 64;

    struct Report
    {
        std::int64_t timestamp_us = 0;
        bool removed = false;
        std::uint8_t len = 0;
        std::uint8_t data[kMaxReportLen] = {};
    };

    // Hand-off point between the USB host side, which attaches devices and
    // pushes their input reports, and the HID drivers that consume them. One
    // report queue per attached device identity.
    class ReportLink
    {
    public:
        ReportLink() = default;
        ~ReportLink();

        ReportLink(const ReportLink &) = delete;
        ReportLink &operator=(const ReportLink &) = delete;

        esp_err_t attach(const devices::DeviceIdentity &id);

        // Queue a report without blocking. ESP_ERR_NOT_FOUND if the device is
        // not attached, ESP_ERR_TIMEOUT if its queue is full (report dropped).
        esp_err_t push_report(const devices::DeviceIdentity &id, const std::uint8_t *data, std::size_t len, std::int64_t timestamp_us);

        // Queue the removal marker; the queue goes away once released.
        esp_err_t detach(const devices::DeviceIdentity &id);

        bool attached(const devices::DeviceIdentity &id) const;

        // Claim the report queue of an attached device. Null if the device is
        // not attached or already claimed.
        QueueHandle_t claim(const devices::DeviceIdentity &id);
        void release(const devices::DeviceIdentity &id);

    private:
        struct Entry
        {
            QueueHandle_t queue = nullptr;
            bool attached = false;
            bool claimed = false;
        };

        void drop_if_unused(std::map<devices::DeviceIdentity, Entry>::iterator it);

        mutable std::mutex mutex_;
        std::map<devices::DeviceIdentity, Entry> entries_;
    };

} // namespace hid
