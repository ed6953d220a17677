#pragma once

#include "esp_err.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace devices
{

    struct DeviceIdentity
    {
        std::uint16_t vid = 0;
        std::uint16_t pid = 0;

        bool operator==(const DeviceIdentity &o) const { return vid == o.vid && pid == o.pid; }
        bool operator!=(const DeviceIdentity &o) const { return !(*this == o); }
        bool operator<(const DeviceIdentity &o) const
        {
            return vid != o.vid ? vid < o.vid : pid < o.pid;
        }
    };

    // Accepts "046d", "0x046D" style hex ids.
    esp_err_t parse_hex_id(const std::string &text, std::uint16_t &out);

    // One poll result. Controls absent from the maps were not reported.
    struct RawSample
    {
        std::int64_t timestamp_us = 0;
        std::map<std::string, double> axes;
        std::map<std::string, bool> buttons;
    };

    // What the driver needs to know about the device it is opened for.
    struct OpenParams
    {
        DeviceIdentity identity;
        std::vector<std::string> axes;
        std::vector<std::string> buttons;
    };

    // Raw access to one device. A driver instance serves one session and is
    // used from that session's task only.
    class IInputDriver
    {
    public:
        virtual ~IInputDriver() = default;

        // MDOF_ERR_DEVICE_NOT_FOUND if the device is not present.
        virtual esp_err_t open(const OpenParams &params) = 0;

        // Wait up to `wait_ms` for a sample. ESP_ERR_TIMEOUT when nothing
        // arrived, MDOF_ERR_DEVICE_DISCONNECTED once the device was removed.
        virtual esp_err_t poll(RawSample &out, std::uint32_t wait_ms) = 0;

        virtual void close() = 0;

        virtual const char *name() const = 0;
    };

} // namespace devices
