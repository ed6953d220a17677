#include "devices/hid_drivers.hpp"

#include "core/mdof_err.hpp"
#include "esp_log.h"

#include <algorithm>

namespace hid
{

    namespace
    {
        static const char *TAG = "hid";

        constexpr double kSpaceAxisScale = 350.0;

        double clamp_unit(double v)
        {
            return std::min(1.0, std::max(-1.0, v));
        }

        bool declared(const std::vector<std::string> &list, const char *name)
        {
            return std::find(list.begin(), list.end(), name) != list.end();
        }
    } // namespace

    std::int16_t to_int16(std::uint8_t lo, std::uint8_t hi)
    {
        return static_cast<std::int16_t>(static_cast<std::uint16_t>(lo) | (static_cast<std::uint16_t>(hi) << 8));
    }

    ReportDriver::~ReportDriver()
    {
        close();
    }

    esp_err_t ReportDriver::open(const devices::OpenParams &params)
    {
        if (queue_)
        {
            return ESP_ERR_INVALID_STATE;
        }
        queue_ = link_.claim(params.identity);
        if (!queue_)
        {
            ESP_LOGW(TAG, "%04x:%04x is not attached", params.identity.vid, params.identity.pid);
            return MDOF_ERR_DEVICE_NOT_FOUND;
        }
        params_ = params;
        removed_ = false;
        return ESP_OK;
    }

    esp_err_t ReportDriver::poll(devices::RawSample &out, std::uint32_t wait_ms)
    {
        if (!queue_)
        {
            return ESP_ERR_INVALID_STATE;
        }
        if (removed_)
        {
            return MDOF_ERR_DEVICE_DISCONNECTED;
        }

        Report report;
        if (xQueueReceive(queue_, &report, pdMS_TO_TICKS(wait_ms)) != pdTRUE)
        {
            return ESP_ERR_TIMEOUT;
        }
        if (report.removed)
        {
            removed_ = true;
            return MDOF_ERR_DEVICE_DISCONNECTED;
        }

        out.timestamp_us = report.timestamp_us;
        if (!decode(report, out))
        {
            ESP_LOGD(TAG, "%s: malformed report (%u bytes)", name(), report.len);
            return ESP_ERR_INVALID_SIZE;
        }
        return ESP_OK;
    }

    void ReportDriver::close()
    {
        if (queue_)
        {
            link_.release(params_.identity);
            queue_ = nullptr;
        }
    }

    void ReportDriver::put_axis(devices::RawSample &out, const char *axis, double value) const
    {
        if (declared(params_.axes, axis))
            out.axes[axis] = value;
    }

    void ReportDriver::put_button(devices::RawSample &out, const char *button, bool pressed) const
    {
        if (declared(params_.buttons, button))
            out.buttons[button] = pressed;
    }

    bool MouseDriver::decode(const Report &r, devices::RawSample &out)
    {
        if (r.len < 3)
            return false;
        std::uint8_t buttons = r.data[0];
        put_button(out, "left_click", buttons & 0x01);
        put_button(out, "right_click", buttons & 0x02);
        put_button(out, "middle_click", buttons & 0x04);
        put_axis(out, "x", clamp_unit(static_cast<std::int8_t>(r.data[1]) / 127.0));
        put_axis(out, "y", clamp_unit(static_cast<std::int8_t>(r.data[2]) / 127.0));
        if (r.len >= 4)
            put_axis(out, "wheel", clamp_unit(static_cast<std::int8_t>(r.data[3]) / 127.0));
        return true;
    }

    bool GamepadDriver::decode(const Report &r, devices::RawSample &out)
    {
        if (r.len < 5)
            return false;
        static const char *const kAxes[] = {"x", "y", "z", "roll"};
        for (int i = 0; i < 4; ++i)
        {
            put_axis(out, kAxes[i], clamp_unit((static_cast<int>(r.data[i]) - 128) / 127.0));
        }
        static const char *const kButtons[] = {"button_1", "button_2", "button_3", "button_4",
                                               "button_5", "button_6", "button_7", "button_8"};
        for (int i = 0; i < 8; ++i)
        {
            put_button(out, kButtons[i], (r.data[4] >> i) & 0x01);
        }
        return true;
    }

    bool SpaceInputDriver::decode(const Report &r, devices::RawSample &out)
    {
        if (r.len < 2)
            return false;
        switch (r.data[0])
        {
        case 1:
        case 2:
        {
            if (r.len < 7)
                return false;
            std::size_t base = (r.data[0] == 1) ? 0 : 3;
            for (std::size_t i = 0; i < 3; ++i)
            {
                std::int16_t raw = to_int16(r.data[1 + 2 * i], r.data[2 + 2 * i]);
                axes_[base + i] = clamp_unit(raw / kSpaceAxisScale);
            }
            break;
        }
        case 3:
            buttons_ = r.data[1];
            break;
        default:
            return false;
        }

        static const char *const kAxes[] = {"x", "y", "z", "pitch", "roll", "yaw"};
        for (std::size_t i = 0; i < axes_.size(); ++i)
        {
            put_axis(out, kAxes[i], axes_[i]);
        }
        put_button(out, "button_1", buttons_ & 0x01);
        put_button(out, "button_2", buttons_ & 0x02);
        return true;
    }

    bool VrControllerDriver::decode(const Report &r, devices::RawSample &out)
    {
        if (r.len < 8 || r.data[0] != 1)
            return false;
        put_axis(out, "stick_x", clamp_unit(to_int16(r.data[1], r.data[2]) / 32767.0));
        put_axis(out, "stick_y", clamp_unit(to_int16(r.data[3], r.data[4]) / 32767.0));
        put_axis(out, "trigger", r.data[5] / 255.0);
        put_axis(out, "grip", r.data[6] / 255.0);
        std::uint8_t buttons = r.data[7];
        put_button(out, "a", buttons & 0x01);
        put_button(out, "b", buttons & 0x02);
        put_button(out, "menu", buttons & 0x04);
        put_button(out, "stick", buttons & 0x08);
        return true;
    }

    std::unique_ptr<devices::IInputDriver> make_driver(const std::string &library, ReportLink &link)
    {
        if (library == kLibraryMouse)
            return std::unique_ptr<devices::IInputDriver>(new MouseDriver(link));
        if (library == kLibraryGamepad)
            return std::unique_ptr<devices::IInputDriver>(new GamepadDriver(link));
        if (library == kLibrary3dInput)
            return std::unique_ptr<devices::IInputDriver>(new SpaceInputDriver(link));
        if (library == kLibraryVrController)
            return std::unique_ptr<devices::IInputDriver>(new VrControllerDriver(link));
        return nullptr;
    }

} // namespace hid
