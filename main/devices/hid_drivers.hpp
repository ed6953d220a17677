#pragma once

#include "devices/hid_report_link.hpp"
#include "devices/input_driver.hpp"

#include <array>
#include <memory>
#include <string>

namespace hid
{

    // Library tags accepted in input_devices.<name>.library.
    constexpr const char *kLibraryMouse = "hid_mouse";
    constexpr const char *kLibraryGamepad = "hid_gamepad";
    constexpr const char *kLibrary3dInput = "hid_3d_input";
    constexpr const char *kLibraryVrController = "hid_vr";

    // Base for drivers that decode input reports queued on a ReportLink.
    // Decoded controls the device does not declare are left out.
    class ReportDriver : public devices::IInputDriver
    {
    public:
        explicit ReportDriver(ReportLink &link) : link_(link) {}
        ~ReportDriver() override;

        esp_err_t open(const devices::OpenParams &params) override;
        esp_err_t poll(devices::RawSample &out, std::uint32_t wait_ms) override;
        void close() override;

    protected:
        // Fill `out` from one report; false if the report is malformed.
        virtual bool decode(const Report &report, devices::RawSample &out) = 0;

        void put_axis(devices::RawSample &out, const char *axis, double value) const;
        void put_button(devices::RawSample &out, const char *button, bool pressed) const;

    private:
        ReportLink &link_;
        devices::OpenParams params_;
        QueueHandle_t queue_ = nullptr;
        bool removed_ = false;
    };

    // Boot protocol mouse: [buttons, dx, dy, wheel], int8 deltas / 127.
    class MouseDriver : public ReportDriver
    {
    public:
        using ReportDriver::ReportDriver;
        const char *name() const override { return kLibraryMouse; }

    protected:
        bool decode(const Report &report, devices::RawSample &out) override;
    };

    // Simple gamepad: [x, y, z, roll, buttons], uint8 axes centred on 128.
    class GamepadDriver : public ReportDriver
    {
    public:
        using ReportDriver::ReportDriver;
        const char *name() const override { return kLibraryGamepad; }

    protected:
        bool decode(const Report &report, devices::RawSample &out) override;
    };

    // SpaceNavigator style 6-DOF device. Report 1 carries translation,
    // report 2 rotation (int16 LE, full scale 350), report 3 the buttons.
    // Each sample reports the latest value of every axis.
    class SpaceInputDriver : public ReportDriver
    {
    public:
        using ReportDriver::ReportDriver;
        const char *name() const override { return kLibrary3dInput; }

    protected:
        bool decode(const Report &report, devices::RawSample &out) override;

    private:
        std::array<double, 6> axes_{}; // x, y, z, pitch, roll, yaw
        std::uint8_t buttons_ = 0;
    };

    // VR controller: [1, stick_x (int16 LE), stick_y (int16 LE), trigger,
    // grip, buttons].
    class VrControllerDriver : public ReportDriver
    {
    public:
        using ReportDriver::ReportDriver;
        const char *name() const override { return kLibraryVrController; }

    protected:
        bool decode(const Report &report, devices::RawSample &out) override;
    };

    // Driver for a library tag, or null if the tag is not a HID one.
    std::unique_ptr<devices::IInputDriver> make_driver(const std::string &library, ReportLink &link);

    std::int16_t to_int16(std::uint8_t lo, std::uint8_t hi);

} // namespace hid
