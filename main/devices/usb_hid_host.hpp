/**
 * USB host side of the HID report link.
 *
 * Every connected device with a HID interrupt IN endpoint is attached to the
 * report link under its VID/PID, its input reports are pushed as they arrive,
 * and it is detached when unplugged. The HID drivers consume the reports.
 */
#pragma once

#include "esp_err.h"

#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include "usb/usb_host.h"

#include "devices/hid_report_link.hpp"

#include <array>
#include <cstdint>

namespace usb_hid
{

    // Runs for the rest of the program once started.
    class UsbHidHost
    {
    public:
        explicit UsbHidHost(hid::ReportLink &link);

        UsbHidHost(const UsbHidHost &) = delete;
        UsbHidHost &operator=(const UsbHidHost &) = delete;

        // Install the USB host library, register the client and start the
        // event task. ESP_ERR_INVALID_STATE if already started.
        esp_err_t start();

    private:
        static constexpr std::size_t kMaxDevices = 4;

        struct Slot
        {
            UsbHidHost *owner = nullptr;
            usb_device_handle_t dev = nullptr;
            devices::DeviceIdentity id;
            usb_transfer_t *xfer = nullptr;
            std::uint8_t interface = 0;
            bool in_flight = false;
            bool closing = false;
        };

        static void task_entry(void *arg);
        static void client_event_cb(const usb_host_client_event_msg_t *msg, void *arg);
        static void report_cb(usb_transfer_t *xfer);

        void on_new_device(std::uint8_t address);
        void on_device_gone(usb_device_handle_t dev);
        void submit(Slot &slot);
        void release(Slot &slot);
        Slot *free_slot();
        Slot *find_slot(usb_device_handle_t dev);

        hid::ReportLink &link_;
        usb_host_client_handle_t client_ = nullptr;
        TaskHandle_t task_ = nullptr;
        std::array<Slot, kMaxDevices> slots_;
    };

} // namespace usb_hid
