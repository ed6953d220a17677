#include "devices/usb_hid_host.hpp"

#include "app/app_config.hpp"
#include "esp_intr_alloc.h"
#include "esp_log.h"
#include "esp_timer.h"

namespace usb_hid
{

    namespace
    {
        static const char *TAG = "usb_hid";

        struct DescHeader
        {
            std::uint8_t bLength;
            std::uint8_t bDescriptorType;
        };

        // First interrupt IN endpoint of a HID interface (alternate setting 0).
        bool find_report_endpoint(usb_device_handle_t dev, std::uint8_t &interface, std::uint8_t &ep, std::uint16_t &mps)
        {
            const usb_config_desc_t *cfg = nullptr;
            if (usb_host_get_active_config_descriptor(dev, &cfg) != ESP_OK || !cfg)
            {
                return false;
            }

            const std::uint8_t *p = reinterpret_cast<const std::uint8_t *>(cfg);
            const int total = cfg->wTotalLength;
            int cur_if = -1;
            int cur_alt = 0;
            std::uint8_t cur_class = 0;

            for (int off = 0; off + 2 <= total;)
            {
                const DescHeader *h = reinterpret_cast<const DescHeader *>(p + off);
                if (h->bLength == 0)
                {
                    break;
                }
                if (h->bDescriptorType == USB_B_DESCRIPTOR_TYPE_INTERFACE)
                {
                    const usb_intf_desc_t *ifd = reinterpret_cast<const usb_intf_desc_t *>(p + off);
                    cur_if = ifd->bInterfaceNumber;
                    cur_alt = ifd->bAlternateSetting;
                    cur_class = ifd->bInterfaceClass;
                }
                else if (h->bDescriptorType == USB_B_DESCRIPTOR_TYPE_ENDPOINT)
                {
                    const usb_ep_desc_t *epd = reinterpret_cast<const usb_ep_desc_t *>(p + off);
                    bool is_in = (epd->bEndpointAddress & USB_B_ENDPOINT_ADDRESS_EP_DIR_MASK) != 0;
                    bool is_int = (epd->bmAttributes & USB_BM_ATTRIBUTES_XFERTYPE_MASK) == USB_BM_ATTRIBUTES_XFER_INT;
                    if (cur_if >= 0 && cur_alt == 0 && cur_class == USB_CLASS_HID && is_in && is_int)
                    {
                        interface = static_cast<std::uint8_t>(cur_if);
                        ep = epd->bEndpointAddress;
                        mps = epd->wMaxPacketSize;
                        return true;
                    }
                }
                off += h->bLength;
            }
            return false;
        }
    } // namespace

    UsbHidHost::UsbHidHost(hid::ReportLink &link)
        : link_(link)
    {
        for (auto &slot : slots_)
        {
            slot.owner = this;
        }
    }

    esp_err_t UsbHidHost::start()
    {
        if (task_)
        {
            return ESP_ERR_INVALID_STATE;
        }

        usb_host_config_t host_cfg = {};
        host_cfg.intr_flags = ESP_INTR_FLAG_LEVEL1;
        esp_err_t err = usb_host_install(&host_cfg);
        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "usb_host_install failed: %s", esp_err_to_name(err));
            return err;
        }

        usb_host_client_config_t client_cfg = {};
        client_cfg.is_synchronous = false;
        client_cfg.max_num_event_msg = 8;
        client_cfg.async.client_event_callback = &UsbHidHost::client_event_cb;
        client_cfg.async.callback_arg = this;
        err = usb_host_client_register(&client_cfg, &client_);
        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "usb_host_client_register failed: %s", esp_err_to_name(err));
            usb_host_uninstall();
            return err;
        }

        if (xTaskCreate(&UsbHidHost::task_entry, "usb_hid", app_config::kUsbHostTaskStack, this,
                        app_config::kUsbHostTaskPriority, &task_) != pdPASS)
        {
            task_ = nullptr;
            usb_host_client_deregister(client_);
            client_ = nullptr;
            usb_host_uninstall();
            return ESP_ERR_NO_MEM;
        }
        ESP_LOGI(TAG, "USB host started");
        return ESP_OK;
    }

    void UsbHidHost::task_entry(void *arg)
    {
        UsbHidHost *self = static_cast<UsbHidHost *>(arg);
        for (;;)
        {
            std::uint32_t flags = 0;
            esp_err_t err = usb_host_lib_handle_events(pdMS_TO_TICKS(10), &flags);
            if (err != ESP_OK && err != ESP_ERR_TIMEOUT)
            {
                ESP_LOGW(TAG, "host events: %s", esp_err_to_name(err));
            }
            // Transfer callbacks run from here too, so slots_ is only
            // touched on this task.
            err = usb_host_client_handle_events(self->client_, pdMS_TO_TICKS(10));
            if (err != ESP_OK && err != ESP_ERR_TIMEOUT)
            {
                ESP_LOGW(TAG, "client events: %s", esp_err_to_name(err));
            }
        }
    }

    void UsbHidHost::client_event_cb(const usb_host_client_event_msg_t *msg, void *arg)
    {
        UsbHidHost *self = static_cast<UsbHidHost *>(arg);
        switch (msg->event)
        {
        case USB_HOST_CLIENT_EVENT_NEW_DEV:
            self->on_new_device(msg->new_dev.address);
            break;
        case USB_HOST_CLIENT_EVENT_DEV_GONE:
            self->on_device_gone(msg->dev_gone.dev_hdl);
            break;
        default:
            break;
        }
    }

    UsbHidHost::Slot *UsbHidHost::free_slot()
    {
        for (auto &slot : slots_)
        {
            if (!slot.dev)
            {
                return &slot;
            }
        }
        return nullptr;
    }

    UsbHidHost::Slot *UsbHidHost::find_slot(usb_device_handle_t dev)
    {
        for (auto &slot : slots_)
        {
            if (slot.dev == dev)
            {
                return &slot;
            }
        }
        return nullptr;
    }

    void UsbHidHost::on_new_device(std::uint8_t address)
    {
        usb_device_handle_t dev = nullptr;
        esp_err_t err = usb_host_device_open(client_, address, &dev);
        if (err != ESP_OK)
        {
            ESP_LOGW(TAG, "open of device %u failed: %s", address, esp_err_to_name(err));
            return;
        }

        const usb_device_desc_t *desc = nullptr;
        std::uint8_t interface = 0;
        std::uint8_t ep = 0;
        std::uint16_t mps = 0;
        if (usb_host_get_device_descriptor(dev, &desc) != ESP_OK || !desc ||
            !find_report_endpoint(dev, interface, ep, mps))
        {
            ESP_LOGI(TAG, "device %u is not a HID input device", address);
            usb_host_device_close(client_, dev);
            return;
        }

        devices::DeviceIdentity id;
        id.vid = desc->idVendor;
        id.pid = desc->idProduct;

        Slot *slot = free_slot();
        if (!slot)
        {
            ESP_LOGW(TAG, "%04x:%04x ignored, %u devices already attached", id.vid, id.pid,
                     static_cast<unsigned>(kMaxDevices));
            usb_host_device_close(client_, dev);
            return;
        }

        err = usb_host_interface_claim(client_, dev, interface, 0);
        if (err != ESP_OK)
        {
            ESP_LOGW(TAG, "%04x:%04x interface %u claim failed: %s", id.vid, id.pid, interface, esp_err_to_name(err));
            usb_host_device_close(client_, dev);
            return;
        }

        usb_transfer_t *xfer = nullptr;
        err = usb_host_transfer_alloc(mps, 0, &xfer);
        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "%04x:%04x transfer alloc failed: %s", id.vid, id.pid, esp_err_to_name(err));
            usb_host_interface_release(client_, dev, interface);
            usb_host_device_close(client_, dev);
            return;
        }

        err = link_.attach(id);
        if (err != ESP_OK)
        {
            ESP_LOGW(TAG, "%04x:%04x not attached: %s", id.vid, id.pid, esp_err_to_name(err));
            usb_host_transfer_free(xfer);
            usb_host_interface_release(client_, dev, interface);
            usb_host_device_close(client_, dev);
            return;
        }

        slot->dev = dev;
        slot->id = id;
        slot->interface = interface;
        slot->xfer = xfer;
        slot->closing = false;
        xfer->device_handle = dev;
        xfer->bEndpointAddress = ep;
        xfer->num_bytes = mps;
        xfer->callback = &UsbHidHost::report_cb;
        xfer->context = slot;
        ESP_LOGI(TAG, "%04x:%04x on interface %u, endpoint 0x%02x (%u bytes)", id.vid, id.pid, interface, ep,
                 static_cast<unsigned>(mps));
        submit(*slot);
    }

    void UsbHidHost::submit(Slot &slot)
    {
        esp_err_t err = usb_host_transfer_submit(slot.xfer);
        slot.in_flight = (err == ESP_OK);
        if (err != ESP_OK)
        {
            ESP_LOGW(TAG, "%04x:%04x report transfer not submitted: %s", slot.id.vid, slot.id.pid, esp_err_to_name(err));
        }
    }

    void UsbHidHost::report_cb(usb_transfer_t *xfer)
    {
        Slot *slot = static_cast<Slot *>(xfer->context);
        slot->in_flight = false;
        if (slot->closing)
        {
            slot->owner->release(*slot);
            return;
        }

        switch (xfer->status)
        {
        case USB_TRANSFER_STATUS_COMPLETED:
            if (xfer->actual_num_bytes > 0)
            {
                esp_err_t err = slot->owner->link_.push_report(slot->id, xfer->data_buffer,
                                                               static_cast<std::size_t>(xfer->actual_num_bytes),
                                                               esp_timer_get_time());
                if (err != ESP_OK && err != ESP_ERR_TIMEOUT)
                {
                    ESP_LOGD(TAG, "%04x:%04x report not queued: %s", slot->id.vid, slot->id.pid, esp_err_to_name(err));
                }
            }
            break;
        case USB_TRANSFER_STATUS_NO_DEVICE:
        case USB_TRANSFER_STATUS_CANCELED:
            // DEV_GONE follows and releases the slot.
            return;
        default:
            ESP_LOGD(TAG, "%04x:%04x transfer status %d", slot->id.vid, slot->id.pid, static_cast<int>(xfer->status));
            break;
        }
        slot->owner->submit(*slot);
    }

    void UsbHidHost::on_device_gone(usb_device_handle_t dev)
    {
        Slot *slot = find_slot(dev);
        if (!slot)
        {
            ESP_LOGD(TAG, "removal of an untracked device");
            return;
        }

        ESP_LOGI(TAG, "%04x:%04x removed", slot->id.vid, slot->id.pid);
        esp_err_t err = link_.detach(slot->id);
        if (err != ESP_OK)
        {
            ESP_LOGW(TAG, "%04x:%04x detach: %s", slot->id.vid, slot->id.pid, esp_err_to_name(err));
        }

        slot->closing = true;
        if (slot->in_flight)
        {
            // The flushed transfer comes back through report_cb, which
            // releases the slot.
            err = usb_host_endpoint_halt(dev, slot->xfer->bEndpointAddress);
            if (err == ESP_OK)
            {
                err = usb_host_endpoint_flush(dev, slot->xfer->bEndpointAddress);
            }
            if (err == ESP_OK)
            {
                return;
            }
            ESP_LOGW(TAG, "%04x:%04x endpoint flush: %s", slot->id.vid, slot->id.pid, esp_err_to_name(err));
        }
        release(*slot);
    }

    void UsbHidHost::release(Slot &slot)
    {
        esp_err_t err = usb_host_transfer_free(slot.xfer);
        if (err != ESP_OK)
        {
            ESP_LOGW(TAG, "%04x:%04x transfer free: %s", slot.id.vid, slot.id.pid, esp_err_to_name(err));
        }
        err = usb_host_interface_release(client_, slot.dev, slot.interface);
        if (err != ESP_OK)
        {
            ESP_LOGW(TAG, "%04x:%04x interface release: %s", slot.id.vid, slot.id.pid, esp_err_to_name(err));
        }
        err = usb_host_device_close(client_, slot.dev);
        if (err != ESP_OK)
        {
            ESP_LOGW(TAG, "%04x:%04x close: %s", slot.id.vid, slot.id.pid, esp_err_to_name(err));
        }
        slot.dev = nullptr;
        slot.xfer = nullptr;
        slot.in_flight = false;
        slot.closing = false;
    }

} // namespace usb_hid
