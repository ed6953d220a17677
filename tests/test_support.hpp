#pragma once

#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include "config/config.hpp"
#include "config/registry.hpp"
#include "core/mdof_err.hpp"
#include "devices/input_driver.hpp"
#include "infra/transport/i_transport.hpp"

#include <cstdio>
#include <cstring>
#include <deque>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#define EXPECT(cond, msg) do { \
    if (!(cond)) { \
        std::fprintf(stderr, "FAIL: %s (%s:%d)\n", msg, __FILE__, __LINE__); \
        return 1; \
    } \
} while (0)

namespace test_support
{

    // Replays a fixed script of poll results. An empty script times out.
    class ScriptedDriver : public devices::IInputDriver
    {
    public:
        struct Step
        {
            esp_err_t result = ESP_OK;
            devices::RawSample sample;
        };

        explicit ScriptedDriver(esp_err_t open_result = ESP_OK) : open_result_(open_result) {}

        void push_sample(const devices::RawSample &sample)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            Step step;
            step.sample = sample;
            steps_.push_back(step);
        }

        void push_result(esp_err_t result)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            Step step;
            step.result = result;
            steps_.push_back(step);
        }

        esp_err_t open(const devices::OpenParams &params) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            params_ = params;
            if (open_result_ == ESP_OK)
                open_ = true;
            return open_result_;
        }

        esp_err_t poll(devices::RawSample &out, std::uint32_t wait_ms) override
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++polls_;
                last_wait_ms_ = wait_ms;
                if (!steps_.empty())
                {
                    Step step = steps_.front();
                    steps_.pop_front();
                    if (step.result == MDOF_ERR_DEVICE_DISCONNECTED)
                        removed_ = true;
                    if (step.result == ESP_OK)
                        out = step.sample;
                    return step.result;
                }
                if (removed_)
                    return MDOF_ERR_DEVICE_DISCONNECTED;
            }
            vTaskDelay(pdMS_TO_TICKS(wait_ms));
            return ESP_ERR_TIMEOUT;
        }

        void close() override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = false;
            ++closes_;
        }

        const char *name() const override { return "scripted"; }

        bool is_open() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return open_;
        }
        int closes() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return closes_;
        }
        std::size_t pending() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return steps_.size();
        }
        int polls() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return polls_;
        }
        std::uint32_t last_wait_ms() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return last_wait_ms_;
        }
        devices::OpenParams params() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return params_;
        }

    private:
        mutable std::mutex mutex_;
        esp_err_t open_result_;
        std::deque<Step> steps_;
        devices::OpenParams params_;
        bool open_ = false;
        bool removed_ = false;
        int closes_ = 0;
        int polls_ = 0;
        std::uint32_t last_wait_ms_ = 0;
    };

    struct Datagram
    {
        std::string host;
        std::uint16_t port = 0;
        std::string payload;
    };

    // Records every datagram instead of sending it.
    class CaptureTransport : public transport::ITransport
    {
    public:
        esp_err_t start() override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            started_ = true;
            return ESP_OK;
        }

        esp_err_t send(const char *host, uint16_t port, const char *payload, size_t len) override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!started_)
                return ESP_ERR_INVALID_STATE;
            if (fail_sends_)
                return MDOF_ERR_TRANSMIT;
            Datagram d;
            d.host = host;
            d.port = port;
            d.payload.assign(payload, len);
            sent_.push_back(d);
            return ESP_OK;
        }

        void stop() override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            started_ = false;
        }

        bool is_started() const override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return started_;
        }

        void fail_sends(bool fail)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            fail_sends_ = fail;
        }

        std::vector<Datagram> sent() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return sent_;
        }

        std::vector<std::string> payloads() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<std::string> out;
            for (const auto &d : sent_)
                out.push_back(d.payload);
            return out;
        }

    private:
        mutable std::mutex mutex_;
        bool started_ = false;
        bool fail_sends_ = false;
        std::vector<Datagram> sent_;
    };

    // Two mice, the board knob and a Drishti style target whose fourth value
    // carries the sensitivity step.
    constexpr const char *kBridgeJson = R"json({
  "ontology": {
    "device_types": {
      "mouse": {
        "axes": ["x", "y", "wheel"],
        "buttons": ["left_click", "right_click", "middle_click"]
      },
      "knob": { "axes": ["rotation"], "buttons": ["press"] }
    },
    "visualisations": { "types": ["volume_rendering", "game"] }
  },
  "visualisation": {
    "options": ["Drishti-v2.6.4", "Unity_VR_Game"],
    "selected": "Drishti-v2.6.4",
    "targets": {
      "Drishti-v2.6.4": {
        "type": "volume_rendering",
        "udp_ip": "127.0.0.1",
        "udp_port": 7755,
        "command": "addrotation %.3f %.3f %.3f %.3f",
        "command_cycle": ["addrotationclip %.3f %.3f %.3f %.3f"],
        "channel_signs": [-1, -1, 1, 1],
        "step_slot": 3
      },
      "Unity_VR_Game": {
        "type": "game",
        "udp_ip": "127.0.0.1",
        "udp_port": 12345,
        "command": "move %.3f %.3f %.3f"
      }
    }
  },
  "actuation": {
    "config": { "send_every": 1, "poll_wait_ms": 5 },
    "commands": {
      "mouse": "addrotation %.3f %.3f %.3f %.3f",
      "unity_rotation": "rotate %.3f %.3f %.3f",
      "unity_brake": "BRAKE",
      "unity_release": "RELEASE"
    }
  },
  "calibration": {
    "default": { "deadzone": 0.1, "scale_factor": 1.0 },
    "devices": {
      "Bluetooth_mouse": {
        "deadzone": 0.0,
        "button_mapping": { "left_click": "unity_brake", "right_click": "unity_release" }
      },
      "Board_knob": {
        "deadzone": 0.0,
        "button_mapping": { "press": "sensitivity_step" }
      }
    }
  },
  "input_devices": {
    "Bluetooth_mouse": {
      "vid": "046d", "pid": "b03a", "type": "mouse", "library": "hid_mouse",
      "axes": ["x", "y"], "buttons": ["left_click", "right_click"], "command": "mouse"
    },
    "Office_mouse": {
      "vid": "046d", "pid": "c077", "type": "mouse", "library": "hid_mouse",
      "axes": ["x", "y"], "buttons": [], "command": "mouse"
    },
    "Board_knob": {
      "vid": "303a", "pid": "0001", "type": "knob", "library": "knob",
      "axes": ["rotation"], "buttons": ["press"], "command": "mouse"
    },
    "Spare_mouse": {
      "vid": "046d", "pid": "c52b", "type": "mouse", "library": "hid_mouse",
      "axes": ["x"], "buttons": [], "command": "mouse", "active": false
    }
  },
  "transformations": {
    "linear": {
      "direct": { "description": "deadzone and scale", "params": { "deadzone": 0.1, "scale": 1.0 } }
    },
    "non_linear": {
      "threshold": { "description": "on/off", "params": { "threshold": 0.5, "high_value": 1.0, "low_value": 0.0 } }
    }
  },
  "device_mappings": {
    "mouse": {
      "left_click": { "transform": { "name": "non_linear.threshold" } },
      "right_click": { "transform": { "name": "non_linear.threshold" } }
    }
  }
})json";

    inline esp_err_t build_registry(const char *json, std::unique_ptr<config::Registry> &out, std::vector<std::string> &problems)
    {
        config::Document doc;
        esp_err_t err = config::parse(json, std::strlen(json), doc, problems);
        if (err != ESP_OK)
            return err;
        return config::Registry::build(doc, out, problems);
    }

    inline bool contains_problem(const std::vector<std::string> &problems, const char *needle)
    {
        for (const auto &p : problems)
        {
            if (p.find(needle) != std::string::npos)
                return true;
        }
        return false;
    }

    inline devices::RawSample axes_sample(std::int64_t ts, std::initializer_list<std::pair<const char *, double>> axes)
    {
        devices::RawSample s;
        s.timestamp_us = ts;
        for (const auto &a : axes)
            s.axes[a.first] = a.second;
        return s;
    }

    inline devices::RawSample button_sample(std::int64_t ts, const char *button, bool pressed)
    {
        devices::RawSample s;
        s.timestamp_us = ts;
        s.buttons[button] = pressed;
        return s;
    }

} // namespace test_support
