#pragma once

#include "esp_err.h"

#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "freertos/task.h"

#include "app/dispatcher.hpp"
#include "config/registry.hpp"
#include "core/command_template.hpp"
#include "core/transform.hpp"
#include "devices/input_driver.hpp"
#include "infra/transport/i_transport.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace session
{

    enum class State : int
    {
        Created,
        Opened,
        Running,
        Stopping,
        Closed,
    };

    const char *state_to_string(int state);

    struct Stats
    {
        std::uint32_t samples = 0;
        std::uint32_t frames_sent = 0;
        std::uint32_t literals_sent = 0;
        std::uint32_t send_failures = 0;
        std::uint32_t poll_errors = 0;
    };

    // Sensitivity step cycle driven by the sensitivity_step button action.
    constexpr int kSensitivitySteps[] = {1, 5, 10, 15, 20};

    // Control loop for one device: poll, transform, dispatch. The session
    // exclusively owns its driver, its socket and the transform state of
    // every control; the registry is only read.
    class DeviceSession
    {
    public:
        DeviceSession(const config::Registry &registry,
                      std::string device_name,
                      std::unique_ptr<devices::IInputDriver> driver,
                      std::unique_ptr<transport::ITransport> transport);
        ~DeviceSession();

        DeviceSession(const DeviceSession &) = delete;
        DeviceSession &operator=(const DeviceSession &) = delete;

        // Created -> Opened. MDOF_ERR_DEVICE_NOT_FOUND when the device is not
        // in the registry or the driver cannot open it.
        esp_err_t open();

        // Opened -> Running on a task of its own.
        esp_err_t start();

        // Ask the loop to stop after the current iteration.
        void request_stop() { stop_requested_.store(true); }

        // Wait for Closed. ESP_ERR_TIMEOUT if the task is still running. Any
        // number of tasks may wait; all of them return once it has closed.
        esp_err_t wait_closed(std::uint32_t timeout_ms);

        // One loop iteration on the caller's task. Returns the poll result:
        // ESP_ERR_TIMEOUT when no sample arrived, MDOF_ERR_DEVICE_DISCONNECTED
        // after removal.
        esp_err_t run_once();

        // Transform one sample and send the resulting commands.
        void process(const devices::RawSample &sample);

        // Release the driver and the socket and drop all transform state.
        // Valid from Opened or Stopping.
        void close();

        State state() const { return state_.load(); }
        const std::string &name() const { return name_; }
        // Snapshot; safe to call from any task while the session runs.
        Stats stats() const;
        // Effective driver poll wait, fixed at open().
        std::uint32_t poll_wait_ms() const { return poll_wait_ms_; }
        int sensitivity_step() const { return kSensitivitySteps[step_index_]; }
        // Position in the visualisation command cycle; 0 is the target's
        // own command. Advanced by the next_command button action.
        std::size_t command_index() const { return command_index_; }

    private:
        struct Counters
        {
            std::atomic<std::uint32_t> samples{0};
            std::atomic<std::uint32_t> frames_sent{0};
            std::atomic<std::uint32_t> literals_sent{0};
            std::atomic<std::uint32_t> send_failures{0};
            std::atomic<std::uint32_t> poll_errors{0};
        };

        struct Frame
        {
            std::vector<command::Value> slots;
            bool touched = false;
            bool active = false; // some control slot is non-zero
            std::uint32_t count = 0;
        };

        static void task_entry(void *arg);
        void loop();
        void set_state(State next);
        void apply(std::size_t binding_index, double raw, std::int64_t timestamp_us);
        void flush_frames();
        void report_failure(const std::string &command, esp_err_t err);

        const config::Registry &registry_;
        std::string name_;
        std::unique_ptr<devices::IInputDriver> driver_;
        std::unique_ptr<transport::ITransport> transport_;

        const config::DeviceBinding *device_ = nullptr;
        std::unique_ptr<actuation::Dispatcher> dispatcher_;
        std::map<std::string, std::size_t> axis_index_;
        std::map<std::string, std::size_t> button_index_;
        std::vector<transform::State> states_;
        std::vector<bool> button_on_;
        std::vector<Frame> frames_;
        std::size_t step_index_ = 0;
        std::size_t command_index_ = 0;
        std::uint32_t poll_wait_ms_ = 0;

        std::atomic<State> state_{State::Created};
        std::atomic<bool> stop_requested_{false};
        TaskHandle_t task_ = nullptr;
        SemaphoreHandle_t closed_ = nullptr;
        Counters stats_;
    };

} // namespace session
