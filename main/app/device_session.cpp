#include "device_session.hpp"

#include "app/app_config.hpp"
#include "app/app_events.hpp"
#include "core/mdof_err.hpp"
#include "esp_log.h"

#include <algorithm>

namespace session
{

    namespace
    {
        static const char *TAG = "session";

        constexpr std::size_t kStepCount = sizeof(kSensitivitySteps) / sizeof(kSensitivitySteps[0]);

        // Shortest poll wait that pdMS_TO_TICKS() does not round down to zero.
        constexpr std::uint32_t kMinPollWaitMs = (1000 + configTICK_RATE_HZ - 1) / configTICK_RATE_HZ;

        std::int64_t now_us()
        {
            return static_cast<std::int64_t>(xTaskGetTickCount()) * portTICK_PERIOD_MS * 1000;
        }
    } // namespace

    const char *state_to_string(int state)
    {
        switch (static_cast<State>(state))
        {
        case State::Created:
            return "Created";
        case State::Opened:
            return "Opened";
        case State::Running:
            return "Running";
        case State::Stopping:
            return "Stopping";
        case State::Closed:
            return "Closed";
        }
        return "?";
    }

    DeviceSession::DeviceSession(const config::Registry &registry,
                                 std::string device_name,
                                 std::unique_ptr<devices::IInputDriver> driver,
                                 std::unique_ptr<transport::ITransport> transport)
        : registry_(registry),
          name_(std::move(device_name)),
          driver_(std::move(driver)),
          transport_(std::move(transport))
    {
        closed_ = xSemaphoreCreateBinary();
    }

    DeviceSession::~DeviceSession()
    {
        if (task_)
        {
            request_stop();
            while (wait_closed(app_config::kSessionStopTimeoutMs) == ESP_ERR_TIMEOUT)
            {
                ESP_LOGW(TAG, "[%s] still waiting for the session task to exit", name_.c_str());
            }
        }
        else if (state() == State::Opened)
        {
            close();
        }
        if (closed_)
        {
            vSemaphoreDelete(closed_);
        }
    }

    void DeviceSession::set_state(State next)
    {
        State prev = state_.exchange(next);
        ESP_LOGI(TAG, "[%s] %s -> %s", name_.c_str(), state_to_string(static_cast<int>(prev)),
                 state_to_string(static_cast<int>(next)));
        app_events::post_session_state(name_.c_str(), static_cast<int>(prev), static_cast<int>(next), now_us());
    }

    esp_err_t DeviceSession::open()
    {
        if (state() != State::Created)
        {
            return ESP_ERR_INVALID_STATE;
        }
        if (!driver_ || !transport_ || !closed_)
        {
            return ESP_ERR_INVALID_ARG;
        }

        const config::DeviceBinding *device = registry_.find_device(name_);
        if (!device)
        {
            ESP_LOGE(TAG, "[%s] no such device in the configuration", name_.c_str());
            return MDOF_ERR_DEVICE_NOT_FOUND;
        }

        devices::OpenParams params;
        params.identity = device->identity;
        params.axes = device->axes;
        params.buttons = device->buttons;
        esp_err_t err = driver_->open(params);
        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "[%s] %s driver cannot open %04x:%04x: %s", name_.c_str(), driver_->name(),
                     device->identity.vid, device->identity.pid, mdof_err_to_name(err));
            return MDOF_ERR_DEVICE_NOT_FOUND;
        }

        err = transport_->start();
        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "[%s] transport start failed: %s", name_.c_str(), esp_err_to_name(err));
            driver_->close();
            return err;
        }

        device_ = device;
        dispatcher_.reset(new actuation::Dispatcher(*transport_, registry_.visualisation().endpoint));
        poll_wait_ms_ = std::min<std::uint32_t>(static_cast<std::uint32_t>(registry_.poll_wait_ms()), app_config::kMaxPollWaitMs);
        if (poll_wait_ms_ < kMinPollWaitMs)
        {
            ESP_LOGW(TAG, "[%s] poll wait %u ms is below one tick, using %u ms", name_.c_str(),
                     static_cast<unsigned>(poll_wait_ms_), static_cast<unsigned>(kMinPollWaitMs));
            poll_wait_ms_ = kMinPollWaitMs;
        }

        axis_index_.clear();
        button_index_.clear();
        for (std::size_t i = 0; i < device->bindings.size(); ++i)
        {
            const config::ControlBinding &b = device->bindings[i];
            (b.button ? button_index_ : axis_index_)[b.control] = i;
        }
        states_.assign(device->bindings.size(), transform::State());
        button_on_.assign(device->bindings.size(), false);

        frames_.assign(device->targets.size(), Frame());
        for (std::size_t i = 0; i < device->targets.size(); ++i)
        {
            frames_[i].slots.assign(device->targets[i].tmpl->arity(), command::Value::of_real(0.0));
        }
        step_index_ = 0;
        command_index_ = 0;
        stop_requested_.store(false);

        set_state(State::Opened);
        return ESP_OK;
    }

    esp_err_t DeviceSession::start()
    {
        if (state() != State::Opened)
        {
            return ESP_ERR_INVALID_STATE;
        }
        set_state(State::Running);
        if (xTaskCreate(&DeviceSession::task_entry, name_.c_str(), app_config::kSessionTaskStack, this,
                        app_config::kSessionTaskPriority, &task_) != pdPASS)
        {
            ESP_LOGE(TAG, "[%s] failed to create session task", name_.c_str());
            task_ = nullptr;
            set_state(State::Stopping);
            close();
            return ESP_ERR_NO_MEM;
        }
        return ESP_OK;
    }

    void DeviceSession::task_entry(void *arg)
    {
        static_cast<DeviceSession *>(arg)->loop();
        vTaskDelete(nullptr);
    }

    void DeviceSession::loop()
    {
        while (!stop_requested_.load())
        {
            esp_err_t err = run_once();
            if (err == MDOF_ERR_DEVICE_DISCONNECTED)
            {
                break;
            }
            if (err != ESP_OK && err != ESP_ERR_TIMEOUT)
            {
                vTaskDelay(1);
            }
        }
        set_state(State::Stopping);
        close();
        xSemaphoreGive(closed_);
    }

    esp_err_t DeviceSession::wait_closed(std::uint32_t timeout_ms)
    {
        if (!task_)
        {
            return state() == State::Closed ? ESP_OK : ESP_ERR_INVALID_STATE;
        }
        if (xSemaphoreTake(closed_, pdMS_TO_TICKS(timeout_ms)) != pdTRUE)
        {
            return ESP_ERR_TIMEOUT;
        }
        // Closed is final: hand the token back so every later waiter sees it.
        xSemaphoreGive(closed_);
        return ESP_OK;
    }

    esp_err_t DeviceSession::run_once()
    {
        devices::RawSample sample;
        esp_err_t err = driver_->poll(sample, poll_wait_ms_);
        if (err == ESP_ERR_TIMEOUT)
        {
            return err;
        }
        if (err == MDOF_ERR_DEVICE_DISCONNECTED)
        {
            ESP_LOGW(TAG, "[%s] device removed", name_.c_str());
            app_events::post_device_disconnected(name_.c_str(), now_us());
            return err;
        }
        if (err != ESP_OK)
        {
            stats_.poll_errors.fetch_add(1, std::memory_order_relaxed);
            ESP_LOGW(TAG, "[%s] poll failed: %s", name_.c_str(), mdof_err_to_name(err));
            return err;
        }
        process(sample);
        return ESP_OK;
    }

    void DeviceSession::apply(std::size_t index, double raw, std::int64_t timestamp_us)
    {
        const config::ControlBinding &b = device_->bindings[index];
        double value = b.transform->evaluate(raw, timestamp_us, states_[index]);
        ESP_LOGD(TAG, "[%s] %s %.4f -> %.4f", name_.c_str(), b.control.c_str(), raw, value);

        if (b.button)
        {
            bool on = value != 0.0;
            bool rising = on && !button_on_[index];
            if (on != button_on_[index])
            {
                app_events::post_button_edge(name_.c_str(), b.control.c_str(), on, timestamp_us);
            }
            button_on_[index] = on;

            if (b.kind == config::BindingKind::Action)
            {
                if (!rising)
                    return;
                if (b.action == calibration::Action::SensitivityStep)
                {
                    step_index_ = (step_index_ + 1) % kStepCount;
                    ESP_LOGI(TAG, "[%s] sensitivity step %d", name_.c_str(), sensitivity_step());
                    app_events::post_sensitivity_step(name_.c_str(), sensitivity_step(), timestamp_us);
                }
                else if (b.action == calibration::Action::NextCommand)
                {
                    const config::ActiveVisualisation &vis = registry_.visualisation();
                    command_index_ = (command_index_ + 1) % vis.cycle_length();
                    ESP_LOGI(TAG, "[%s] command '%s'", name_.c_str(), vis.template_at(command_index_).text().c_str());
                }
                return;
            }
            if (b.kind == config::BindingKind::Literal)
            {
                if (rising)
                {
                    const config::CommandTarget &target = device_->targets[b.target];
                    esp_err_t err = dispatcher_->dispatch_literal(*target.tmpl);
                    if (err == ESP_OK)
                        stats_.literals_sent.fetch_add(1, std::memory_order_relaxed);
                    else
                        report_failure(target.key, err);
                }
                return;
            }
        }

        Frame &frame = frames_[b.target];
        frame.slots[static_cast<std::size_t>(b.channel)] = command::Value::of_real(value);
        frame.touched = true;
        if (value != 0.0)
            frame.active = true;
    }

    void DeviceSession::process(const devices::RawSample &sample)
    {
        if (!device_)
        {
            return;
        }
        stats_.samples.fetch_add(1, std::memory_order_relaxed);

        for (const auto &kv : sample.axes)
        {
            auto it = axis_index_.find(kv.first);
            if (it == axis_index_.end())
            {
                ESP_LOGD(TAG, "[%s] unbound axis '%s'", name_.c_str(), kv.first.c_str());
                continue;
            }
            apply(it->second, kv.second, sample.timestamp_us);
        }
        for (const auto &kv : sample.buttons)
        {
            auto it = button_index_.find(kv.first);
            if (it == button_index_.end())
            {
                ESP_LOGD(TAG, "[%s] unbound button '%s'", name_.c_str(), kv.first.c_str());
                continue;
            }
            apply(it->second, kv.second ? 1.0 : 0.0, sample.timestamp_us);
        }

        flush_frames();
    }

    void DeviceSession::flush_frames()
    {
        const config::ActiveVisualisation &vis = registry_.visualisation();
        const std::uint32_t send_every = static_cast<std::uint32_t>(registry_.send_every());

        for (std::size_t i = 0; i < frames_.size(); ++i)
        {
            Frame &frame = frames_[i];
            bool send = frame.touched && frame.active;
            if (send)
            {
                frame.count++;
                send = (frame.count % send_every) == 0;
            }

            if (send)
            {
                const config::CommandTarget &target = device_->targets[i];
                const command::Template *tmpl = target.tmpl;
                if (target.visualisation)
                {
                    tmpl = &vis.template_at(command_index_);
                    for (std::size_t s = 0; s < vis.channel_signs.size() && s < frame.slots.size(); ++s)
                    {
                        frame.slots[s].real *= vis.channel_signs[s];
                    }
                    if (vis.step_slot >= 0)
                    {
                        frame.slots[static_cast<std::size_t>(vis.step_slot)] = command::Value::of_integer(sensitivity_step());
                    }
                }
                esp_err_t err = dispatcher_->dispatch(*tmpl, frame.slots.data(), frame.slots.size());
                if (err == ESP_OK)
                    stats_.frames_sent.fetch_add(1, std::memory_order_relaxed);
                else
                    report_failure(target.key, err);
            }

            std::fill(frame.slots.begin(), frame.slots.end(), command::Value::of_real(0.0));
            frame.touched = false;
            frame.active = false;
        }
    }

    void DeviceSession::report_failure(const std::string &command, esp_err_t err)
    {
        stats_.send_failures.fetch_add(1, std::memory_order_relaxed);
        app_events::post_dispatch_failed(name_.c_str(), command.c_str(), err, now_us());
    }

    void DeviceSession::close()
    {
        State s = state();
        if (s != State::Opened && s != State::Stopping)
        {
            return;
        }
        if (s == State::Opened)
        {
            set_state(State::Stopping);
        }

        driver_->close();
        transport_->stop();
        dispatcher_.reset();
        device_ = nullptr;
        states_.clear();
        button_on_.clear();
        frames_.clear();
        axis_index_.clear();
        button_index_.clear();

        const Stats st = stats();
        ESP_LOGI(TAG, "[%s] closed: samples=%u frames=%u literals=%u send_failures=%u poll_errors=%u",
                 name_.c_str(),
                 static_cast<unsigned>(st.samples),
                 static_cast<unsigned>(st.frames_sent),
                 static_cast<unsigned>(st.literals_sent),
                 static_cast<unsigned>(st.send_failures),
                 static_cast<unsigned>(st.poll_errors));
        set_state(State::Closed);
    }

} // namespace session
