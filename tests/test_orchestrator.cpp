/*
Orchestrator tests: per-device start report, targeted stop, restart after
disconnection.
*/
#include "app/orchestrator.hpp"
#include "esp_event.h"
#include "freertos/semphr.h"
#include "test_support.hpp"

#include <cstdlib>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

using orchestrator::Orchestrator;
using orchestrator::StartResult;
using session::State;
using test_support::CaptureTransport;
using test_support::ScriptedDriver;

namespace
{
    std::unique_ptr<config::Registry> g_registry;

    // Hands out scripted drivers and remembers the last one per device.
    struct Bench
    {
        std::map<std::string, ScriptedDriver *> drivers;
        std::vector<std::string> unplugged; // open fails
        std::vector<std::string> no_driver; // factory returns null
        int created = 0;

        orchestrator::DriverFactory driver_factory()
        {
            return [this](const config::DeviceBinding &device) -> std::unique_ptr<devices::IInputDriver> {
                for (const auto &n : no_driver)
                {
                    if (n == device.name)
                        return nullptr;
                }
                esp_err_t open_result = ESP_OK;
                for (const auto &n : unplugged)
                {
                    if (n == device.name)
                        open_result = MDOF_ERR_DEVICE_NOT_FOUND;
                }
                ScriptedDriver *d = new ScriptedDriver(open_result);
                drivers[device.name] = d;
                ++created;
                return std::unique_ptr<devices::IInputDriver>(d);
            };
        }
    };

    orchestrator::TransportFactory capture_factory()
    {
        return []() { return std::unique_ptr<transport::ITransport>(new CaptureTransport()); };
    }

    // Remembers every transport it creates; valid only while its session lives.
    orchestrator::TransportFactory recording_factory(std::vector<CaptureTransport *> &created)
    {
        return [&created]() {
            CaptureTransport *t = new CaptureTransport();
            created.push_back(t);
            return std::unique_ptr<transport::ITransport>(t);
        };
    }

    esp_err_t result_for(const std::vector<StartResult> &report, const char *device)
    {
        for (const auto &r : report)
        {
            if (r.device == device)
                return r.err;
        }
        return ESP_FAIL;
    }

    struct StopCall
    {
        Orchestrator *orch = nullptr;
        const char *device = nullptr;
        bool all = false;
        esp_err_t err = ESP_FAIL;
        SemaphoreHandle_t done = nullptr;
    };

    void stop_task(void *arg)
    {
        StopCall *call = static_cast<StopCall *>(arg);
        if (call->all)
        {
            call->orch->stop_all();
            call->err = ESP_OK;
        }
        else
        {
            call->err = call->orch->stop(call->device);
        }
        xSemaphoreGive(call->done);
        vTaskDelete(nullptr);
    }

    bool wait_until(const std::function<bool()> &cond, int timeout_ms)
    {
        for (int waited = 0; waited < timeout_ms; waited += 5)
        {
            if (cond())
                return true;
            vTaskDelay(pdMS_TO_TICKS(5));
        }
        return cond();
    }
} // namespace

static int test_start_report(void)
{
    Bench bench;
    bench.unplugged.push_back("Office_mouse");
    bench.no_driver.push_back("Board_knob");
    Orchestrator orch(*g_registry, bench.driver_factory(), capture_factory());

    std::vector<StartResult> report = orch.start();
    EXPECT(report.size() == 3, "one entry per active device");
    EXPECT(result_for(report, "Bluetooth_mouse") == ESP_OK, "present device started");
    EXPECT(result_for(report, "Office_mouse") == MDOF_ERR_DEVICE_NOT_FOUND, "absent device reported");
    EXPECT(result_for(report, "Board_knob") == MDOF_ERR_DEVICE_NOT_FOUND, "missing driver reported");
    EXPECT(result_for(report, "Spare_mouse") == ESP_FAIL, "inactive device not attempted");
    EXPECT(orch.session_count() == 1, "only the started session is kept");
    EXPECT(orch.state("Bluetooth_mouse") == State::Running, "running");

    std::vector<StartResult> again = orch.start(std::vector<std::string>{"Bluetooth_mouse", "Trackball"});
    EXPECT(result_for(again, "Bluetooth_mouse") == ESP_ERR_INVALID_STATE, "already running");
    EXPECT(result_for(again, "Trackball") == MDOF_ERR_DEVICE_NOT_FOUND, "unknown device");

    orch.stop_all();
    EXPECT(orch.session_count() == 0, "all stopped");
    return 0;
}

static int test_stop_one_leaves_others_running(void)
{
    Bench bench;
    Orchestrator orch(*g_registry, bench.driver_factory(), capture_factory());
    std::vector<StartResult> report = orch.start(std::vector<std::string>{"Bluetooth_mouse", "Office_mouse", "Spare_mouse"});
    EXPECT(result_for(report, "Spare_mouse") == ESP_OK, "inactive device can be started by name");
    EXPECT(orch.session_count() == 3, "three sessions");

    EXPECT(orch.stop("Office_mouse") == ESP_OK, "stop one");
    EXPECT(orch.state("Bluetooth_mouse") == State::Running, "first still running");
    EXPECT(orch.state("Spare_mouse") == State::Running, "third still running");
    EXPECT(orch.stop("Office_mouse") == ESP_ERR_NOT_FOUND, "already stopped");

    bench.drivers["Bluetooth_mouse"]->push_sample(test_support::axes_sample(0, {{"x", 0.5}}));
    EXPECT(wait_until([&] {
               session::Stats st;
               return orch.stats("Bluetooth_mouse", st) && st.frames_sent == 1;
           }, 2000),
           "remaining session keeps dispatching");
    return 0;
}

static int test_restart_after_disconnect(void)
{
    Bench bench;
    Orchestrator orch(*g_registry, bench.driver_factory(), capture_factory());
    std::vector<StartResult> report = orch.start(std::vector<std::string>{"Bluetooth_mouse", "Office_mouse"});
    EXPECT(result_for(report, "Bluetooth_mouse") == ESP_OK, "started");

    EXPECT(bench.created == 2, "two drivers");
    bench.drivers["Bluetooth_mouse"]->push_result(MDOF_ERR_DEVICE_DISCONNECTED);
    EXPECT(wait_until([&] { return orch.state("Bluetooth_mouse") == State::Closed; }, 2000), "closed on removal");
    EXPECT(orch.state("Office_mouse") == State::Running, "other session unaffected");

    report = orch.start(std::vector<std::string>{"Bluetooth_mouse"});
    EXPECT(result_for(report, "Bluetooth_mouse") == ESP_OK, "restart after re-plug");
    EXPECT(bench.created == 3, "fresh driver");
    EXPECT(orch.state("Bluetooth_mouse") == State::Running, "running again");
    return 0;
}

static int test_concurrent_stops(void)
{
    Bench bench;
    Orchestrator orch(*g_registry, bench.driver_factory(), capture_factory());
    std::vector<StartResult> report = orch.start(std::vector<std::string>{"Bluetooth_mouse", "Office_mouse"});
    EXPECT(result_for(report, "Bluetooth_mouse") == ESP_OK && result_for(report, "Office_mouse") == ESP_OK, "started");

    SemaphoreHandle_t done = xSemaphoreCreateCounting(3, 0);
    EXPECT(done != nullptr, "semaphore");
    StopCall calls[3];
    calls[0].device = "Bluetooth_mouse";
    calls[1].device = "Bluetooth_mouse";
    calls[2].all = true;
    int launched = 0;
    for (StopCall &call : calls)
    {
        call.orch = &orch;
        call.done = done;
        if (xTaskCreate(stop_task, "stopper", 4096, &call, uxTaskPriorityGet(nullptr), nullptr) == pdPASS)
            ++launched;
    }
    int finished = 0;
    for (int i = 0; i < launched; ++i)
    {
        if (xSemaphoreTake(done, pdMS_TO_TICKS(5000)) == pdTRUE)
            ++finished;
    }
    vSemaphoreDelete(done);
    EXPECT(launched == 3 && finished == 3, "every stopper returned");

    for (int i = 0; i < 2; ++i)
    {
        EXPECT(calls[i].err == ESP_OK || calls[i].err == ESP_ERR_NOT_FOUND, "no stopper times out");
    }
    EXPECT(orch.session_count() == 0, "all sessions gone");

    report = orch.start(std::vector<std::string>{"Bluetooth_mouse"});
    EXPECT(result_for(report, "Bluetooth_mouse") == ESP_OK, "startable again after concurrent stops");
    return 0;
}

static int test_stopping_one_keeps_the_other_sequence(void)
{
    const double xs[] = {0.5, -0.25, 0.0, 0.75, 0.2, -0.9, 0.4, 0.3};
    const std::size_t n = sizeof(xs) / sizeof(xs[0]);
    const std::uint32_t expected_frames = static_cast<std::uint32_t>(n - 1); // 0.0 is idle

    auto frames_sent = [](const Orchestrator &orch, const char *device) {
        session::Stats st;
        return orch.stats(device, st) ? st.frames_sent : 0u;
    };

    // Office_mouse alone. Transports are created in start order.
    std::vector<std::string> baseline;
    {
        Bench bench;
        std::vector<CaptureTransport *> transports;
        Orchestrator orch(*g_registry, bench.driver_factory(), recording_factory(transports));
        EXPECT(result_for(orch.start(std::vector<std::string>{"Office_mouse"}), "Office_mouse") == ESP_OK, "baseline start");
        for (std::size_t i = 0; i < n; ++i)
        {
            bench.drivers["Office_mouse"]->push_sample(test_support::axes_sample(static_cast<std::int64_t>(i), {{"x", xs[i]}}));
        }
        EXPECT(wait_until([&] { return frames_sent(orch, "Office_mouse") == expected_frames; }, 2000), "baseline sent");
        baseline = transports[0]->payloads();
        EXPECT(orch.stop("Office_mouse") == ESP_OK, "baseline stop");
    }
    EXPECT(baseline.size() == n - 1, "idle sample suppressed in the baseline");

    // Same input to two sessions; the second is stopped halfway through.
    Bench bench;
    std::vector<CaptureTransport *> transports;
    Orchestrator orch(*g_registry, bench.driver_factory(), recording_factory(transports));
    std::vector<StartResult> report = orch.start(std::vector<std::string>{"Office_mouse", "Spare_mouse"});
    EXPECT(result_for(report, "Office_mouse") == ESP_OK && result_for(report, "Spare_mouse") == ESP_OK, "both started");
    EXPECT(transports.size() == 2, "one transport per session");
    CaptureTransport *office = transports[0];

    for (std::size_t i = 0; i < n; ++i)
    {
        devices::RawSample sample = test_support::axes_sample(static_cast<std::int64_t>(i), {{"x", xs[i]}});
        bench.drivers["Office_mouse"]->push_sample(sample);
        if (i < n / 2)
        {
            bench.drivers["Spare_mouse"]->push_sample(sample);
        }
        else if (i == n / 2)
        {
            EXPECT(orch.stop("Spare_mouse") == ESP_OK, "stop the other session mid-stream");
        }
    }
    EXPECT(wait_until([&] { return frames_sent(orch, "Office_mouse") == expected_frames; }, 2000), "all sent");
    std::vector<std::string> got = office->payloads();
    EXPECT(orch.stop("Office_mouse") == ESP_OK, "stop");
    EXPECT(got == baseline, "output sequence unchanged by stopping the other session");
    return 0;
}

extern "C" void app_main(void)
{
    esp_err_t err = esp_event_loop_create_default();
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE)
    {
        std::fprintf(stderr, "FAIL: event loop: %s\n", esp_err_to_name(err));
        std::exit(1);
    }

    std::vector<std::string> problems;
    if (test_support::build_registry(test_support::kBridgeJson, g_registry, problems) != ESP_OK)
    {
        std::fprintf(stderr, "FAIL: base configuration rejected\n");
        std::exit(1);
    }

    int failures = 0;
    failures += test_start_report();
    failures += test_stop_one_leaves_others_running();
    failures += test_restart_after_disconnect();
    failures += test_concurrent_stops();
    failures += test_stopping_one_keeps_the_other_sequence();
    std::printf("test_orchestrator: %d failed\n", failures);
    std::exit(failures ? 1 : 0);
}
