/*
Device session tests: frames, idle suppression, literal edges, sensitivity
step, disconnection and independence of concurrent sessions.
*/
#include "app/device_session.hpp"
#include "esp_event.h"
#include "test_support.hpp"

#include <cstdlib>
#include <functional>
#include <memory>
#include <string>
#include <vector>

using session::DeviceSession;
using session::State;
using test_support::CaptureTransport;
using test_support::ScriptedDriver;
using test_support::axes_sample;
using test_support::button_sample;

namespace
{
    std::unique_ptr<config::Registry> g_registry;

    struct Rig
    {
        ScriptedDriver *driver = nullptr;
        CaptureTransport *transport = nullptr;
        std::unique_ptr<DeviceSession> session;
    };

    Rig make_rig(const config::Registry &reg, const char *device, esp_err_t open_result = ESP_OK)
    {
        Rig rig;
        rig.driver = new ScriptedDriver(open_result);
        rig.transport = new CaptureTransport();
        rig.session.reset(new DeviceSession(reg, device, std::unique_ptr<devices::IInputDriver>(rig.driver),
                                            std::unique_ptr<transport::ITransport>(rig.transport)));
        return rig;
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

static int test_open_and_close(void)
{
    Rig rig = make_rig(*g_registry, "Bluetooth_mouse");
    EXPECT(rig.session->state() == State::Created, "created");
    EXPECT(rig.session->open() == ESP_OK, "open");
    EXPECT(rig.session->state() == State::Opened, "opened");
    EXPECT(rig.driver->is_open() && rig.transport->is_started(), "driver and socket acquired");
    EXPECT(rig.driver->params().identity.pid == 0xb03a, "driver opened for the configured identity");
    EXPECT(rig.session->open() == ESP_ERR_INVALID_STATE, "open twice");

    rig.session->close();
    EXPECT(rig.session->state() == State::Closed, "closed");
    EXPECT(!rig.driver->is_open() && !rig.transport->is_started(), "driver and socket released");

    rig.session->process(axes_sample(0, {{"x", 0.5}}));
    EXPECT(rig.transport->sent().empty(), "nothing sent after close");
    return 0;
}

static int test_open_failures(void)
{
    Rig unknown = make_rig(*g_registry, "Trackball");
    EXPECT(unknown.session->open() == MDOF_ERR_DEVICE_NOT_FOUND, "device not in the configuration");
    EXPECT(unknown.session->state() == State::Created, "session does not advance");

    Rig absent = make_rig(*g_registry, "Bluetooth_mouse", MDOF_ERR_DEVICE_NOT_FOUND);
    EXPECT(absent.session->open() == MDOF_ERR_DEVICE_NOT_FOUND, "driver cannot open");
    EXPECT(absent.session->state() == State::Created, "still created");
    EXPECT(!absent.transport->is_started(), "no socket for an absent device");
    return 0;
}

static int test_mouse_scenario(void)
{
    Rig rig = make_rig(*g_registry, "Bluetooth_mouse");
    EXPECT(rig.session->open() == ESP_OK, "open");
    rig.driver->push_sample(axes_sample(1000, {{"x", 0.0}, {"y", -0.0394}}));
    EXPECT(rig.session->run_once() == ESP_OK, "one iteration");

    std::vector<test_support::Datagram> sent = rig.transport->sent();
    EXPECT(sent.size() == 1, "one datagram");
    EXPECT(sent[0].payload == "addrotation 0.0 0.039 0.0 1", "signs applied, step in the fourth value");
    EXPECT(sent[0].host == "127.0.0.1" && sent[0].port == 7755, "sent to the selected visualisation");
    EXPECT(rig.session->stats().frames_sent == 1 && rig.session->stats().samples == 1, "stats");
    return 0;
}

static int test_idle_frames_suppressed(void)
{
    Rig rig = make_rig(*g_registry, "Office_mouse");
    EXPECT(rig.session->open() == ESP_OK, "open");

    rig.driver->push_sample(axes_sample(0, {{"x", 0.05}, {"y", -0.05}}));
    EXPECT(rig.session->run_once() == ESP_OK, "inside deadzone");
    EXPECT(rig.transport->sent().empty(), "all-zero frame not sent");

    rig.driver->push_sample(axes_sample(0, {{"x", 0.5}}));
    EXPECT(rig.session->run_once() == ESP_OK, "moved");
    std::vector<std::string> p = rig.transport->payloads();
    EXPECT(p.size() == 1 && p[0] == "addrotation -0.5 0.0 0.0 1", "unwritten slots are zero");

    EXPECT(rig.session->run_once() == ESP_ERR_TIMEOUT, "no sample");
    EXPECT(rig.transport->sent().size() == 1, "nothing sent without a sample");
    return 0;
}

static int test_literal_on_rising_edge(void)
{
    Rig rig = make_rig(*g_registry, "Bluetooth_mouse");
    EXPECT(rig.session->open() == ESP_OK, "open");

    rig.session->process(button_sample(0, "left_click", true));
    rig.session->process(button_sample(0, "left_click", true));
    rig.session->process(button_sample(0, "left_click", false));
    rig.session->process(button_sample(0, "right_click", true));
    rig.session->process(button_sample(0, "left_click", true));

    std::vector<std::string> p = rig.transport->payloads();
    EXPECT(p.size() == 3, "one literal per press");
    EXPECT(p[0] == "BRAKE" && p[1] == "RELEASE" && p[2] == "BRAKE", "literal text");
    EXPECT(rig.session->stats().literals_sent == 3 && rig.session->stats().frames_sent == 0, "literal stats");
    return 0;
}

static int test_sensitivity_step_cycle(void)
{
    Rig rig = make_rig(*g_registry, "Board_knob");
    EXPECT(rig.session->open() == ESP_OK, "open");
    EXPECT(rig.session->sensitivity_step() == 1, "starts at 1");

    rig.session->process(axes_sample(0, {{"rotation", 1.0}}));
    rig.session->process(button_sample(0, "press", true));
    rig.session->process(button_sample(0, "press", false));
    EXPECT(rig.session->sensitivity_step() == 5, "first press");
    rig.session->process(axes_sample(0, {{"rotation", -1.0}}));

    std::vector<std::string> p = rig.transport->payloads();
    EXPECT(p.size() == 2, "the press itself sends nothing");
    EXPECT(p[0] == "addrotation -1.0 0.0 0.0 1", "step 1");
    EXPECT(p[1] == "addrotation 1.0 0.0 0.0 5", "step 5");

    const int expected[] = {10, 15, 20, 1};
    for (int step : expected)
    {
        rig.session->process(button_sample(0, "press", true));
        rig.session->process(button_sample(0, "press", false));
        EXPECT(rig.session->sensitivity_step() == step, "step cycles 1, 5, 10, 15, 20");
    }
    return 0;
}

static int test_next_command_cycle(void)
{
    std::string json = test_support::kBridgeJson;
    std::size_t at = json.find("\"press\": \"sensitivity_step\"");
    EXPECT(at != std::string::npos, "edit applies");
    json.replace(at, std::strlen("\"press\": \"sensitivity_step\""), "\"press\": \"next_command\"");

    std::unique_ptr<config::Registry> reg;
    std::vector<std::string> problems;
    EXPECT(test_support::build_registry(json.c_str(), reg, problems) == ESP_OK, "registry");

    Rig rig = make_rig(*reg, "Board_knob");
    EXPECT(rig.session->open() == ESP_OK, "open");
    EXPECT(rig.session->command_index() == 0, "starts at the target command");

    rig.session->process(axes_sample(0, {{"rotation", 1.0}}));
    rig.session->process(button_sample(0, "press", true));
    rig.session->process(button_sample(0, "press", true));
    rig.session->process(button_sample(0, "press", false));
    EXPECT(rig.session->command_index() == 1, "one step per press");
    rig.session->process(axes_sample(0, {{"rotation", 1.0}}));
    rig.session->process(button_sample(0, "press", true));
    rig.session->process(button_sample(0, "press", false));
    EXPECT(rig.session->command_index() == 0, "cycle wraps");
    rig.session->process(axes_sample(0, {{"rotation", -1.0}}));

    std::vector<std::string> p = rig.transport->payloads();
    EXPECT(p.size() == 3, "the press itself sends nothing");
    EXPECT(p[0] == "addrotation -1.0 0.0 0.0 1", "target command");
    EXPECT(p[1] == "addrotationclip -1.0 0.0 0.0 1", "alternate after a press");
    EXPECT(p[2] == "addrotation 1.0 0.0 0.0 1", "back to the target command");
    EXPECT(rig.session->sensitivity_step() == 1, "step untouched");
    return 0;
}

static int test_errors_do_not_stop_the_session(void)
{
    Rig rig = make_rig(*g_registry, "Office_mouse");
    EXPECT(rig.session->open() == ESP_OK, "open");

    rig.driver->push_result(ESP_ERR_INVALID_SIZE);
    EXPECT(rig.session->run_once() == ESP_ERR_INVALID_SIZE, "poll error returned");
    EXPECT(rig.session->stats().poll_errors == 1, "poll error counted");

    rig.transport->fail_sends(true);
    rig.session->process(axes_sample(0, {{"x", 0.5}}));
    EXPECT(rig.session->stats().send_failures == 1, "send failure counted");

    rig.transport->fail_sends(false);
    rig.session->process(axes_sample(0, {{"x", 0.5}}));
    EXPECT(rig.transport->sent().size() == 1, "next frame goes out");
    EXPECT(rig.session->state() == State::Opened, "session unaffected");
    return 0;
}

static int test_send_every(void)
{
    std::string json = test_support::kBridgeJson;
    std::size_t at = json.find("\"send_every\": 1");
    EXPECT(at != std::string::npos, "edit applies");
    json.replace(at, std::strlen("\"send_every\": 1"), "\"send_every\": 2");

    std::unique_ptr<config::Registry> reg;
    std::vector<std::string> problems;
    EXPECT(test_support::build_registry(json.c_str(), reg, problems) == ESP_OK, "registry");

    Rig rig = make_rig(*reg, "Office_mouse");
    EXPECT(rig.session->open() == ESP_OK, "open");
    for (int i = 0; i < 5; ++i)
    {
        rig.session->process(axes_sample(0, {{"x", 0.5}}));
    }
    rig.session->process(axes_sample(0, {{"x", 0.0}}));
    EXPECT(rig.transport->sent().size() == 2, "every second active frame");
    return 0;
}

static int test_poll_wait_at_least_one_tick(void)
{
    std::string json = test_support::kBridgeJson;
    std::size_t at = json.find("\"poll_wait_ms\": 5");
    EXPECT(at != std::string::npos, "edit applies");
    json.replace(at, std::strlen("\"poll_wait_ms\": 5"), "\"poll_wait_ms\": 0");

    std::unique_ptr<config::Registry> reg;
    std::vector<std::string> problems;
    EXPECT(test_support::build_registry(json.c_str(), reg, problems) == ESP_OK, "zero poll wait accepted");

    Rig rig = make_rig(*reg, "Office_mouse");
    EXPECT(rig.session->open() == ESP_OK, "open");
    EXPECT(pdMS_TO_TICKS(rig.session->poll_wait_ms()) >= 1, "poll wait raised to one tick");

    TickType_t before = xTaskGetTickCount();
    EXPECT(rig.session->start() == ESP_OK, "start");
    vTaskDelay(pdMS_TO_TICKS(100));
    rig.session->request_stop();
    EXPECT(rig.session->wait_closed(2000) == ESP_OK, "stop");
    TickType_t elapsed = xTaskGetTickCount() - before;

    EXPECT(rig.driver->last_wait_ms() == rig.session->poll_wait_ms(), "driver asked to block");
    EXPECT(rig.driver->polls() > 0, "loop ran");
    EXPECT(static_cast<TickType_t>(rig.driver->polls()) <= elapsed + 2, "idle loop blocks at least a tick per poll");
    return 0;
}

static int test_stats_snapshot_while_running(void)
{
    Rig rig = make_rig(*g_registry, "Office_mouse");
    EXPECT(rig.session->open() == ESP_OK, "open");
    EXPECT(rig.session->start() == ESP_OK, "start");

    std::uint32_t last = 0;
    for (int i = 0; i < 20; ++i)
    {
        rig.driver->push_sample(axes_sample(i, {{"x", 0.5}}));
        session::Stats st = rig.session->stats();
        EXPECT(st.frames_sent >= last, "counters only grow");
        last = st.frames_sent;
        vTaskDelay(1);
    }
    EXPECT(wait_until([&] { return rig.session->stats().frames_sent == 20; }, 2000), "every sample sent");
    rig.session->request_stop();
    EXPECT(rig.session->wait_closed(2000) == ESP_OK, "stop");
    return 0;
}

static int test_every_waiter_sees_the_close(void)
{
    Rig rig = make_rig(*g_registry, "Office_mouse");
    EXPECT(rig.session->open() == ESP_OK && rig.session->start() == ESP_OK, "running");
    EXPECT(rig.session->wait_closed(10) == ESP_ERR_TIMEOUT, "still running");
    rig.session->request_stop();
    EXPECT(rig.session->wait_closed(2000) == ESP_OK, "first waiter");
    EXPECT(rig.session->wait_closed(0) == ESP_OK, "second waiter");
    EXPECT(rig.session->wait_closed(0) == ESP_OK, "and again");
    return 0;
}

static int test_disconnect_closes_session(void)
{
    Rig rig = make_rig(*g_registry, "Bluetooth_mouse");
    EXPECT(rig.session->open() == ESP_OK, "open");
    rig.driver->push_sample(axes_sample(0, {{"x", 0.25}}));
    rig.driver->push_result(MDOF_ERR_DEVICE_DISCONNECTED);

    EXPECT(rig.session->start() == ESP_OK, "start");
    EXPECT(rig.session->wait_closed(2000) == ESP_OK, "loop ends on removal");
    EXPECT(rig.session->state() == State::Closed, "closed");
    EXPECT(rig.driver->closes() == 1, "driver released once");
    EXPECT(rig.transport->payloads().size() == 1, "sample before removal processed");
    return 0;
}

static int test_sessions_are_independent(void)
{
    Rig a = make_rig(*g_registry, "Bluetooth_mouse");
    Rig b = make_rig(*g_registry, "Office_mouse");
    EXPECT(a.session->open() == ESP_OK && b.session->open() == ESP_OK, "open both");

    a.transport->fail_sends(true);
    a.driver->push_sample(axes_sample(0, {{"x", 0.9}}));
    a.driver->push_result(MDOF_ERR_DEVICE_DISCONNECTED);

    EXPECT(a.session->start() == ESP_OK && b.session->start() == ESP_OK, "start both");
    EXPECT(a.session->wait_closed(2000) == ESP_OK, "failing device closes");
    EXPECT(b.session->state() == State::Running, "other session keeps running");

    for (int i = 0; i < 3; ++i)
    {
        b.driver->push_sample(axes_sample(i, {{"y", 0.5}}));
    }
    EXPECT(wait_until([&] { return b.transport->sent().size() == 3; }, 2000), "other session still dispatches");
    for (const auto &payload : b.transport->payloads())
    {
        EXPECT(payload == "addrotation 0.0 -0.5 0.0 1", "other session's frames intact");
    }

    b.session->request_stop();
    EXPECT(b.session->wait_closed(2000) == ESP_OK, "stop");
    EXPECT(b.session->state() == State::Closed && !b.driver->is_open(), "released on stop");
    EXPECT(a.session->stats().send_failures == 1, "failure stays with its session");
    EXPECT(b.session->stats().send_failures == 0 && b.session->stats().frames_sent == 3, "no failures leak across sessions");
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
    failures += test_open_and_close();
    failures += test_open_failures();
    failures += test_mouse_scenario();
    failures += test_idle_frames_suppressed();
    failures += test_literal_on_rising_edge();
    failures += test_sensitivity_step_cycle();
    failures += test_next_command_cycle();
    failures += test_errors_do_not_stop_the_session();
    failures += test_send_every();
    failures += test_poll_wait_at_least_one_tick();
    failures += test_stats_snapshot_while_running();
    failures += test_every_waiter_sees_the_close();
    failures += test_disconnect_closes_session();
    failures += test_sessions_are_independent();
    std::printf("test_session: %d failed\n", failures);
    std::exit(failures ? 1 : 0);
}
