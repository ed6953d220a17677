#pragma once

#include <cstdint>

namespace app_config
{

    // Device session task.
    constexpr std::uint32_t kSessionTaskStack = 6144;
    constexpr std::uint32_t kSessionTaskPriority = 5;

    // Upper bound for a single driver poll, whatever the configuration asks.
    constexpr std::uint32_t kMaxPollWaitMs = 500;

    // How long Orchestrator::stop() waits for a session task to close.
    constexpr std::uint32_t kSessionStopTimeoutMs = 2000;

    // HID report queue depth per attached device.
    constexpr std::uint32_t kHidReportQueueLength = 16;

    // USB host event task, and how long startup waits for devices plugged
    // in at boot to enumerate before sessions open.
    constexpr std::uint32_t kUsbHostTaskStack = 4096;
    constexpr std::uint32_t kUsbHostTaskPriority = 6;
    constexpr std::uint32_t kUsbEnumerationWaitMs = 1500;

    // Wi-Fi station connect timeout before falling back to config mode.
    constexpr std::uint32_t kWifiConnectTimeoutMs = 15000;

    // Knob driver: one detent reported as this axis value.
    constexpr double kKnobStepValue = 1.0;

} // namespace app_config
