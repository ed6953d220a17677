#pragma once

// Global application state enum used by the FSM in main.cpp
// and in bridge_events payloads.

enum class AppState
{
    BootStorage,
    BootNetwork,
    BootConfig,
    Running,
    ConfigMode,
    Halted,
};

const char *app_state_to_string(AppState state);

// Global application state variable defined in main.cpp.
extern AppState g_app_state;
