#pragma once

/// States of one launch session. Every move between them goes through
/// LauncherController::transition(), which consults is_valid_transition().
enum class LauncherState {
    Idle,
    Checking,
    UpToDate,
    UpdateAvailable,
    CheckFailed,
    Prompting,
    Declined,
    Accepted,
    Downloading,
    Verifying,
    Installing,
    Promoting,
    Cleaning,
    Launching,
    Running,       // terminal
    LaunchFailed   // terminal, fatal
};

const char* to_string(LauncherState state);

bool is_valid_transition(LauncherState from, LauncherState to);

bool is_terminal(LauncherState state);
