#include "launcher/launcher_state.hpp"

#include <initializer_list>

const char* to_string(LauncherState state) {
    switch (state) {
        case LauncherState::Idle:            return "Idle";
        case LauncherState::Checking:        return "Checking";
        case LauncherState::UpToDate:        return "UpToDate";
        case LauncherState::UpdateAvailable: return "UpdateAvailable";
        case LauncherState::CheckFailed:     return "CheckFailed";
        case LauncherState::Prompting:       return "Prompting";
        case LauncherState::Declined:        return "Declined";
        case LauncherState::Accepted:        return "Accepted";
        case LauncherState::Downloading:     return "Downloading";
        case LauncherState::Verifying:       return "Verifying";
        case LauncherState::Installing:      return "Installing";
        case LauncherState::Promoting:       return "Promoting";
        case LauncherState::Cleaning:        return "Cleaning";
        case LauncherState::Launching:       return "Launching";
        case LauncherState::Running:         return "Running";
        case LauncherState::LaunchFailed:    return "LaunchFailed";
    }
    return "Unknown";
}

static bool one_of(LauncherState to, std::initializer_list<LauncherState> allowed) {
    for (auto s : allowed) {
        if (s == to) return true;
    }
    return false;
}

bool is_valid_transition(LauncherState from, LauncherState to) {
    using S = LauncherState;
    switch (from) {
        case S::Idle:            return one_of(to, {S::Checking});
        case S::Checking:        return one_of(to, {S::UpToDate, S::UpdateAvailable, S::CheckFailed});
        case S::UpToDate:        return one_of(to, {S::Launching});
        case S::CheckFailed:     return one_of(to, {S::Launching});
        // Accepted/Declined directly: policy "always"/"never", or nothing installed
        case S::UpdateAvailable: return one_of(to, {S::Prompting, S::Accepted, S::Declined});
        case S::Prompting:       return one_of(to, {S::Accepted, S::Declined});
        case S::Declined:        return one_of(to, {S::Launching});
        // Launching directly when the install lock is busy, Promoting when
        // the offered version is already finalized on disk
        case S::Accepted:        return one_of(to, {S::Downloading, S::Promoting, S::Launching});
        case S::Downloading:     return one_of(to, {S::Verifying, S::Launching});
        case S::Verifying:       return one_of(to, {S::Installing, S::Launching});
        case S::Installing:      return one_of(to, {S::Promoting, S::Launching});
        case S::Promoting:       return one_of(to, {S::Cleaning, S::Launching});
        case S::Cleaning:        return one_of(to, {S::Launching});
        case S::Launching:       return one_of(to, {S::Running, S::LaunchFailed});
        case S::Running:
        case S::LaunchFailed:
            return false;
    }
    return false;
}

bool is_terminal(LauncherState state) {
    return state == LauncherState::Running || state == LauncherState::LaunchFailed;
}
