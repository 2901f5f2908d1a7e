#pragma once

#include "api/update_client.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/installer.hpp"
#include "core/notice_store.hpp"
#include "core/swap_coordinator.hpp"
#include "core/version_store.hpp"
#include "launcher/launcher_state.hpp"
#include "launcher/process_launcher.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct LaunchOptions {
    bool launch = true;                 // false: stop after the update phase
    std::vector<std::string> args;      // forwarded to the application
};

struct LaunchOutcome {
    LauncherState final_state = LauncherState::Idle;
    ErrorKind error = ErrorKind::None;  // fatal error, or the last non-fatal one
    std::string message;
    std::vector<std::string> warnings;  // non-fatal problems, in order

    bool update_available = false;
    bool updated = false;
    VersionTag installed_version;       // valid when updated

    bool launched = false;
    VersionTag launched_version;        // valid when launched
    pid_t pid = -1;
};

/// Drives one launch session through the LauncherState machine:
/// check -> [prompt -> download -> verify -> install -> promote -> clean]
/// -> launch.
///
/// Every failure before Launching falls back to the version the
/// current-version record already points at; only LaunchFailed is fatal.
/// The session runs on a worker thread so the caller can cancel().
class LauncherController {
public:
    /// Return true to install the offered update
    using PromptHandler = std::function<bool(const UpdateDescriptor& offered, const VersionTag& current)>;
    using StateObserver = std::function<void(LauncherState from, LauncherState to)>;
    using NoticeHandler = std::function<void(const Notice& notice)>;

    explicit LauncherController(const Config& config);
    ~LauncherController();

    LauncherController(const LauncherController&) = delete;
    LauncherController& operator=(const LauncherController&) = delete;

    void set_prompt_handler(PromptHandler handler) { prompt_ = std::move(handler); }
    void set_state_observer(StateObserver observer) { observer_ = std::move(observer); }
    void set_progress_handler(ProgressCallback handler) { progress_ = std::move(handler); }
    void set_notice_handler(NoticeHandler handler) { notice_handler_ = std::move(handler); }

    /// Start the session on a worker thread. Only one session per controller.
    /// SIGINT and SIGTERM are blocked in the worker, so they are delivered
    /// to the other threads of the process.
    bool start(const LaunchOptions& options = {});

    /// Join the worker and return the outcome
    LaunchOutcome wait();

    /// start() + wait()
    LaunchOutcome run(const LaunchOptions& options = {});

    /// Abort an in-flight download; safe from any thread or signal-driven
    /// code path. The staging directory is removed before the session
    /// moves on to Launching.
    void cancel() { cancel_.store(true); }
    bool cancel_requested() const { return cancel_.load(); }

    LauncherState state() const { return state_.load(); }

    /// Every state visited so far, starting with Idle
    std::vector<LauncherState> history() const;

    /// Wait for the launched application; returns its exit code
    int wait_for_application();

    /// Version the session would launch right now: the record's version if
    /// its directory is finalized, else the newest finalized directory.
    bool resolve_launch_target(VersionTag& out) const;

    VersionStore& store() { return store_; }

private:
    const Config& config_;
    VersionStore store_;
    UpdateClient client_;
    Installer installer_;
    SwapCoordinator swap_;
    NoticeStore notices_;
    ProcessLauncher process_;

    PromptHandler prompt_;
    StateObserver observer_;
    ProgressCallback progress_;
    NoticeHandler notice_handler_;

    std::atomic<LauncherState> state_{LauncherState::Idle};
    std::atomic<bool> cancel_{false};
    mutable std::mutex history_mutex_;
    std::vector<LauncherState> history_;

    std::thread worker_;
    bool started_ = false;
    LaunchOptions options_;
    LaunchOutcome outcome_;

    /// The one place the state changes; throws std::logic_error on a move
    /// the transition table does not allow
    void transition(LauncherState next);

    void session();
    void show_notice();
    bool decide(const UpdateDescriptor& desc, bool must_install, const VersionTag& current);
    bool install_update(const UpdateDescriptor& desc);
    bool fetch_and_expand(const UpdateDescriptor& desc);
    void launch();

    void report(ErrorKind kind, const std::string& message);
};
