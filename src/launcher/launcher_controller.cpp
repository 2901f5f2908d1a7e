#include "launcher/launcher_controller.hpp"
#include "core/install_lock.hpp"
#include "core/logger.hpp"

#include <filesystem>
#include <pthread.h>
#include <signal.h>
#include <stdexcept>

namespace fs = std::filesystem;

static InstallOptions install_options(const AppConfig& cfg) {
    InstallOptions opts;
    opts.executable = cfg.executable;
    opts.connect_timeout_sec = cfg.server_timeout_sec;
    opts.read_timeout_sec = cfg.download_timeout_sec;
    return opts;
}

LauncherController::LauncherController(const Config& config)
    : config_(config),
      store_(config.current_record_path(), config.versions_dir()),
      client_(config.data().server_url, config.data().server_timeout_sec),
      installer_(store_, install_options(config.data())),
      swap_(store_, config.data().program_id),
      notices_(config.notice_ack_path()) {
    history_.push_back(LauncherState::Idle);
}

LauncherController::~LauncherController() {
    cancel();
    if (worker_.joinable()) {
        worker_.join();
    }
}

// ════════════════════════════════════════════════════════════════
// Session control
// ════════════════════════════════════════════════════════════════

bool LauncherController::start(const LaunchOptions& options) {
    if (started_) return false;
    started_ = true;
    options_ = options;

    // SIGINT/SIGTERM stay with the caller's thread; the worker inherits a
    // mask that blocks them
    sigset_t blocked;
    sigset_t previous;
    sigemptyset(&blocked);
    sigaddset(&blocked, SIGINT);
    sigaddset(&blocked, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &blocked, &previous);
    worker_ = std::thread(&LauncherController::session, this);
    pthread_sigmask(SIG_SETMASK, &previous, nullptr);
    return true;
}

LaunchOutcome LauncherController::wait() {
    if (worker_.joinable()) {
        worker_.join();
    }
    outcome_.final_state = state_.load();
    return outcome_;
}

LaunchOutcome LauncherController::run(const LaunchOptions& options) {
    if (!start(options)) {
        LaunchOutcome out;
        out.final_state = state_.load();
        out.error = ErrorKind::LaunchFailed;
        out.message = "session already started";
        return out;
    }
    return wait();
}

std::vector<LauncherState> LauncherController::history() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return history_;
}

int LauncherController::wait_for_application() {
    return process_.wait_for_exit();
}

void LauncherController::transition(LauncherState next) {
    LauncherState from = state_.load();
    if (!is_valid_transition(from, next)) {
        throw std::logic_error(std::string("illegal launcher transition ") +
                               to_string(from) + " -> " + to_string(next));
    }

    state_.store(next);
    {
        std::lock_guard<std::mutex> lock(history_mutex_);
        history_.push_back(next);
    }
    Logger::get()->debug("State {} -> {}", to_string(from), to_string(next));
    if (observer_) {
        observer_(from, next);
    }
}

void LauncherController::report(ErrorKind kind, const std::string& message) {
    outcome_.error = kind;
    outcome_.message = message;
    if (kind != ErrorKind::LaunchFailed) {
        outcome_.warnings.push_back(std::string(to_string(kind)) + ": " + message);
        Logger::get()->warn("{}: {}", to_string(kind), message);
    } else {
        Logger::get()->error("{}: {}", to_string(kind), message);
    }
}

// ════════════════════════════════════════════════════════════════
// The session
// ════════════════════════════════════════════════════════════════

void LauncherController::session() {
    const auto& cfg = config_.data();

    transition(LauncherState::Checking);

    CurrentRecord current = store_.read_current(cfg.program_id);
    if (current.status == CurrentRecord::Status::Corrupt) {
        // Treated as "not installed" so a fresh install repairs it
        report(ErrorKind::CorruptRecord, "current-version record unusable: " + current.error);
    }
    bool have_record = current.status == CurrentRecord::Status::Ok;

    VersionTag launch_target;
    bool launchable = resolve_launch_target(launch_target);

    if (cfg.check_notices) {
        show_notice();
    }

    UpdateCheck check = client_.check_for_update(cfg.program_id, have_record ? &current.version : nullptr);

    switch (check.status) {
        case UpdateCheck::Status::UpToDate:
            transition(LauncherState::UpToDate);
            Logger::get()->info("{} {} is up to date", cfg.program_id, current.version.str());
            break;

        case UpdateCheck::Status::CheckFailed:
            transition(LauncherState::CheckFailed);
            report(ErrorKind::CheckFailed, check.reason);
            break;

        case UpdateCheck::Status::UpdateAvailable:
            transition(LauncherState::UpdateAvailable);
            outcome_.update_available = true;
            Logger::get()->info("Update available: {} -> {}",
                                have_record ? current.version.str() : std::string("(none)"),
                                check.descriptor.version.str());

            // Nothing usable to fall back to: installing is the only way forward
            if (decide(check.descriptor, !have_record || !launchable, current.version)) {
                if (install_update(check.descriptor)) {
                    outcome_.updated = true;
                    outcome_.installed_version = check.descriptor.version;
                }
            }
            break;
    }

    if (!options_.launch) {
        return;
    }

    transition(LauncherState::Launching);
    launch();
}

void LauncherController::show_notice() {
    if (!notice_handler_) return;

    NoticeFetch fetched = client_.fetch_latest_notice(config_.data().program_id);
    if (!fetched.success) {
        Logger::get()->debug("Notice fetch failed: {}", fetched.reason);
        return;
    }
    if (!fetched.has_notice) return;

    // Forced notices ignore the "hide for a day" acknowledgement
    if (!fetched.notice.force && notices_.is_hidden(fetched.notice.id)) {
        Logger::get()->debug("Notice {} is hidden", fetched.notice.id);
        return;
    }
    notice_handler_(fetched.notice);
}

bool LauncherController::decide(const UpdateDescriptor& desc, bool must_install, const VersionTag& current) {
    if (must_install) {
        Logger::get()->info("No usable installed version, installing {}", desc.version.str());
        transition(LauncherState::Accepted);
        return true;
    }

    switch (config_.data().update_policy) {
        case UpdatePolicy::Always:
            transition(LauncherState::Accepted);
            return true;

        case UpdatePolicy::Never:
            transition(LauncherState::Declined);
            return false;

        case UpdatePolicy::Ask:
            break;
    }

    transition(LauncherState::Prompting);
    bool accepted = prompt_ && prompt_(desc, current) && !cancel_.load();
    transition(accepted ? LauncherState::Accepted : LauncherState::Declined);
    return accepted;
}

bool LauncherController::install_update(const UpdateDescriptor& desc) {
    InstallLock lock((fs::path(store_.versions_dir()) / ".install.lock").string());
    if (!lock.try_acquire()) {
        report(ErrorKind::LockBusy, "install skipped, lock " + lock.path() + " " + lock.error());
        return false;
    }

    // Staging and retired leftovers can only come from a crashed attempt
    // now that we hold the lock
    installer_.recover();

    // Finalized by an earlier attempt whose promotion failed: only the
    // record write is left to do
    if (store_.is_finalized(desc.version)) {
        Logger::get()->info("{} is already installed, retrying promotion", desc.version.str());
    } else if (!fetch_and_expand(desc)) {
        return false;
    }

    transition(LauncherState::Promoting);
    StepResult r = swap_.promote(desc.version);
    if (!r.success) {
        // The finalized directory stays; promotion can be retried later
        report(r.error, r.message);
        return false;
    }

    transition(LauncherState::Cleaning);
    auto removed = swap_.prune_old_versions(config_.data().retain_count);
    Logger::get()->info("Installed {} ({} old version(s) removed)", desc.version.str(), removed.size());
    return true;
}

bool LauncherController::fetch_and_expand(const UpdateDescriptor& desc) {
    transition(LauncherState::Downloading);
    StepResult r = installer_.stage(desc.version);
    if (r.success) {
        r = installer_.download(desc, progress_, &cancel_);
    }
    if (!r.success) {
        report(r.error, r.message);
        return false;
    }

    transition(LauncherState::Verifying);
    r = installer_.verify(desc);
    if (!r.success) {
        report(r.error, r.message);
        return false;
    }

    transition(LauncherState::Installing);
    r = installer_.expand(desc);
    if (r.success) {
        r = installer_.finalize(desc.version);
    }
    if (!r.success) {
        report(r.error, r.message);
        return false;
    }
    return true;
}

bool LauncherController::resolve_launch_target(VersionTag& out) const {
    CurrentRecord current = store_.read_current(config_.data().program_id);
    if (current.status == CurrentRecord::Status::Ok && store_.is_finalized(current.version)) {
        out = current.version;
        return true;
    }

    auto versions = store_.list_version_directories();
    if (versions.empty()) {
        return false;
    }

    out = versions.back();
    if (current.status == CurrentRecord::Status::Ok) {
        Logger::get()->warn("Directory for recorded version {} is missing, falling back to {}",
                            current.version.str(), out.str());
    }
    return true;
}

void LauncherController::launch() {
    const auto& cfg = config_.data();

    VersionTag target;
    if (!resolve_launch_target(target)) {
        report(ErrorKind::LaunchFailed, "no installed version of " + cfg.program_id + "; please reinstall");
        transition(LauncherState::LaunchFailed);
        return;
    }

    std::string dir = store_.version_dir(target);
    std::string exe = Installer::find_executable(dir, cfg.executable);
    if (exe.empty()) {
        report(ErrorKind::LaunchFailed,
               "executable '" + cfg.executable + "' missing in " + dir + "; please reinstall");
        transition(LauncherState::LaunchFailed);
        return;
    }

    LaunchResult r = process_.start(exe, dir, options_.args);
    if (!r.success) {
        report(ErrorKind::LaunchFailed, "cannot start " + exe + ": " + r.message + "; please reinstall");
        transition(LauncherState::LaunchFailed);
        return;
    }

    outcome_.launched = true;
    outcome_.launched_version = target;
    outcome_.pid = r.pid;
    transition(LauncherState::Running);
}
