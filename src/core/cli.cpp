#include "core/cli.hpp"
#include "core/install_lock.hpp"
#include "core/logger.hpp"
#include "core/notice_store.hpp"
#include "core/swap_coordinator.hpp"
#include "core/version_store.hpp"
#include "api/update_client.hpp"
#include "launcher/launcher_controller.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

namespace fs = std::filesystem;

static std::atomic<LauncherController*> g_controller{nullptr};

static void signal_handler(int /*sig*/) {
    if (LauncherController* c = g_controller.load()) {
        c->cancel();
    }
}

// Wait for a line on stdin, giving up once a signal has cancelled the
// session. The worker runs with SIGINT blocked, so a plain read would only
// return after Enter.
static bool read_answer(const LauncherController& controller, std::string& answer) {
    struct pollfd pfd;
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    pfd.revents = 0;

    while (!controller.cancel_requested()) {
        int r = poll(&pfd, 1, 200);
        if (r < 0 && errno != EINTR) return false;
        if (r > 0) return static_cast<bool>(std::getline(std::cin, answer));
    }
    std::cerr << "\n";
    return false;
}

// ── Argument parsing ────────────────────────────────────────

CLI::Options CLI::parse(int argc, char* argv[]) {
    Options opts;
    bool have_command = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--") == 0) {
            for (++i; i < argc; ++i) {
                opts.app_args.emplace_back(argv[i]);
            }
            break;
        }
        if (std::strcmp(arg, "--yes") == 0 || std::strcmp(arg, "-y") == 0) {
            opts.yes = true;
        } else if (std::strcmp(arg, "--no-update") == 0) {
            opts.no_update = true;
        } else if (std::strcmp(arg, "--wait") == 0) {
            opts.wait = true;
        } else if (std::strcmp(arg, "--base-dir") == 0) {
            if (i + 1 >= argc) {
                opts.error = "--base-dir needs a directory";
                return opts;
            }
            opts.base_dir = argv[++i];
        } else if (std::strncmp(arg, "--base-dir=", 11) == 0) {
            opts.base_dir = arg + 11;
        } else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            opts.command = "help";
            have_command = true;
        } else if (std::strcmp(arg, "--version") == 0 || std::strcmp(arg, "-v") == 0) {
            opts.command = "version";
            have_command = true;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            opts.error = std::string("Unknown option: ") + arg;
            return opts;
        } else if (!have_command) {
            opts.command = arg;
            have_command = true;
        } else {
            opts.positional.emplace_back(arg);
        }
    }

    if (opts.yes && opts.no_update) {
        opts.error = "--yes and --no-update cannot be combined";
    }
    return opts;
}

Config CLI::load_config(const Options& opts) {
    Config config(opts.base_dir);
    bool loaded = config.load();

    auto& d = config.data();
    std::string log_file;
    if (!d.log_file.empty()) {
        fs::path p(d.log_file);
        log_file = p.is_absolute() ? p.string() : (fs::path(config.data_dir()) / p).string();
    }
    Logger::init(d.log_level, log_file);

    if (!loaded) {
        Logger::get()->debug("No usable {}, using defaults", config.config_path());
    }
    return config;
}

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    Options opts = parse(argc, argv);
    if (!opts.error.empty()) {
        std::cerr << opts.error << "\n";
        std::cerr << "Run 'launchpad help' for usage.\n";
        return 1;
    }

    const std::string& cmd = opts.command;

    if (cmd == "help") {
        return cmd_help();
    }
    if (cmd == "version") {
        return cmd_version();
    }
    if (cmd == "run") {
        return cmd_session(opts, true);
    }
    if (cmd == "update") {
        return cmd_session(opts, false);
    }
    if (cmd == "check") {
        return cmd_check(opts);
    }
    if (cmd == "status") {
        return cmd_status(opts);
    }
    if (cmd == "versions") {
        return cmd_versions(opts);
    }
    if (cmd == "prune") {
        return cmd_prune(opts);
    }
    if (cmd == "notice") {
        return cmd_notice(opts);
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'launchpad help' for usage.\n";
    return 1;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "launchpad: self-updating application launcher\n"
        "\n"
        "Usage:\n"
        "  launchpad [run] [options] [-- args...]   Check for updates, then launch\n"
        "  launchpad check              Compare installed and latest version\n"
        "  launchpad update             Check and install, do not launch\n"
        "  launchpad status             Show record, versions and leftovers\n"
        "  launchpad versions           List installed versions (* = active)\n"
        "  launchpad prune              Remove old versions beyond update.retain_count\n"
        "  launchpad notice             Show the latest notice\n"
        "  launchpad notice hide <id>   Hide a notice for one day\n"
        "  launchpad version            Show version\n"
        "  launchpad help               Show this help\n"
        "\n"
        "Options:\n"
        "  -y, --yes          Install updates without asking\n"
        "  --no-update        Do not install updates this time\n"
        "  --wait             Wait for the application and return its exit code\n"
        "  --base-dir <dir>   Directory holding data/ and versions/\n"
        "                     (default: $LAUNCHPAD_HOME, else the launcher's directory)\n"
        "  -- args...         Arguments passed to the application\n"
        "\n"
        "Configuration: <base-dir>/data/launcher.yaml\n"
        "Log level override: LAUNCHPAD_LOG_LEVEL=trace|debug|info|warn|error|off\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "launchpad " << APP_VERSION << "\n";
    return 0;
}

// ── run / update ────────────────────────────────────────────

int CLI::cmd_session(const Options& opts, bool launch) {
    Config config = load_config(opts);
    if (opts.no_update) {
        config.data().update_policy = UpdatePolicy::Never;
    } else if (opts.yes) {
        config.data().update_policy = UpdatePolicy::Always;
    }

    LauncherController controller(config);

    bool interactive = isatty(STDIN_FILENO) != 0;
    controller.set_prompt_handler([&](const UpdateDescriptor& offered, const VersionTag& current) {
        if (!interactive) {
            std::cerr << "Update " << offered.version.str()
                      << " available; pass --yes to install it.\n";
            return false;
        }
        std::cerr << "Update " << config.data().program_id << " " << current.str()
                  << " -> " << offered.version.str() << "? [Y/n] " << std::flush;
        std::string answer;
        if (!read_answer(controller, answer)) return false;
        return answer.empty() || answer[0] == 'y' || answer[0] == 'Y';
    });

    if (isatty(STDERR_FILENO)) {
        controller.set_progress_handler([](int64_t received, int64_t total) {
            if (total > 0) {
                std::cerr << "\rDownloading: " << (received * 100 / total) << "% ("
                          << received << "/" << total << " bytes)" << std::flush;
                if (received >= total) std::cerr << "\n";
            } else {
                std::cerr << "\rDownloading: " << received << " bytes" << std::flush;
            }
        });
    }
    controller.set_notice_handler([](const Notice& notice) { print_notice(notice); });

    // SIGINT/SIGTERM abort an in-flight download; the session then falls
    // back to the installed version
    struct sigaction sa;
    struct sigaction old_int;
    struct sigaction old_term;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    g_controller.store(&controller);
    sigaction(SIGINT, &sa, &old_int);
    sigaction(SIGTERM, &sa, &old_term);

    LaunchOptions lo;
    lo.launch = launch;
    lo.args = opts.app_args;
    LaunchOutcome outcome = controller.run(lo);

    sigaction(SIGINT, &old_int, nullptr);
    sigaction(SIGTERM, &old_term, nullptr);
    g_controller.store(nullptr);

    for (const auto& w : outcome.warnings) {
        std::cerr << "warning: " << w << "\n";
    }

    if (!launch) {
        if (outcome.updated) {
            std::cout << "Installed " << outcome.installed_version.str() << "\n";
            return 0;
        }
        if (outcome.update_available && outcome.error == ErrorKind::None) {
            std::cout << "Update available, not installed\n";
            return 0;
        }
        if (outcome.error == ErrorKind::None || outcome.error == ErrorKind::CorruptRecord) {
            std::cout << "Up to date\n";
            return 0;
        }
        return 1;
    }

    if (outcome.final_state == LauncherState::LaunchFailed) {
        std::cerr << "error: " << outcome.message << "\n";
        return 2;
    }

    if (opts.wait) {
        int code = controller.wait_for_application();
        return code < 0 ? 1 : code;
    }
    return 0;
}

// ── check ───────────────────────────────────────────────────

int CLI::cmd_check(const Options& opts) {
    Config config = load_config(opts);
    const auto& d = config.data();

    VersionStore store(config.current_record_path(), config.versions_dir());
    CurrentRecord current = store.read_current(d.program_id);
    bool installed = current.status == CurrentRecord::Status::Ok;

    std::cout << "Program:   " << d.program_id << "\n";
    std::cout << "Installed: " << (installed ? current.version.str() : std::string("(none)")) << "\n";
    if (current.status == CurrentRecord::Status::Corrupt) {
        std::cout << "Record:    corrupt (" << current.error << ")\n";
    }

    UpdateClient client(d.server_url, d.server_timeout_sec);
    UpdateCheck check = client.check_for_update(d.program_id, installed ? &current.version : nullptr);

    switch (check.status) {
        case UpdateCheck::Status::CheckFailed:
            std::cout << "Latest:    unknown\n";
            std::cerr << "Check failed: " << check.reason << "\n";
            return 1;
        case UpdateCheck::Status::UpToDate:
            std::cout << "Latest:    " << check.remote_version.str() << "\n";
            std::cout << "Up to date\n";
            return 0;
        case UpdateCheck::Status::UpdateAvailable:
            std::cout << "Latest:    " << check.remote_version.str() << "\n";
            std::cout << "Update available: " << check.descriptor.download_url << "\n";
            return 0;
    }
    return 1;
}

// ── status ──────────────────────────────────────────────────

int CLI::cmd_status(const Options& opts) {
    Config config = load_config(opts);
    const auto& d = config.data();

    VersionStore store(config.current_record_path(), config.versions_dir());
    CurrentRecord current = store.read_current(d.program_id);

    std::cout << "Base dir:  " << config.base_dir() << "\n";
    std::cout << "Program:   " << d.program_id << "\n";
    std::cout << "Server:    " << d.server_url << "\n";
    std::cout << "Policy:    " << Config::policy_to_string(d.update_policy) << "\n";

    switch (current.status) {
        case CurrentRecord::Status::Ok:
            std::cout << "Active:    " << current.version.str();
            if (!store.is_finalized(current.version)) std::cout << " (directory missing)";
            std::cout << "\n";
            break;
        case CurrentRecord::Status::NotInstalled:
            std::cout << "Active:    (none)\n";
            break;
        case CurrentRecord::Status::Corrupt:
            std::cout << "Active:    record corrupt (" << current.error << ")\n";
            break;
    }

    auto versions = store.list_version_directories();
    std::cout << "Installed: " << versions.size() << " version(s)\n";

    std::vector<std::string> leftovers;
    for (const auto& tag : store.list_staging_directories()) {
        leftovers.push_back(tag.dir_name() + VersionStore::kStagingSuffix);
    }
    for (const auto& tag : store.list_retired_directories()) {
        leftovers.push_back(tag.dir_name() + VersionStore::kRetiredSuffix);
    }
    if (!leftovers.empty()) {
        std::cout << "Leftovers: ";
        for (size_t i = 0; i < leftovers.size(); ++i) {
            if (i) std::cout << ", ";
            std::cout << leftovers[i];
        }
        std::cout << " (removed on the next install)\n";
    }
    return 0;
}

// ── versions ────────────────────────────────────────────────

int CLI::cmd_versions(const Options& opts) {
    Config config = load_config(opts);

    VersionStore store(config.current_record_path(), config.versions_dir());
    CurrentRecord current = store.read_current(config.data().program_id);
    bool have_active = current.status == CurrentRecord::Status::Ok;

    auto versions = store.list_version_directories();
    if (versions.empty()) {
        std::cout << "No versions installed\n";
        return 0;
    }
    for (auto it = versions.rbegin(); it != versions.rend(); ++it) {
        bool active = have_active && *it == current.version;
        std::cout << (active ? "* " : "  ") << it->str() << "\n";
    }
    return 0;
}

// ── prune ───────────────────────────────────────────────────

int CLI::cmd_prune(const Options& opts) {
    Config config = load_config(opts);
    const auto& d = config.data();

    VersionStore store(config.current_record_path(), config.versions_dir());
    InstallLock lock((fs::path(config.versions_dir()) / ".install.lock").string());
    if (!lock.try_acquire()) {
        std::cerr << "Cannot prune: " << lock.error() << "\n";
        return 1;
    }

    SwapCoordinator swap(store, d.program_id);
    auto removed = swap.prune_old_versions(d.retain_count);
    if (removed.empty()) {
        std::cout << "Nothing to remove\n";
        return 0;
    }
    for (const auto& v : removed) {
        std::cout << "Removed " << v.str() << "\n";
    }
    return 0;
}

// ── notice ──────────────────────────────────────────────────

int CLI::cmd_notice(const Options& opts) {
    if (!opts.positional.empty()) {
        if (opts.positional[0] != "hide" || opts.positional.size() != 2) {
            std::cerr << "Usage: launchpad notice [hide <id>]\n";
            return 1;
        }
        Config config = load_config(opts);
        NoticeStore notices(config.notice_ack_path());
        if (!notices.hide(opts.positional[1])) {
            std::cerr << "Failed to write " << config.notice_ack_path() << "\n";
            return 1;
        }
        std::cout << "Notice " << opts.positional[1] << " hidden for one day\n";
        return 0;
    }

    Config config = load_config(opts);
    const auto& d = config.data();
    UpdateClient client(d.server_url, d.server_timeout_sec);
    NoticeFetch fetched = client.fetch_latest_notice(d.program_id);
    if (!fetched.success) {
        std::cerr << "Notice fetch failed: " << fetched.reason << "\n";
        return 1;
    }
    if (!fetched.has_notice) {
        std::cout << "No notice\n";
        return 0;
    }
    print_notice(fetched.notice);
    return 0;
}

void CLI::print_notice(const Notice& notice) {
    std::cerr << "── [" << notice.level << "] " << notice.title << " ──\n";
    if (!notice.content.empty()) {
        std::cerr << notice.content << "\n";
    }
    if (!notice.force && !notice.id.empty()) {
        std::cerr << "(hide for a day: launchpad notice hide " << notice.id << ")\n";
    }
}
