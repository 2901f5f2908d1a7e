#pragma once

#include "core/config.hpp"

#include <string>
#include <vector>

struct Notice;

class CLI {
public:
    /// Parse argv and dispatch to subcommand. Returns the process exit code:
    /// 0 ok, 1 usage error or command failure, 2 the application could not
    /// be launched (or, with --wait, the application's own exit code).
    static int run(int argc, char* argv[]);

    struct Options {
        std::string command = "run";            // first non-option word
        std::vector<std::string> positional;    // words after the command
        bool yes = false;                       // accept updates without asking
        bool no_update = false;                 // never install this session
        bool wait = false;                      // wait for the application
        std::string base_dir;                   // --base-dir, empty = default
        std::vector<std::string> app_args;      // everything after "--"
        std::string error;                      // non-empty on a usage error
    };

    static Options parse(int argc, char* argv[]);

    /// Build the Config for opts (base dir, launcher.yaml) and set up logging
    static Config load_config(const Options& opts);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_session(const Options& opts, bool launch);
    static int cmd_check(const Options& opts);
    static int cmd_status(const Options& opts);
    static int cmd_versions(const Options& opts);
    static int cmd_prune(const Options& opts);
    static int cmd_notice(const Options& opts);

    static void print_notice(const Notice& notice);
};
