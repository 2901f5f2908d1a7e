#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

/// Process-wide "launchpad" logger: colored stderr sink plus an optional
/// rotating file sink.
class Logger {
public:
    /// Initialize (or re-initialize) the logger.
    /// level: trace, debug, info, warn, error, critical, off.
    /// $LAUNCHPAD_LOG_LEVEL overrides level when set.
    /// file_path: rotating log file, empty disables it.
    static void init(const std::string& level = "info", const std::string& file_path = "");

    /// Get the logger, initializing a console-only one on first use
    static std::shared_ptr<spdlog::logger> get();

    static void set_level(const std::string& level);

    static void shutdown();

private:
    static std::shared_ptr<spdlog::logger> instance_;
};
