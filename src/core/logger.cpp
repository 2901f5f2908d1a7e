#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <vector>

namespace fs = std::filesystem;

std::shared_ptr<spdlog::logger> Logger::instance_ = nullptr;

static std::mutex& logger_mutex() {
    static std::mutex m;
    return m;
}

static std::string resolve_level(const std::string& level) {
    if (const char* env = std::getenv("LAUNCHPAD_LOG_LEVEL")) {
        if (*env) return env;
    }
    return level.empty() ? "info" : level;
}

void Logger::init(const std::string& level, const std::string& file_path) {
    std::lock_guard<std::mutex> lock(logger_mutex());
    if (instance_) {
        instance_->flush();
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::string file_error;
    if (!file_path.empty()) {
        try {
            auto parent = fs::path(file_path).parent_path();
            if (!parent.empty()) {
                fs::create_directories(parent);
            }
            constexpr size_t max_size = 1024 * 1024;  // 1 MiB
            constexpr size_t max_files = 3;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file_path, max_size, max_files));
        } catch (const spdlog::spdlog_ex& ex) {
            file_error = ex.what();
        } catch (const fs::filesystem_error& ex) {
            file_error = ex.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("launchpad", sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
    logger->set_level(spdlog::level::from_str(resolve_level(level)));
    logger->flush_on(spdlog::level::warn);
    instance_ = logger;

    if (!file_error.empty()) {
        instance_->error("Failed to open log file {}: {}", file_path, file_error);
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    {
        std::lock_guard<std::mutex> lock(logger_mutex());
        if (instance_) return instance_;
    }
    init();
    std::lock_guard<std::mutex> lock(logger_mutex());
    return instance_;
}

void Logger::set_level(const std::string& level) {
    get()->set_level(spdlog::level::from_str(level));
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logger_mutex());
    if (instance_) {
        instance_->flush();
        instance_ = nullptr;
    }
}
