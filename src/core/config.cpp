#include "core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;

Config::Config(const std::string& base_dir)
    : base_dir_(base_dir.empty() ? default_base_dir() : base_dir) {}

Config::~Config() = default;

std::string Config::default_base_dir() {
    if (const char* home = std::getenv("LAUNCHPAD_HOME")) {
        if (*home) return home;
    }

    // Linux: /proc/self/exe is a symlink to the running binary
    std::error_code ec;
    fs::path self = fs::canonical("/proc/self/exe", ec);
    if (!ec) {
        return self.parent_path().string();
    }
    return fs::current_path(ec).string();
}

std::string Config::data_dir() const {
    return (fs::path(base_dir_) / "data").string();
}

std::string Config::versions_dir() const {
    return (fs::path(base_dir_) / "versions").string();
}

std::string Config::config_path() const {
    return (fs::path(data_dir()) / "launcher.yaml").string();
}

std::string Config::current_record_path() const {
    return (fs::path(data_dir()) / "current.json").string();
}

std::string Config::notice_ack_path() const {
    return (fs::path(data_dir()) / "notice_ack.json").string();
}

std::string Config::policy_to_string(UpdatePolicy policy) {
    switch (policy) {
        case UpdatePolicy::Ask:    return "ask";
        case UpdatePolicy::Always: return "always";
        case UpdatePolicy::Never:  return "never";
    }
    return "ask";
}

bool Config::policy_from_string(const std::string& text, UpdatePolicy& out) {
    if (text == "ask")    { out = UpdatePolicy::Ask;    return true; }
    if (text == "always") { out = UpdatePolicy::Always; return true; }
    if (text == "never")  { out = UpdatePolicy::Never;  return true; }
    return false;
}

bool Config::load() {
    std::string path = config_path();
    if (!fs::exists(path)) {
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(path);

        // Server section
        if (auto server = root["server"]) {
            config_.server_url = server["url"].as<std::string>(config_.server_url);
            config_.server_timeout_sec = server["timeout_sec"].as<int>(config_.server_timeout_sec);
            config_.download_timeout_sec =
                server["download_timeout_sec"].as<int>(config_.download_timeout_sec);
        }

        // Program section
        if (auto program = root["program"]) {
            config_.program_id = program["id"].as<std::string>(config_.program_id);
            config_.executable = program["executable"].as<std::string>(config_.executable);
        }

        // Update section
        if (auto update = root["update"]) {
            std::string policy = update["policy"].as<std::string>(policy_to_string(config_.update_policy));
            policy_from_string(policy, config_.update_policy);
            config_.retain_count = update["retain_count"].as<int>(config_.retain_count);
            if (config_.retain_count < 1) config_.retain_count = 1;
            config_.check_notices = update["check_notices"].as<bool>(config_.check_notices);
        }

        // Logging section
        if (auto logging = root["logging"]) {
            config_.log_level = logging["level"].as<std::string>(config_.log_level);
            config_.log_file = logging["file"].as<std::string>(config_.log_file);
        }

        return true;
    } catch (const YAML::Exception&) {
        // Parse failed, keep defaults
        return false;
    }
}

bool Config::save() {
    std::string path = config_path();

    try {
        fs::create_directories(data_dir());

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "server" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "url" << YAML::Value << config_.server_url;
        out << YAML::Key << "timeout_sec" << YAML::Value << config_.server_timeout_sec;
        out << YAML::Key << "download_timeout_sec" << YAML::Value << config_.download_timeout_sec;
        out << YAML::EndMap;

        out << YAML::Key << "program" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << config_.program_id;
        out << YAML::Key << "executable" << YAML::Value << config_.executable;
        out << YAML::EndMap;

        out << YAML::Key << "update" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "policy" << YAML::Value << policy_to_string(config_.update_policy);
        out << YAML::Key << "retain_count" << YAML::Value << config_.retain_count;
        out << YAML::Key << "check_notices" << YAML::Value << config_.check_notices;
        out << YAML::EndMap;

        out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << config_.log_level;
        out << YAML::Key << "file" << YAML::Value << config_.log_file;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream fout(path);
        if (!fout.is_open()) return false;
        fout << out.c_str();
        return fout.good();
    } catch (const std::exception&) {
        return false;
    }
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
