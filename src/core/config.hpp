#pragma once

#include <string>

enum class UpdatePolicy {
    Ask,     // prompt before installing
    Always,  // install without asking
    Never    // report availability, never install
};

struct AppConfig {
    // Remote authority
    std::string server_url = "http://127.0.0.1:8000";
    int server_timeout_sec = 10;
    int download_timeout_sec = 120;

    // Program identity
    std::string program_id = "app";
    std::string executable = "app";

    // Update behavior
    UpdatePolicy update_policy = UpdatePolicy::Ask;
    int retain_count = 2;
    bool check_notices = true;

    // Logging
    std::string log_level = "info";
    std::string log_file = "launcher.log";  // relative to data dir, empty = no file
};

class Config {
public:
    /// base_dir holds data/ and versions/; empty means default_base_dir()
    explicit Config(const std::string& base_dir = "");
    ~Config();

    bool load();
    bool save();

    AppConfig& data();
    const AppConfig& data() const;

    const std::string& base_dir() const { return base_dir_; }
    std::string data_dir() const;
    std::string versions_dir() const;
    std::string config_path() const;
    std::string current_record_path() const;
    std::string notice_ack_path() const;

    /// $LAUNCHPAD_HOME, else the directory containing the running binary
    static std::string default_base_dir();

    static std::string policy_to_string(UpdatePolicy policy);
    static bool policy_from_string(const std::string& text, UpdatePolicy& out);

private:
    std::string base_dir_;
    AppConfig config_;
};
