#pragma once

#include "core/update_descriptor.hpp"
#include "core/version_tag.hpp"

#include <memory>
#include <string>

struct UpdateCheck {
    enum class Status {
        UpToDate,
        UpdateAvailable,
        CheckFailed
    };
    Status status = Status::CheckFailed;
    UpdateDescriptor descriptor;   // valid when UpdateAvailable
    VersionTag remote_version;     // valid unless CheckFailed
    std::string reason;            // why CheckFailed
};

struct Notice {
    std::string id;
    std::string level = "INFO";   // CRITICAL | IMPORTANT | INFO
    bool force = false;
    std::string title;
    std::string content;
};

struct NoticeFetch {
    bool success = false;
    bool has_notice = false;
    Notice notice;
    std::string reason;
};

/// Client for the remote version authority:
///   GET /launcher/api/v1/programs/{id}/latest
///   GET /launcher/api/v1/programs/{id}/notices/latest
/// Never throws; every transport or protocol problem becomes CheckFailed.
class UpdateClient {
public:
    explicit UpdateClient(const std::string& server_url, int timeout_sec = 10);
    ~UpdateClient();

    /// Ask whether something strictly newer than local_version exists.
    /// local_version == nullptr means nothing is installed yet.
    UpdateCheck check_for_update(const std::string& program_id,
                                 const VersionTag* local_version) const;

    /// Latest notice for program_id (best effort)
    NoticeFetch fetch_latest_notice(const std::string& program_id) const;

    static std::string user_agent();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
