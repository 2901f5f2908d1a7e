#include "api/update_client.hpp"
#include "core/logger.hpp"

#ifndef APP_VERSION
#define APP_VERSION "0.0.0"
#endif

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

static std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

/// Only a non-empty JSON string counts; everything else yields ""
static std::string string_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return trim(it->get<std::string>());
}

/// Percent-encode a path segment or query value
static std::string url_encode(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

struct UpdateClient::Impl {
    std::string base_url;     // scheme://host[:port]
    std::string base_path;    // path prefix without trailing slash
    int timeout_sec = 10;

    std::unique_ptr<httplib::Client> make_client() const {
        // httplib::Client accepts "scheme://host:port" and picks SSL for https
        auto cli = std::make_unique<httplib::Client>(base_url);
        cli->set_connection_timeout(timeout_sec, 0);
        cli->set_read_timeout(timeout_sec, 0);
        cli->set_write_timeout(timeout_sec, 0);
        cli->set_follow_location(true);
        return cli;
    }

    httplib::Headers headers() const {
        return {
            {"Accept", "application/json"},
            {"User-Agent", UpdateClient::user_agent()},
        };
    }

    std::string program_path(const std::string& program_id, const std::string& tail) const {
        return base_path + "/launcher/api/v1/programs/" + url_encode(program_id) + tail;
    }

    struct Reply {
        bool ok = false;      // a response arrived
        int status = 0;
        std::string body;
        std::string error;
    };

    Reply get(const std::string& path) const {
        Reply reply;
        try {
            auto cli = make_client();
            if (!cli->is_valid()) {
                reply.error = "invalid server url: " + base_url;
                return reply;
            }
            auto res = cli->Get(path, headers());
            if (!res) {
                reply.error = "request failed: " + httplib::to_string(res.error());
                return reply;
            }
            reply.ok = true;
            reply.status = res->status;
            reply.body = res->body;
        } catch (const std::exception& e) {
            reply.error = std::string("request failed: ") + e.what();
        }
        return reply;
    }
};

UpdateClient::UpdateClient(const std::string& server_url, int timeout_sec)
    : impl_(std::make_unique<Impl>()) {
    std::string url = trim(server_url);
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }

    // Split "http://host:port/prefix" into origin and path prefix
    auto scheme_end = url.find("://");
    auto path_start = (scheme_end == std::string::npos) ? std::string::npos
                                                       : url.find('/', scheme_end + 3);
    if (path_start != std::string::npos) {
        impl_->base_url = url.substr(0, path_start);
        impl_->base_path = url.substr(path_start);
    } else {
        impl_->base_url = url;
    }
    impl_->timeout_sec = timeout_sec;
}

UpdateClient::~UpdateClient() = default;

std::string UpdateClient::user_agent() {
    return std::string("launchpad/") + APP_VERSION;
}

// ── Version check ───────────────────────────────────────────

UpdateCheck UpdateClient::check_for_update(const std::string& program_id,
                                           const VersionTag* local_version) const {
    UpdateCheck check;
    auto failed = [&](const std::string& reason) {
        check.status = UpdateCheck::Status::CheckFailed;
        check.reason = reason;
        Logger::get()->warn("Update check failed: {}", reason);
        return check;
    };

    std::string path = impl_->program_path(program_id, "/latest");
    if (local_version) {
        path += "?current=" + url_encode(local_version->str());
    }

    auto res = impl_->get(path);
    if (!res.ok) {
        return failed(res.error);
    }
    if (res.status != 200) {
        return failed("bad status: " + std::to_string(res.status) + " / " + res.body.substr(0, 200));
    }

    json j;
    try {
        j = json::parse(res.body);
    } catch (const json::parse_error& e) {
        return failed(std::string("json parse failed: ") + e.what());
    }
    if (!j.is_object()) {
        return failed("invalid response: not an object");
    }

    std::string pid = string_field(j, "program_id");
    if (pid.empty()) {
        return failed("invalid response: \"program_id\"");
    }
    if (pid != program_id) {
        return failed("invalid response: program_id '" + pid + "' != '" + program_id + "'");
    }

    VersionTag remote;
    if (!VersionTag::parse(string_field(j, "latest_version"), remote)) {
        return failed("invalid response: \"latest_version\"");
    }
    check.remote_version = remote;

    // The client only decides "strictly newer"; the server is authoritative
    if (local_version && !(remote > *local_version)) {
        check.status = UpdateCheck::Status::UpToDate;
        return check;
    }

    auto asset = j.find("asset");
    if (asset == j.end() || !asset->is_object()) {
        return failed("invalid response: \"asset\" missing for " + remote.str());
    }

    UpdateDescriptor desc;
    desc.version = remote;
    desc.download_url = string_field(*asset, "url");
    desc.sha256 = string_field(*asset, "sha256");
    auto size = asset->find("size");
    if (size != asset->end() && size->is_number_integer() && size->get<int64_t>() > 0) {
        desc.size = size->get<int64_t>();
    }

    if (desc.download_url.empty()) {
        return failed("invalid response: \"asset.url\"");
    }
    if (desc.sha256.empty()) {
        return failed("invalid response: \"asset.sha256\"");
    }

    check.status = UpdateCheck::Status::UpdateAvailable;
    check.descriptor = desc;
    return check;
}

// ── Notices ─────────────────────────────────────────────────

NoticeFetch UpdateClient::fetch_latest_notice(const std::string& program_id) const {
    NoticeFetch result;

    auto res = impl_->get(impl_->program_path(program_id, "/notices/latest"));
    if (!res.ok) {
        result.reason = res.error;
        return result;
    }
    if (res.status == 204) {
        result.success = true;
        return result;
    }
    if (res.status != 200) {
        result.reason = "bad status: " + std::to_string(res.status);
        return result;
    }

    try {
        json j = json::parse(res.body);
        // The server may or may not wrap the notice in {"notice": ...}
        const json& n = (j.is_object() && j.contains("notice")) ? j["notice"] : j;
        if (!n.is_object()) {
            result.reason = "invalid response: notice is not an object";
            return result;
        }

        Notice notice;
        notice.id = string_field(n, "id");
        if (notice.id.empty()) {
            result.reason = "invalid response: \"id\"";
            return result;
        }
        std::string level = string_field(n, "level");
        if (!level.empty()) {
            std::transform(level.begin(), level.end(), level.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            notice.level = level;
        }
        auto force = n.find("force");
        notice.force = force != n.end() && force->is_boolean() && force->get<bool>();
        notice.title = string_field(n, "title");
        notice.content = string_field(n, "content");

        result.success = true;
        result.has_notice = true;
        result.notice = notice;
    } catch (const json::exception& e) {
        result.reason = std::string("json parse failed: ") + e.what();
    }
    return result;
}
