#include "core/installer.hpp"
#include "core/logger.hpp"

#include <httplib.h>
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

// ════════════════════════════════════════════════════════════════
// Private helpers
// ════════════════════════════════════════════════════════════════

/// Shell-escape a string by wrapping in single quotes and escaping embedded quotes
static std::string shell_quote(const std::string& s) {
    std::string result = "'";
    for (char c : s) {
        if (c == '\'') {
            result += "'\\''";
        } else {
            result += c;
        }
    }
    result += "'";
    return result;
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

Installer::UrlParts Installer::parse_url(const std::string& url) {
    UrlParts parts;
    auto pos = url.find("://");
    if (pos != std::string::npos) {
        parts.scheme = to_lower(url.substr(0, pos));
        auto rest = url.substr(pos + 3);
        auto path_pos = rest.find('/');
        if (path_pos != std::string::npos) {
            parts.host = rest.substr(0, path_pos);
            parts.path = rest.substr(path_pos);
        } else {
            parts.host = rest;
            parts.path = "/";
        }
    }
    auto colon = parts.host.find(':');
    if (colon != std::string::npos) {
        std::string port = parts.host.substr(colon + 1);
        parts.host = parts.host.substr(0, colon);
        if (!port.empty() && port.size() <= 5 &&
            std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); })) {
            parts.port = std::stoi(port);
        } else {
            parts.host.clear();  // unusable
        }
    } else {
        parts.port = (parts.scheme == "https") ? 443 : 80;
    }
    return parts;
}

int Installer::run_command(const std::string& cmd) {
    return system(cmd.c_str());
}

// ════════════════════════════════════════════════════════════════
// Digest + download
// ════════════════════════════════════════════════════════════════

std::string Installer::sha256_file(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) return "";

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) return "";

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return "";
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
            return "";
        }
        if (file.gcount() < static_cast<std::streamsize>(sizeof(buffer))) break;
    }
    if (file.bad()) return "";

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        return "";
    }

    // Convert to hex string
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < hash_len; ++i) {
        oss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

bool Installer::download_single(const std::string& url,
                                const std::string& dest_path,
                                ProgressCallback on_progress,
                                std::atomic<bool>* cancel_flag,
                                int connect_timeout_sec,
                                int read_timeout_sec,
                                std::string* error) {
    auto set_error = [&](const std::string& msg) {
        if (error) *error = msg;
    };

    auto parts = parse_url(url);
    if (parts.host.empty() || (parts.scheme != "http" && parts.scheme != "https")) {
        set_error("unsupported url: " + url);
        return false;
    }

    std::error_code ec;
    auto parent = fs::path(dest_path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            set_error("cannot create " + parent.string() + ": " + ec.message());
            return false;
        }
    }

    std::ofstream out(dest_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        set_error("cannot open " + dest_path);
        return false;
    }

    int64_t total_bytes = 0;
    int64_t received_bytes = 0;
    int status = 0;
    bool write_failed = false;

    httplib::Headers headers = {
        {"User-Agent", "launchpad"},
        {"Accept", "*/*"},
    };

    auto response_handler = [&](const httplib::Response& response) -> bool {
        if (cancel_flag && cancel_flag->load()) return false;

        status = response.status;
        if (response.has_header("Content-Length")) {
            try {
                total_bytes = std::stoll(response.get_header_value("Content-Length"));
            } catch (const std::exception&) {
                total_bytes = 0;
            }
        }
        return response.status == 200;
    };

    auto content_receiver = [&](const char* data, size_t data_length) -> bool {
        if (cancel_flag && cancel_flag->load()) return false;

        out.write(data, static_cast<std::streamsize>(data_length));
        if (!out.good()) {
            write_failed = true;
            return false;
        }
        received_bytes += static_cast<int64_t>(data_length);

        if (on_progress) {
            on_progress(received_bytes, total_bytes);
        }
        return true;
    };

    bool got_200 = false;
    httplib::Error transport_error = httplib::Error::Success;
    if (parts.scheme == "https") {
        httplib::SSLClient cli(parts.host, parts.port);
        cli.set_connection_timeout(connect_timeout_sec, 0);
        cli.set_read_timeout(read_timeout_sec, 0);
        cli.set_follow_location(true);
        auto res = cli.Get(parts.path, headers, response_handler, content_receiver);
        got_200 = res && res->status == 200;
        transport_error = res.error();
    } else {
        httplib::Client cli(parts.host, parts.port);
        cli.set_connection_timeout(connect_timeout_sec, 0);
        cli.set_read_timeout(read_timeout_sec, 0);
        cli.set_follow_location(true);
        auto res = cli.Get(parts.path, headers, response_handler, content_receiver);
        got_200 = res && res->status == 200;
        transport_error = res.error();
    }

    out.close();
    bool success = got_200 && !write_failed && out.good();

    if (!success) {
        if (cancel_flag && cancel_flag->load()) {
            set_error("cancelled");
        } else if (write_failed) {
            set_error("write failed: " + dest_path);
        } else if (status != 0 && status != 200) {
            set_error("bad status: " + std::to_string(status));
        } else {
            set_error("request failed: " + httplib::to_string(transport_error));
        }
        // Clean up partial download
        fs::remove(dest_path, ec);
    }

    return success;
}

// ════════════════════════════════════════════════════════════════
// Install steps
// ════════════════════════════════════════════════════════════════

Installer::Installer(const VersionStore& store, InstallOptions options)
    : store_(store), options_(std::move(options)) {}

std::string Installer::package_path(const VersionTag& version) const {
    return (fs::path(store_.staging_dir(version)) / ".package").string();
}

void Installer::discard_staging(const VersionTag& version) {
    std::error_code ec;
    std::string dir = store_.staging_dir(version);
    fs::remove_all(dir, ec);
    if (ec) {
        Logger::get()->warn("Could not remove staging dir {}: {}", dir, ec.message());
    }
}

StepResult Installer::fail_and_discard(const VersionTag& version, ErrorKind kind, const std::string& msg) {
    discard_staging(version);
    return StepResult::fail(kind, msg);
}

StepResult Installer::stage(const VersionTag& version) {
    std::string dir = store_.staging_dir(version);
    std::error_code ec;

    fs::create_directories(store_.versions_dir(), ec);
    if (ec) {
        return StepResult::fail(ErrorKind::InstallFailed,
                                "cannot create " + store_.versions_dir() + ": " + ec.message());
    }

    if (fs::exists(dir, ec)) {
        Logger::get()->info("Removing stale staging dir {}", dir);
        fs::remove_all(dir, ec);
        if (ec) {
            return StepResult::fail(ErrorKind::InstallFailed,
                                    "cannot remove stale " + dir + ": " + ec.message());
        }
    }

    fs::create_directory(dir, ec);
    if (ec) {
        return fail_and_discard(version, ErrorKind::InstallFailed,
                                "cannot create " + dir + ": " + ec.message());
    }
    return StepResult::ok();
}

StepResult Installer::download(const UpdateDescriptor& desc,
                               ProgressCallback on_progress,
                               std::atomic<bool>* cancel_flag) {
    if (cancel_flag && cancel_flag->load()) {
        return fail_and_discard(desc.version, ErrorKind::Cancelled, "cancelled before download");
    }

    std::string dest = package_path(desc.version);
    std::string error;
    Logger::get()->info("Downloading {} -> {}", desc.download_url, dest);

    if (!download_single(desc.download_url, dest, on_progress, cancel_flag,
                         options_.connect_timeout_sec, options_.read_timeout_sec, &error)) {
        if (cancel_flag && cancel_flag->load()) {
            return fail_and_discard(desc.version, ErrorKind::Cancelled, "download cancelled");
        }
        return fail_and_discard(desc.version, ErrorKind::InstallFailed, "download failed: " + error);
    }
    return StepResult::ok();
}

StepResult Installer::verify(const UpdateDescriptor& desc) {
    std::string pkg = package_path(desc.version);

    std::error_code ec;
    auto size = fs::file_size(pkg, ec);
    if (ec) {
        return fail_and_discard(desc.version, ErrorKind::VerificationFailed,
                                "cannot stat " + pkg + ": " + ec.message());
    }
    if (desc.size > 0 && static_cast<int64_t>(size) != desc.size) {
        return fail_and_discard(desc.version, ErrorKind::VerificationFailed,
                                "size mismatch: expected " + std::to_string(desc.size) +
                                " bytes, got " + std::to_string(size));
    }

    std::string computed = sha256_file(pkg);
    if (computed.empty()) {
        return fail_and_discard(desc.version, ErrorKind::VerificationFailed,
                                "cannot hash " + pkg);
    }
    if (desc.sha256.empty() || computed != to_lower(desc.sha256)) {
        return fail_and_discard(desc.version, ErrorKind::VerificationFailed,
                                "sha256 mismatch: expected " + desc.sha256 + ", got " + computed);
    }
    return StepResult::ok();
}

PackageKind Installer::package_kind(const std::string& url) {
    std::string path = url;
    auto cut = path.find_first_of("?#");
    if (cut != std::string::npos) {
        path = path.substr(0, cut);
    }
    path = to_lower(path);

    if (ends_with(path, ".zip")) return PackageKind::Zip;
    if (ends_with(path, ".tar.gz") || ends_with(path, ".tgz")) return PackageKind::TarGz;
    return PackageKind::Executable;
}

std::string Installer::find_executable(const std::string& root, const std::string& exe_name) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return "";

    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && it->path().filename() == exe_name) {
            return it->path().string();
        }
    }
    return "";
}

StepResult Installer::expand(const UpdateDescriptor& desc) {
    std::string staging = store_.staging_dir(desc.version);
    std::string pkg = package_path(desc.version);
    std::error_code ec;

    switch (package_kind(desc.download_url)) {
        case PackageKind::Zip: {
            std::string cmd = "unzip -q -o " + shell_quote(pkg) + " -d " + shell_quote(staging) +
                              " >/dev/null 2>&1";
            if (run_command(cmd) != 0) {
                return fail_and_discard(desc.version, ErrorKind::InstallFailed, "unzip failed: " + pkg);
            }
            fs::remove(pkg, ec);
            break;
        }
        case PackageKind::TarGz: {
            std::string cmd = "tar xzf " + shell_quote(pkg) + " -C " + shell_quote(staging) +
                              " >/dev/null 2>&1";
            if (run_command(cmd) != 0) {
                return fail_and_discard(desc.version, ErrorKind::InstallFailed, "tar extract failed: " + pkg);
            }
            fs::remove(pkg, ec);
            break;
        }
        case PackageKind::Executable: {
            fs::path exe = fs::path(staging) / options_.executable;
            fs::rename(pkg, exe, ec);
            if (ec) {
                return fail_and_discard(desc.version, ErrorKind::InstallFailed,
                                        "cannot place executable: " + ec.message());
            }
            break;
        }
    }

    if (ec) {
        return fail_and_discard(desc.version, ErrorKind::InstallFailed,
                                "cannot remove package " + pkg + ": " + ec.message());
    }

    std::string exe = find_executable(staging, options_.executable);
    if (exe.empty()) {
        return fail_and_discard(desc.version, ErrorKind::InstallFailed,
                                "executable '" + options_.executable + "' not found in package");
    }

    fs::permissions(exe,
                    fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add, ec);
    if (ec) {
        return fail_and_discard(desc.version, ErrorKind::InstallFailed,
                                "chmod +x " + exe + ": " + ec.message());
    }
    return StepResult::ok();
}

StepResult Installer::finalize(const VersionTag& version) {
    std::string staging = store_.staging_dir(version);
    std::string target = store_.version_dir(version);

    std::error_code ec;
    fs::rename(staging, target, ec);
    if (!ec) {
        return StepResult::ok();
    }

    Logger::get()->warn("Finalize rename {} -> {} failed ({}), retrying after removing stale target",
                        staging, target, ec.message());

    if (store_.is_finalized(version)) {
        StepResult removed = store_.remove_version(version);
        if (!removed.success) {
            return fail_and_discard(version, ErrorKind::InstallFailed, removed.message);
        }
    }
    ec.clear();
    fs::rename(staging, target, ec);
    if (ec) {
        return fail_and_discard(version, ErrorKind::InstallFailed,
                                "rename " + staging + " -> " + target + " failed: " + ec.message());
    }
    return StepResult::ok();
}

StepResult Installer::install(const UpdateDescriptor& desc,
                              ProgressCallback on_progress,
                              std::atomic<bool>* cancel_flag) {
    StepResult r = stage(desc.version);
    if (!r.success) return r;
    r = download(desc, on_progress, cancel_flag);
    if (!r.success) return r;
    r = verify(desc);
    if (!r.success) return r;
    r = expand(desc);
    if (!r.success) return r;
    return finalize(desc.version);
}

std::vector<VersionTag> Installer::recover() {
    std::vector<VersionTag> cleaned;
    for (const auto& tag : store_.list_staging_directories()) {
        std::error_code ec;
        std::string dir = store_.staging_dir(tag);
        fs::remove_all(dir, ec);
        if (ec) {
            Logger::get()->warn("Could not remove leftover staging dir {}: {}", dir, ec.message());
            continue;
        }
        Logger::get()->info("Removed leftover staging dir {}", dir);
        cleaned.push_back(tag);
    }
    for (const auto& tag : store_.list_retired_directories()) {
        std::error_code ec;
        std::string dir = store_.retired_dir(tag);
        fs::remove_all(dir, ec);
        if (ec) {
            Logger::get()->warn("Could not remove retired dir {}: {}", dir, ec.message());
            continue;
        }
        Logger::get()->info("Removed retired dir {}", dir);
        cleaned.push_back(tag);
    }
    return cleaned;
}
