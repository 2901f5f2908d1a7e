#pragma once

#include "core/errors.hpp"
#include "core/update_descriptor.hpp"
#include "core/version_store.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

/// on_progress receives (bytes_received, total_bytes); total_bytes may be 0 if unknown
using ProgressCallback = std::function<void(int64_t received, int64_t total)>;

struct InstallOptions {
    std::string executable = "app";  // must exist in the expanded tree
    int connect_timeout_sec = 15;
    int read_timeout_sec = 120;
};

enum class PackageKind {
    Zip,
    TarGz,
    Executable  // the artifact itself is the program
};

/// Turns an UpdateDescriptor into a finalized version directory:
/// stage -> download -> verify -> expand -> finalize.
///
/// Every failing step before finalize removes the staging directory, so the
/// versions/ tree is left exactly as it was before the attempt. The staging
/// directory carries a ".tmp" suffix and is never trusted; the rename in
/// finalize() is the single commit point.
class Installer {
public:
    Installer(const VersionStore& store, InstallOptions options);

    // ── Individual steps ───────────────────────────────────────

    /// Create versions/v{tag}.tmp, clearing a stale one first
    StepResult stage(const VersionTag& version);

    /// Stream the artifact into the staging directory.
    /// Setting *cancel_flag aborts the transfer and removes the staging dir.
    StepResult download(const UpdateDescriptor& desc,
                        ProgressCallback on_progress = nullptr,
                        std::atomic<bool>* cancel_flag = nullptr);

    /// Check SHA-256 and byte count against the descriptor
    StepResult verify(const UpdateDescriptor& desc);

    /// Unpack the verified package into the staging directory layout
    StepResult expand(const UpdateDescriptor& desc);

    /// Rename staging -> finalized. A colliding stale target is removed
    /// and the rename retried once.
    StepResult finalize(const VersionTag& version);

    /// All five steps in order
    StepResult install(const UpdateDescriptor& desc,
                       ProgressCallback on_progress = nullptr,
                       std::atomic<bool>* cancel_flag = nullptr);

    /// Remove the staging directory of version (no-op when absent)
    void discard_staging(const VersionTag& version);

    /// Remove staging and retired leftovers from crashed attempts. Call
    /// only while holding the install lock. Returns the versions that were
    /// cleaned.
    std::vector<VersionTag> recover();

    /// Path of the downloaded package inside the staging directory
    std::string package_path(const VersionTag& version) const;

    // ── Helpers ────────────────────────────────────────────────

    /// SHA-256 of a file as lowercase hex, empty on failure (OpenSSL EVP)
    static std::string sha256_file(const std::string& file_path);

    /// Decide how to expand a package from its URL
    static PackageKind package_kind(const std::string& url);

    /// Find a regular file named exe_name under root (recursive), empty if none
    static std::string find_executable(const std::string& root, const std::string& exe_name);

    /// Download a single file with progress reporting and cancellation.
    /// On failure the partial file is removed and *error (if given) says why.
    static bool download_single(const std::string& url,
                                const std::string& dest_path,
                                ProgressCallback on_progress,
                                std::atomic<bool>* cancel_flag,
                                int connect_timeout_sec,
                                int read_timeout_sec,
                                std::string* error = nullptr);

    /// Helper: parse a URL into scheme, host, port, path
    struct UrlParts {
        std::string scheme;
        std::string host;
        int port = 443;
        std::string path;
    };
    static UrlParts parse_url(const std::string& url);

private:
    const VersionStore& store_;
    InstallOptions options_;

    StepResult fail_and_discard(const VersionTag& version, ErrorKind kind, const std::string& msg);

    /// Helper: run a shell command and return exit code
    static int run_command(const std::string& cmd);
};
