#pragma once

#include "core/errors.hpp"
#include "core/version_tag.hpp"

#include <string>
#include <vector>

struct CurrentRecord {
    enum class Status {
        Ok,
        NotInstalled,
        Corrupt
    };
    Status status = Status::NotInstalled;
    std::string program_id;
    VersionTag version;
    std::string error;  // parse failure detail when Corrupt
};

/// Owns the persisted current-version record and the versions/ tree layout.
/// The record is the only place the active version lives; it is rewritten
/// only by atomic replace.
class VersionStore {
public:
    VersionStore(const std::string& record_path, const std::string& versions_dir);

    /// Read the record for program_id. A record naming another program is
    /// reported as Corrupt.
    CurrentRecord read_current(const std::string& program_id) const;

    /// Write the record via temp file + rename
    StepResult write_current(const std::string& program_id, const VersionTag& version) const;

    /// Finalized version directories, ascending
    std::vector<VersionTag> list_version_directories() const;

    /// Leftover staging directories (".tmp" suffix), ascending
    std::vector<VersionTag> list_staging_directories() const;

    /// Directories whose removal was interrupted (".old" suffix), ascending
    std::vector<VersionTag> list_retired_directories() const;

    std::string version_dir(const VersionTag& version) const;
    std::string staging_dir(const VersionTag& version) const;
    std::string retired_dir(const VersionTag& version) const;

    /// Delete a finalized directory. It is renamed to its retired name
    /// first, so a crash mid-delete never leaves a partial tree under a
    /// finalized name. A retired leftover that cannot be deleted is logged
    /// and left for Installer::recover().
    StepResult remove_version(const VersionTag& version) const;

    /// True if the finalized directory for version exists
    bool is_finalized(const VersionTag& version) const;

    const std::string& record_path() const { return record_path_; }
    const std::string& versions_dir() const { return versions_dir_; }

    static constexpr const char* kStagingSuffix = ".tmp";
    static constexpr const char* kRetiredSuffix = ".old";

private:
    std::string record_path_;
    std::string versions_dir_;

    std::vector<VersionTag> scan(const std::string& suffix) const;
};
