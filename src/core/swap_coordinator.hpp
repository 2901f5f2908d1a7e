#pragma once

#include "core/errors.hpp"
#include "core/version_store.hpp"

#include <string>
#include <vector>

/// Makes a finalized version the active one and keeps the number of
/// installed versions bounded.
class SwapCoordinator {
public:
    SwapCoordinator(VersionStore& store, std::string program_id);

    /// Point the current-version record at version. Requires the version
    /// directory to be finalized; the record is left untouched otherwise.
    /// Safe to retry after a failure: nothing needs to be re-downloaded.
    StepResult promote(const VersionTag& version);

    /// Delete the oldest finalized versions until at most retain_count
    /// remain, never touching the active one. Deletion failures are logged
    /// and skipped. Returns the versions that were removed.
    std::vector<VersionTag> prune_old_versions(int retain_count = 2);

private:
    VersionStore& store_;
    std::string program_id_;
};
