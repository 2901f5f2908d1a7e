#include "core/swap_coordinator.hpp"
#include "core/logger.hpp"

SwapCoordinator::SwapCoordinator(VersionStore& store, std::string program_id)
    : store_(store), program_id_(std::move(program_id)) {}

StepResult SwapCoordinator::promote(const VersionTag& version) {
    if (!store_.is_finalized(version)) {
        return StepResult::fail(ErrorKind::PromotionFailed,
                                "version " + version.str() + " is not finalized");
    }

    StepResult r = store_.write_current(program_id_, version);
    if (!r.success) {
        Logger::get()->error("Promotion of {} failed: {}", version.str(), r.message);
        return r;
    }

    Logger::get()->info("Promoted {} {} to active", program_id_, version.str());
    return StepResult::ok();
}

std::vector<VersionTag> SwapCoordinator::prune_old_versions(int retain_count) {
    std::vector<VersionTag> removed;
    if (retain_count < 1) retain_count = 1;

    CurrentRecord current = store_.read_current(program_id_);
    if (current.status != CurrentRecord::Status::Ok) {
        // Without a known active version nothing can be pruned safely
        Logger::get()->warn("Skipping retention pass: no valid current-version record");
        return removed;
    }

    auto versions = store_.list_version_directories();
    size_t remaining = versions.size();

    // Ascending order, so the oldest candidates come first
    for (const auto& tag : versions) {
        if (remaining <= static_cast<size_t>(retain_count)) break;
        if (tag == current.version) continue;

        StepResult r = store_.remove_version(tag);
        if (!r.success) {
            Logger::get()->warn("Could not remove old version {}: {}", tag.str(), r.message);
            continue;
        }

        Logger::get()->info("Removed old version {}", tag.str());
        removed.push_back(tag);
        --remaining;
    }

    return removed;
}
