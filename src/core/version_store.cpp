#include "core/version_store.hpp"
#include "core/logger.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

VersionStore::VersionStore(const std::string& record_path, const std::string& versions_dir)
    : record_path_(record_path), versions_dir_(versions_dir) {}

// ════════════════════════════════════════════════════════════════
// Current-version record
// ════════════════════════════════════════════════════════════════

CurrentRecord VersionStore::read_current(const std::string& program_id) const {
    CurrentRecord rec;

    std::error_code ec;
    if (!fs::exists(record_path_, ec)) {
        rec.status = CurrentRecord::Status::NotInstalled;
        return rec;
    }

    auto corrupt = [&](const std::string& why) {
        rec.status = CurrentRecord::Status::Corrupt;
        rec.error = why;
        return rec;
    };

    std::ifstream in(record_path_);
    if (!in.is_open()) {
        return corrupt("cannot open " + record_path_);
    }

    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        return corrupt(std::string("json parse failed: ") + e.what());
    }

    if (!j.is_object()) {
        return corrupt("record is not an object");
    }

    auto pid = j.find("program_id");
    auto ver = j.find("version");
    if (pid == j.end() || !pid->is_string() || pid->get<std::string>().empty()) {
        return corrupt("\"program_id\" is required (string)");
    }
    if (ver == j.end() || !ver->is_string()) {
        return corrupt("\"version\" is required (string)");
    }

    VersionTag tag;
    if (!VersionTag::parse(ver->get<std::string>(), tag)) {
        return corrupt("invalid version: " + ver->get<std::string>());
    }

    rec.program_id = pid->get<std::string>();
    if (!program_id.empty() && rec.program_id != program_id) {
        return corrupt("record belongs to program '" + rec.program_id + "'");
    }

    rec.version = tag;
    rec.status = CurrentRecord::Status::Ok;
    return rec;
}

StepResult VersionStore::write_current(const std::string& program_id,
                                       const VersionTag& version) const {
    json j = {
        {"program_id", program_id},
        {"version", version.str()},
    };

    fs::path target(record_path_);
    fs::path tmp = target;
    tmp += ".tmp";

    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return StepResult::fail(ErrorKind::PromotionFailed,
                                    "cannot create " + target.parent_path().string() + ": " + ec.message());
        }
    }

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return StepResult::fail(ErrorKind::PromotionFailed, "cannot open " + tmp.string());
        }
        try {
            out << j.dump(2) << "\n";
        } catch (const json::exception& e) {
            out.close();
            fs::remove(tmp, ec);
            return StepResult::fail(ErrorKind::PromotionFailed, std::string("serialize failed: ") + e.what());
        }
        out.flush();
        if (!out.good()) {
            out.close();
            fs::remove(tmp, ec);
            return StepResult::fail(ErrorKind::PromotionFailed, "write failed: " + tmp.string());
        }
    }

    // rename(2) replaces the target atomically on the same filesystem
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return StepResult::fail(ErrorKind::PromotionFailed,
                                "rename " + tmp.string() + " failed: " + ec.message());
    }

    Logger::get()->debug("Record {} -> {} {}", record_path_, program_id, version.str());
    return StepResult::ok();
}

// ════════════════════════════════════════════════════════════════
// versions/ layout
// ════════════════════════════════════════════════════════════════

std::string VersionStore::version_dir(const VersionTag& version) const {
    return (fs::path(versions_dir_) / version.dir_name()).string();
}

std::string VersionStore::staging_dir(const VersionTag& version) const {
    return (fs::path(versions_dir_) / (version.dir_name() + kStagingSuffix)).string();
}

std::string VersionStore::retired_dir(const VersionTag& version) const {
    return (fs::path(versions_dir_) / (version.dir_name() + kRetiredSuffix)).string();
}

bool VersionStore::is_finalized(const VersionTag& version) const {
    std::error_code ec;
    return fs::is_directory(version_dir(version), ec);
}

std::vector<VersionTag> VersionStore::scan(const std::string& suffix) const {
    std::vector<VersionTag> tags;

    std::error_code ec;
    if (!fs::is_directory(versions_dir_, ec)) {
        return tags;
    }

    for (fs::directory_iterator it(versions_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_directory(type_ec)) continue;

        // Finalized names carry no suffix; "v1_0_0.tmp" never parses as one
        std::string name = it->path().filename().string();
        if (!suffix.empty()) {
            if (name.size() <= suffix.size() ||
                name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
                continue;
            }
            name.erase(name.size() - suffix.size());
        }

        VersionTag tag;
        if (VersionTag::from_dir_name(name, tag)) {
            tags.push_back(tag);
        }
    }
    if (ec) {
        Logger::get()->warn("Listing {} failed: {}", versions_dir_, ec.message());
    }

    std::sort(tags.begin(), tags.end());
    return tags;
}

std::vector<VersionTag> VersionStore::list_version_directories() const {
    return scan("");
}

std::vector<VersionTag> VersionStore::list_staging_directories() const {
    return scan(kStagingSuffix);
}

std::vector<VersionTag> VersionStore::list_retired_directories() const {
    return scan(kRetiredSuffix);
}

StepResult VersionStore::remove_version(const VersionTag& version) const {
    std::string dir = version_dir(version);
    std::string retired = retired_dir(version);

    std::error_code ec;
    // An earlier interrupted removal would block the rename
    fs::remove_all(retired, ec);
    if (ec) {
        return StepResult::fail(ErrorKind::InstallFailed,
                                "cannot remove " + retired + ": " + ec.message());
    }

    fs::rename(dir, retired, ec);
    if (ec) {
        return StepResult::fail(ErrorKind::InstallFailed,
                                "rename " + dir + " -> " + retired + " failed: " + ec.message());
    }

    fs::remove_all(retired, ec);
    if (ec) {
        Logger::get()->warn("Could not delete {}: {}, left for recovery", retired, ec.message());
    }
    return StepResult::ok();
}
