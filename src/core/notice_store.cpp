#include "core/notice_store.hpp"
#include "core/logger.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

NoticeStore::NoticeStore(const std::string& path) : path_(path) {}

int64_t NoticeStore::now() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

std::map<std::string, int64_t> NoticeStore::load() const {
    std::map<std::string, int64_t> acks;

    std::ifstream in(path_);
    if (!in.is_open()) return acks;

    try {
        json j = json::parse(in);
        if (!j.is_object()) return acks;
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (!it.key().empty() && it.value().is_number_integer()) {
                acks[it.key()] = it.value().get<int64_t>();
            }
        }
    } catch (const json::exception& e) {
        Logger::get()->warn("Ignoring unreadable notice ack file {}: {}", path_, e.what());
        acks.clear();
    }
    return acks;
}

bool NoticeStore::save(const std::map<std::string, int64_t>& acks) const {
    json j = json::object();
    for (const auto& kv : acks) {
        j[kv.first] = kv.second;
    }

    fs::path target(path_);
    fs::path tmp = target;
    tmp += ".tmp";

    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) return false;
    }

    // Ids come from the command line; one that is not valid UTF-8 cannot
    // be serialized
    std::string text;
    try {
        text = j.dump(2);
    } catch (const json::exception& e) {
        Logger::get()->warn("Cannot save notice acks to {}: {}", path_, e.what());
        return false;
    }

    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) return false;
        out << text << "\n";
        if (!out.good()) {
            out.close();
            fs::remove(tmp, ec);
            return false;
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return false;
    }
    return true;
}

bool NoticeStore::is_hidden(const std::string& notice_id, int64_t now_epoch) const {
    if (notice_id.empty()) return false;
    auto acks = load();
    auto it = acks.find(notice_id);
    return it != acks.end() && it->second > now_epoch;
}

bool NoticeStore::hide(const std::string& notice_id, int64_t seconds, int64_t now_epoch) {
    if (notice_id.empty()) return false;
    auto acks = load();

    // Drop expired entries while we are rewriting anyway
    for (auto it = acks.begin(); it != acks.end();) {
        if (it->second <= now_epoch) {
            it = acks.erase(it);
        } else {
            ++it;
        }
    }

    acks[notice_id] = now_epoch + seconds;
    return save(acks);
}
