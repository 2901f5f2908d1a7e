#pragma once

#include <cstdint>
#include <map>
#include <string>

/// Remembers which notices the user hid, as {notice_id: hide_until_epoch}
/// in a small JSON file.
class NoticeStore {
public:
    explicit NoticeStore(const std::string& path);

    /// True while notice_id is hidden (hide_until is in the future)
    bool is_hidden(const std::string& notice_id, int64_t now_epoch = now()) const;

    /// Hide notice_id for `seconds` (default one day). Returns false if the
    /// ack file could not be written.
    bool hide(const std::string& notice_id, int64_t seconds = 24 * 60 * 60, int64_t now_epoch = now());

    /// Unreadable or malformed files yield an empty map
    std::map<std::string, int64_t> load() const;

    static int64_t now();

private:
    std::string path_;

    bool save(const std::map<std::string, int64_t>& acks) const;
};
