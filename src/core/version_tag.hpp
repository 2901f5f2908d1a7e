#pragma once

#include <string>
#include <tuple>

/// Release identifier (major, minor, patch), ordered component-wise.
struct VersionTag {
    int major = 0;
    int minor = 0;
    int patch = 0;

    /// Parse "X.Y.Z", with an optional leading 'v' or 'V' and surrounding
    /// whitespace. Returns false (leaving out untouched) on anything else.
    static bool parse(const std::string& text, VersionTag& out);

    /// Parse a directory name of the form "v{major}_{minor}_{patch}"
    static bool from_dir_name(const std::string& name, VersionTag& out);

    /// "X.Y.Z"
    std::string str() const;

    /// "vX_Y_Z"
    std::string dir_name() const;

    bool operator<(const VersionTag& o) const {
        return std::tie(major, minor, patch) < std::tie(o.major, o.minor, o.patch);
    }
    bool operator==(const VersionTag& o) const {
        return major == o.major && minor == o.minor && patch == o.patch;
    }
    bool operator!=(const VersionTag& o) const { return !(*this == o); }
    bool operator>(const VersionTag& o) const { return o < *this; }
    bool operator<=(const VersionTag& o) const { return !(o < *this); }
    bool operator>=(const VersionTag& o) const { return !(*this < o); }
};
