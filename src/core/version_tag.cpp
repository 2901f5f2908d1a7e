#include "core/version_tag.hpp"

#include <cctype>
#include <vector>

// Parse a run of decimal digits. Rejects empty input, signs and anything
// that would overflow an int.
static bool parse_component(const std::string& s, int& out) {
    if (s.empty() || s.size() > 9) return false;
    int value = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

static std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        auto pos = s.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

static bool parse_triplet(const std::string& body, char sep, VersionTag& out) {
    auto parts = split(body, sep);
    if (parts.size() != 3) return false;

    VersionTag tag;
    if (!parse_component(parts[0], tag.major) ||
        !parse_component(parts[1], tag.minor) ||
        !parse_component(parts[2], tag.patch)) {
        return false;
    }
    out = tag;
    return true;
}

bool VersionTag::parse(const std::string& text, VersionTag& out) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return false;
    auto last = text.find_last_not_of(" \t\r\n");
    std::string s = text.substr(first, last - first + 1);

    if (s[0] == 'v' || s[0] == 'V') {
        s = s.substr(1);
    }
    return parse_triplet(s, '.', out);
}

bool VersionTag::from_dir_name(const std::string& name, VersionTag& out) {
    if (name.size() < 2 || name[0] != 'v') return false;
    return parse_triplet(name.substr(1), '_', out);
}

std::string VersionTag::str() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

std::string VersionTag::dir_name() const {
    return "v" + std::to_string(major) + "_" + std::to_string(minor) + "_" + std::to_string(patch);
}
