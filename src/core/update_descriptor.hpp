#pragma once

#include "core/version_tag.hpp"

#include <cstdint>
#include <string>

/// What the remote authority says about the newest release.
/// Transient: dropped once an install attempt completes or is abandoned.
struct UpdateDescriptor {
    VersionTag version;
    std::string download_url;
    std::string sha256;       // hex, case-insensitive
    int64_t size = 0;         // bytes, 0 = not declared
};
