#pragma once

#include <cstdint>
#include <string>

namespace vd {

/// Generate a UUID v4 string.
std::string generate_uuid();

/// Current Unix timestamp in seconds.
int64_t now_unix();

} // namespace vd
