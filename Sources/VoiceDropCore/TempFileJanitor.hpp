#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace vd {

/// Removes leftover media files (.wav, .m4a, .ogg, .oga) from a directory.
class TempFileJanitor {
public:
    /// Remove matching files whose last write is older than `max_age`.
    /// A zero age removes every matching file.  Returns the number removed.
    static size_t sweep(const std::string& dir, std::chrono::seconds max_age);

    /// Whether `path` has one of the swept extensions.
    static bool is_media_file(const std::string& path);
};

} // namespace vd
