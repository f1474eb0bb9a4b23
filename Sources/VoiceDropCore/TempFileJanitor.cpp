#include "TempFileJanitor.hpp"

#include "Log.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace vd {

namespace fs = std::filesystem;

bool TempFileJanitor::is_media_file(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".wav" || ext == ".m4a" || ext == ".ogg" || ext == ".oga";
}

size_t TempFileJanitor::sweep(const std::string& dir, std::chrono::seconds max_age) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return 0;

    const auto now = fs::file_time_type::clock::now();
    size_t removed = 0;

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || !is_media_file(entry.path().string())) {
            continue;
        }

        auto written = entry.last_write_time(entry_ec);
        if (entry_ec) continue;
        if (now - written < max_age) continue;

        if (fs::remove(entry.path(), entry_ec)) {
            ++removed;
        } else if (entry_ec) {
            Logger::warn("janitor: cannot remove " + entry.path().string()
                         + ": " + entry_ec.message());
        }
    }
    if (ec) {
        Logger::warn("janitor: cannot list " + dir + ": " + ec.message());
    }

    if (removed > 0) {
        Logger::info("janitor: removed " + std::to_string(removed) + " stale media file(s)");
    }
    return removed;
}

} // namespace vd
