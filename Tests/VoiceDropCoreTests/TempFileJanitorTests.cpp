#include <catch2/catch.hpp>

#include "Fakes.hpp"
#include "TempFileJanitor.hpp"

#include <filesystem>

using namespace vd;
using namespace vd::test;

namespace fs = std::filesystem;

namespace {

void age(const std::string& path, std::chrono::seconds by) {
    fs::last_write_time(path, fs::file_time_type::clock::now() - by);
}

} // namespace

TEST_CASE("TempFileJanitor", "[janitor]") {
    TempDir dir;

    SECTION("RemovesOnlyOldMediaFiles") {
        for (const char* name : {"a.wav", "b.m4a", "c.ogg", "d.oga", "e.txt", "F.WAV"}) {
            write_file(dir.file(name), "x");
            age(dir.file(name), std::chrono::hours(2));
        }
        write_file(dir.file("fresh.ogg"), "x");

        REQUIRE(TempFileJanitor::sweep(dir.str(), std::chrono::seconds(3600)) == 5);

        REQUIRE_FALSE(exists(dir.file("a.wav")));
        REQUIRE_FALSE(exists(dir.file("b.m4a")));
        REQUIRE_FALSE(exists(dir.file("c.ogg")));
        REQUIRE_FALSE(exists(dir.file("d.oga")));
        REQUIRE_FALSE(exists(dir.file("F.WAV")));
        REQUIRE(exists(dir.file("e.txt")));
        REQUIRE(exists(dir.file("fresh.ogg")));
    }

    SECTION("ZeroAgeRemovesEveryMediaFile") {
        write_file(dir.file("take.wav"), "x");
        age(dir.file("take.wav"), std::chrono::seconds(1));
        write_file(dir.file("notes.txt"), "x");

        REQUIRE(TempFileJanitor::sweep(dir.str(), std::chrono::seconds(0)) == 1);
        REQUIRE(exists(dir.file("notes.txt")));
    }

    SECTION("SubdirectoriesAreLeftAlone") {
        fs::create_directories(dir.file("nested.ogg"));
        REQUIRE(TempFileJanitor::sweep(dir.str(), std::chrono::seconds(0)) == 0);
        REQUIRE(exists(dir.file("nested.ogg")));
    }

    SECTION("MissingDirectoryIsNotAnError") {
        REQUIRE(TempFileJanitor::sweep(dir.file("missing"), std::chrono::seconds(0)) == 0);
    }

    SECTION("MediaExtensions") {
        REQUIRE(TempFileJanitor::is_media_file("/x/y.ogg"));
        REQUIRE(TempFileJanitor::is_media_file("take.OGA"));
        REQUIRE_FALSE(TempFileJanitor::is_media_file("take.mp3"));
        REQUIRE_FALSE(TempFileJanitor::is_media_file("wav"));
    }
}
