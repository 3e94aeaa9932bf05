#include <catch2/catch_test_macros.hpp>

#include "updater/UpdateErrors.hpp"
#include "utils/ZipExtractor.hpp"
#include "zip_fixture.hpp"

#include <filesystem>

namespace fs = std::filesystem;
using utils::ZipExtractor;

TEST_CASE("ZipExtractor - safe archives", "[utils][zip]") {
    test_utils::TempDir dir("zip_safe");
    const fs::path archive = dir.path() / "package.zip";
    const fs::path target = dir.path() / "out";

    SECTION("Reproduces every entry and its relative path") {
        test_utils::writeZip(archive, {
            { "app/", "" },
            { "app/cabplanner.exe", "MZ-binary-payload" },
            { "app/_internal/", "" },
            { "app/_internal/python311.dll", std::string(4096, 'x') },
            { "app/_internal/nested/deep/file.txt", "deep" },
            { "README.txt", "readme" },
        });

        const size_t written = ZipExtractor::ExtractZip(archive, target);
        REQUIRE(written == 4);
        REQUIRE(test_utils::readFile(target / "app" / "cabplanner.exe") == "MZ-binary-payload");
        REQUIRE(test_utils::readFile(target / "app" / "_internal" / "python311.dll") == std::string(4096, 'x'));
        REQUIRE(test_utils::readFile(target / "app" / "_internal" / "nested" / "deep" / "file.txt") == "deep");
        REQUIRE(test_utils::readFile(target / "README.txt") == "readme");
        REQUIRE(fs::is_directory(target / "app" / "_internal"));
        REQUIRE(test_utils::countFiles(target) == 4);
    }

    SECTION("Creates the destination directory if absent") {
        test_utils::writeZip(archive, { { "a.txt", "a" } });
        const fs::path nested = dir.path() / "x" / "y" / "z";
        REQUIRE_FALSE(fs::exists(nested));
        ZipExtractor::ExtractZip(archive, nested);
        REQUIRE(test_utils::readFile(nested / "a.txt") == "a");
    }

    SECTION("Dot segments that stay inside are allowed") {
        test_utils::writeZip(archive, { { "dir/../inside.txt", "ok" } });
        ZipExtractor::ExtractZip(archive, target);
        REQUIRE(test_utils::readFile(target / "inside.txt") == "ok");
    }
}

TEST_CASE("ZipExtractor - zip-slip protection", "[utils][zip][security]") {
    test_utils::TempDir dir("zip_slip");
    const fs::path archive = dir.path() / "evil.zip";
    const fs::path target = dir.path() / "out";

    SECTION("Relative traversal writes nothing") {
        test_utils::writeZip(archive, {
            { "good.txt", "fine" },
            { "../../etc/passwd", "root::0:0" },
        });

        REQUIRE_THROWS_AS(ZipExtractor::ExtractZip(archive, target), updater::UnsafeArchiveError);
        REQUIRE(test_utils::countFiles(target) == 0);
        REQUIRE_FALSE(fs::exists(dir.path() / "etc"));
    }

    SECTION("Traversal hidden behind a subdirectory") {
        test_utils::writeZip(archive, { { "app/../../escape.txt", "x" } });
        REQUIRE_THROWS_AS(ZipExtractor::ExtractZip(archive, target), updater::UnsafeArchiveError);
        REQUIRE_FALSE(fs::exists(dir.path() / "escape.txt"));
        REQUIRE(test_utils::countFiles(target) == 0);
    }

    SECTION("Absolute entry writes nothing") {
        test_utils::writeZip(archive, {
            { "good.txt", "fine" },
            { "Xtmp/cabplanner_abs_entry.txt", "x" },
        });
        test_utils::rewriteEntryName(archive, "Xtmp/cabplanner_abs_entry.txt", "/tmp/cabplanner_abs_entry.txt");

        REQUIRE_THROWS_AS(ZipExtractor::ExtractZip(archive, target), updater::UnsafeArchiveError);
        REQUIRE(test_utils::countFiles(target) == 0);
    }

    SECTION("Drive-qualified and backslash traversal entries") {
        REQUIRE_FALSE(ZipExtractor::IsSafeEntry("C:/Windows/evil.dll", target));
        REQUIRE_FALSE(ZipExtractor::IsSafeEntry("..\\..\\evil.dll", target));
        REQUIRE_FALSE(ZipExtractor::IsSafeEntry("", target));
        REQUIRE(ZipExtractor::IsSafeEntry("app\\_internal\\lib.dll", target));
        REQUIRE(ZipExtractor::IsSafeEntry("app/", target));
    }

    SECTION("Sibling directory with a shared name prefix is outside") {
        REQUIRE_FALSE(ZipExtractor::IsSafeEntry("../out-sibling/file.txt", target));
    }
}

TEST_CASE("ZipExtractor - corrupt archives", "[utils][zip]") {
    test_utils::TempDir dir("zip_corrupt");
    const fs::path target = dir.path() / "out";

    SECTION("Missing archive") {
        REQUIRE_THROWS_AS(ZipExtractor::ExtractZip(dir.path() / "missing.zip", target), updater::CorruptArchiveError);
    }

    SECTION("Not a ZIP container") {
        const fs::path archive = dir.path() / "garbage.zip";
        test_utils::writeFile(archive, "this is definitely not a zip file");
        REQUIRE_THROWS_AS(ZipExtractor::ExtractZip(archive, target), updater::CorruptArchiveError);
        REQUIRE_FALSE(fs::exists(target));
    }
}
