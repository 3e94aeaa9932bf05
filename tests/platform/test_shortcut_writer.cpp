#include <catch2/catch_test_macros.hpp>

#include "platform/ShortcutWriter.hpp"
#include "../utils/zip_fixture.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

#ifndef _WIN32

TEST_CASE("ShortcutWriter - desktop entries", "[platform][shortcut]") {
    test_utils::TempDir dir("shortcut");
    const fs::path target = dir.path() / "install" / "cabplanner.exe";
    const fs::path requested = dir.path() / "install" / "Cabplanner.lnk";
    const fs::path written = dir.path() / "install" / "Cabplanner.desktop";
    test_utils::writeFile(target, "MZ");

    REQUIRE(ShortcutWriter::platformPath(requested) == written);

    SECTION("Creates a launcher pointing at the executable") {
        REQUIRE(ShortcutWriter::ensureShortcut(target, requested, "Cabplanner"));
        REQUIRE(ShortcutWriter::exists(requested));

        const std::string entry = test_utils::readFile(written);
        REQUIRE(entry.rfind("[Desktop Entry]\n", 0) == 0);
        REQUIRE(entry.find("Type=Application\n") != std::string::npos);
        REQUIRE(entry.find("Name=Cabplanner\n") != std::string::npos);
        REQUIRE(entry.find("Comment=Cabplanner\n") != std::string::npos);
        REQUIRE(entry.find("Exec=\"" + target.string() + "\"\n") != std::string::npos);
        REQUIRE(entry.find("Path=" + target.parent_path().string() + "\n") != std::string::npos);

        const auto perms = fs::status(written).permissions();
        REQUIRE((perms & fs::perms::owner_exec) != fs::perms::none);
    }

    SECTION("Existing shortcut is kept by ensureShortcut") {
        test_utils::writeFile(written, "user-edited");
        REQUIRE(ShortcutWriter::ensureShortcut(target, requested, "Cabplanner"));
        REQUIRE(test_utils::readFile(written) == "user-edited");
    }

    SECTION("refreshShortcut replaces an existing shortcut") {
        test_utils::writeFile(written, "stale-shortcut-pointing-elsewhere");
        REQUIRE(ShortcutWriter::refreshShortcut(target, requested, "Cabplanner"));
        REQUIRE(test_utils::readFile(written).find("Exec=\"" + target.string() + "\"") != std::string::npos);
    }

    SECTION("Missing executable writes nothing") {
        fs::remove(target);
        REQUIRE_FALSE(ShortcutWriter::ensureShortcut(target, requested, "Cabplanner"));
        REQUIRE_FALSE(fs::exists(written));
    }

    SECTION("Missing executable keeps the old shortcut on refresh") {
        test_utils::writeFile(written, "previous");
        fs::remove(target);
        REQUIRE_FALSE(ShortcutWriter::refreshShortcut(target, requested, "Cabplanner"));
        REQUIRE(test_utils::readFile(written) == "previous");
    }
}

#endif
