#include <catch2/catch_test_macros.hpp>

#include "updater/BackupManager.hpp"
#include "updater/UpdateErrors.hpp"
#include "utils/ErrorReporter.hpp"
#include "../utils/zip_fixture.hpp"

#include <filesystem>

namespace fs = std::filesystem;
using namespace updater;

TEST_CASE("BackupManager - move aside and restore", "[updater][backup]") {
    test_utils::TempDir dir("backup");
    test_utils::makeInstallation(dir.path(), "old-exe", "old-runtime", true);
    const fs::path exe = dir.path() / "cabplanner.exe";
    const fs::path support = dir.path() / "_internal";

    BackupManager manager;
    REQUIRE(manager.backupPathFor(exe) == dir.path() / "cabplanner.exe.bak");

    SECTION("Restore brings the original bytes back") {
        BackupSet backup = manager.moveAside({ exe, support });
        REQUIRE(backup.entries().size() == 2);
        REQUIRE_FALSE(fs::exists(exe));
        REQUIRE_FALSE(fs::exists(support));
        REQUIRE(fs::exists(dir.path() / "cabplanner.exe.bak"));
        REQUIRE(fs::is_directory(dir.path() / "_internal.bak"));

        // Partially installed replacement
        test_utils::writeFile(exe, "new-exe");
        test_utils::writeFile(support / "runtime.dll", "new-runtime");

        manager.restore(std::move(backup));
        REQUIRE(test_utils::readFile(exe) == "old-exe");
        REQUIRE(test_utils::readFile(support / "runtime.dll") == "old-runtime");
        REQUIRE(test_utils::readFile(support / "data" / "catalog.json") == "old-runtime-data");
        REQUIRE_FALSE(fs::exists(dir.path() / "cabplanner.exe.bak"));
        REQUIRE_FALSE(fs::exists(dir.path() / "_internal.bak"));
        REQUIRE(test_utils::readFile(dir.path() / "cabplanner.db") == "user-projects");
    }

    SECTION("Discard removes the backups") {
        BackupSet backup = manager.moveAside({ exe, support });
        manager.discard(std::move(backup));
        REQUIRE_FALSE(fs::exists(dir.path() / "cabplanner.exe.bak"));
        REQUIRE_FALSE(fs::exists(dir.path() / "_internal.bak"));
    }

    SECTION("Stale backup from an earlier run is replaced") {
        test_utils::writeFile(dir.path() / "cabplanner.exe.bak", "stale");
        test_utils::writeFile(dir.path() / "_internal.bak" / "leftover.dll", "stale");

        BackupSet backup = manager.moveAside({ exe, support });
        REQUIRE(test_utils::readFile(dir.path() / "cabplanner.exe.bak") == "old-exe");
        REQUIRE_FALSE(fs::exists(dir.path() / "_internal.bak" / "leftover.dll"));
        manager.restore(std::move(backup));
    }

    SECTION("Missing paths are skipped") {
        BackupSet backup = manager.moveAside({ dir.path() / "not-there", exe });
        REQUIRE(backup.entries().size() == 1);
        REQUIRE(backup.entries().front().original == exe);
        manager.restore(std::move(backup));
        REQUIRE(test_utils::readFile(exe) == "old-exe");
    }

    SECTION("Custom suffix") {
        BackupManager custom(".old");
        BackupSet backup = custom.moveAside({ exe });
        REQUIRE(fs::exists(dir.path() / "cabplanner.exe.old"));
        custom.restore(std::move(backup));
        REQUIRE(fs::exists(exe));
    }
}

TEST_CASE("BackupManager - restore without a backup", "[updater][backup][rollback]") {
    test_utils::TempDir dir("backup_lost");
    test_utils::makeInstallation(dir.path(), "old-exe", "old-runtime", true);
    const fs::path exe = dir.path() / "cabplanner.exe";
    const fs::path support = dir.path() / "_internal";
    utils::ErrorReporter::ClearErrors();

    BackupManager manager;
    BackupSet backup = manager.moveAside({ exe, support });
    fs::remove(dir.path() / "cabplanner.exe.bak");
    test_utils::writeFile(exe, "new-exe");

    try {
        manager.restore(std::move(backup));
        FAIL("expected RollbackFailedError");
    } catch (const RollbackFailedError& e) {
        REQUIRE(e.details().find((dir.path() / "cabplanner.exe.bak").string()) != std::string::npos);
        REQUIRE(e.details().find(exe.string()) != std::string::npos);
    }

    // Remaining entries are still put back
    REQUIRE(test_utils::readFile(support / "runtime.dll") == "old-runtime");
    REQUIRE_FALSE(fs::exists(dir.path() / "_internal.bak"));

    const auto reports = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 1);
    REQUIRE(reports.front().severity == utils::ErrorSeverity::Fatal);
    REQUIRE(reports.front().category == utils::ErrorCategory::Installation);
    REQUIRE(reports.front().technical_details.find(exe.string()) != std::string::npos);
}
