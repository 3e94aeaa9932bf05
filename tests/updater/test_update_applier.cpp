#include <catch2/catch_test_macros.hpp>

#include "updater/UpdateApplier.hpp"
#include "updater/UpdateErrors.hpp"
#include "utils/ErrorReporter.hpp"
#include "../utils/fakes.hpp"

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;
using namespace updater;

namespace {

struct ApplierFixture {
    test_utils::TempDir dir{ "applier" };
    fs::path liveRoot = dir.path() / "install";
    fs::path packageRoot = dir.path() / "package";
    InstallationLayout live{ liveRoot, "cabplanner.exe", "_internal", "cabplanner.db" };
    test_utils::FakePlatform platform;

    ApplierFixture() {
        test_utils::makeInstallation(liveRoot, "old-exe", "old-runtime", true);
        test_utils::writeFile(liveRoot / "_internal" / "obsolete.dll", "old-only");
        test_utils::makeInstallation(packageRoot, "new-exe", "new-runtime", false);
        utils::ErrorReporter::ClearErrors();
    }
};

}  // namespace

TEST_CASE("UpdateApplier - successful swap", "[updater][applier]") {
    ApplierFixture f;
    UpdateApplier applier(f.live, ApplierOptions{}, f.platform);

    SECTION("New files replace the old ones and the state file survives") {
        applier.applyUpdate(f.packageRoot);

        REQUIRE(test_utils::readFile(f.live.executable()) == "new-exe");
        REQUIRE(test_utils::readFile(f.live.supportDir() / "runtime.dll") == "new-runtime");
        REQUIRE(test_utils::readFile(f.live.supportDir() / "data" / "catalog.json") == "new-runtime-data");
        REQUIRE_FALSE(fs::exists(f.live.supportDir() / "obsolete.dll"));
        REQUIRE(test_utils::readFile(f.live.stateFile()) == "user-projects");

        REQUIRE_FALSE(fs::exists(f.liveRoot / "cabplanner.exe.bak"));
        REQUIRE_FALSE(fs::exists(f.liveRoot / "_internal.bak"));
        REQUIRE(fs::exists(applier.successMarkerPath()));

        REQUIRE(f.platform.shortcutsCreated.size() == 1);
        REQUIRE(f.platform.shortcutsCreated.front() == f.liveRoot / "Cabplanner.lnk");
        REQUIRE(f.platform.launched.size() == 1);
        REQUIRE(f.platform.launched.front() == f.live.executable());
        REQUIRE(f.platform.launchDirs.front() == f.liveRoot);
    }

    SECTION("Existing shortcut is left alone") {
        test_utils::writeFile(f.liveRoot / "Cabplanner.lnk", "user-shortcut");
        applier.applyUpdate(f.packageRoot);
        REQUIRE(f.platform.shortcutsCreated.empty());
        REQUIRE(test_utils::readFile(f.liveRoot / "Cabplanner.lnk") == "user-shortcut");
    }

    SECTION("Stale shortcut is rewritten on a fresh install") {
        fs::remove(f.live.stateFile());
        test_utils::writeFile(f.liveRoot / "Cabplanner.lnk", "stale-shortcut-pointing-elsewhere");

        applier.applyUpdate(f.packageRoot);

        REQUIRE(f.platform.shortcutsRefreshed == std::vector<fs::path>{ f.liveRoot / "Cabplanner.lnk" });
        REQUIRE(f.platform.shortcutsCreated.empty());
        REQUIRE(test_utils::readFile(f.liveRoot / "Cabplanner.lnk") == f.live.executable().string());
        REQUIRE_FALSE(fs::exists(f.live.stateFile()));
    }

    SECTION("State file shipped inside the package is discarded") {
        test_utils::writeFile(f.packageRoot / "cabplanner.db", "developer-database");
        applier.applyUpdate(f.packageRoot);
        REQUIRE_FALSE(fs::exists(f.packageRoot / "cabplanner.db"));
        REQUIRE(test_utils::readFile(f.live.stateFile()) == "user-projects");
    }

    SECTION("Relaunch failure still counts as installed") {
        f.platform.launchSucceeds = false;
        REQUIRE_NOTHROW(applier.applyUpdate(f.packageRoot));
        REQUIRE(test_utils::readFile(f.live.executable()) == "new-exe");
        REQUIRE(utils::ErrorReporter::HasPendingErrors());
        const auto reports = utils::ErrorReporter::GetPendingErrors();
        REQUIRE(reports.front().category == utils::ErrorCategory::Platform);
        REQUIRE(reports.front().severity == utils::ErrorSeverity::Warning);
    }
}

TEST_CASE("UpdateApplier - relaunch can be disabled", "[updater][applier]") {
    ApplierFixture f;
    ApplierOptions options;
    options.relaunch = false;
    UpdateApplier applier(f.live, options, f.platform);

    applier.applyUpdate(f.packageRoot);
    REQUIRE(f.platform.launched.empty());
    REQUIRE(fs::exists(applier.successMarkerPath()));
}

TEST_CASE("UpdateApplier - failed copy rolls back", "[updater][applier][rollback]") {
    ApplierFixture f;
    UpdateApplier applier(f.live, ApplierOptions{}, f.platform);

    // The executable is copied, then the support directory fails mid-way
    applier.setCopier([](const fs::path& from, const fs::path& to) {
        if (from.filename() == "_internal") {
            test_utils::writeFile(to / "runtime.dll", "half-written");
            throw std::runtime_error("disk full");
        }
        UpdateApplier::copyPath(from, to);
    });

    try {
        applier.applyUpdate(f.packageRoot);
        FAIL("expected SwapError");
    } catch (const SwapError& e) {
        REQUIRE(e.kind() == UpdateErrorKind::Swap);
        REQUIRE(e.details() == "disk full");
    }

    REQUIRE(test_utils::readFile(f.live.executable()) == "old-exe");
    REQUIRE(test_utils::readFile(f.live.supportDir() / "runtime.dll") == "old-runtime");
    REQUIRE(test_utils::readFile(f.live.supportDir() / "obsolete.dll") == "old-only");
    REQUIRE(test_utils::readFile(f.live.stateFile()) == "user-projects");
    REQUIRE_FALSE(fs::exists(f.liveRoot / "cabplanner.exe.bak"));
    REQUIRE_FALSE(fs::exists(f.liveRoot / "_internal.bak"));
    REQUIRE_FALSE(fs::exists(applier.successMarkerPath()));
    REQUIRE(f.platform.launched.empty());
}

TEST_CASE("UpdateApplier - rollback that cannot restore", "[updater][applier][rollback]") {
    ApplierFixture f;
    UpdateApplier applier(f.live, ApplierOptions{}, f.platform);
    const fs::path supportBackup = f.liveRoot / "_internal.bak";

    // The support directory backup disappears before the failure is noticed
    applier.setCopier([&](const fs::path& from, const fs::path& to) {
        if (from.filename() == "_internal") {
            fs::remove_all(supportBackup);
            throw std::runtime_error("disk full");
        }
        UpdateApplier::copyPath(from, to);
    });

    try {
        applier.applyUpdate(f.packageRoot);
        FAIL("expected RollbackFailedError");
    } catch (const RollbackFailedError& e) {
        REQUIRE(e.kind() == UpdateErrorKind::RollbackFailed);
        REQUIRE(e.details().find(supportBackup.string()) != std::string::npos);
        REQUIRE(e.details().find(f.live.supportDir().string()) != std::string::npos);
    }

    // The entry that still had a backup is restored
    REQUIRE(test_utils::readFile(f.live.executable()) == "old-exe");
    REQUIRE_FALSE(fs::exists(applier.successMarkerPath()));
    REQUIRE(f.platform.launched.empty());

    const auto reports = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 1);
    REQUIRE(reports.front().severity == utils::ErrorSeverity::Fatal);
    REQUIRE(reports.front().category == utils::ErrorCategory::Installation);
    REQUIRE(reports.front().technical_details.find(supportBackup.string()) != std::string::npos);
}

TEST_CASE("UpdateApplier - success marker", "[updater][applier]") {
    test_utils::TempDir dir("marker");

    REQUIRE_FALSE(UpdateApplier::consumeSuccessMarker(dir.path(), ".update_success"));

    test_utils::writeFile(dir.path() / ".update_success", "2026-03-01 10:00:00");
    REQUIRE(UpdateApplier::consumeSuccessMarker(dir.path(), ".update_success"));
    REQUIRE_FALSE(fs::exists(dir.path() / ".update_success"));
    REQUIRE_FALSE(UpdateApplier::consumeSuccessMarker(dir.path(), ".update_success"));
}
