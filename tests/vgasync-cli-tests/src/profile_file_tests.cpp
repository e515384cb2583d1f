#include <catch2/catch_test_macros.hpp>

#include <profile_file.hpp>

#include <vgasync/hw/vga/timing_profile.hpp>

#include <fmt/format.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

using namespace vgasync;

namespace profile_file {

// Writes a profile into a fresh temporary directory and removes both when the test ends.
struct TempProfile {
    explicit TempProfile(std::string_view contents, std::string_view fileName = "vgasync-test-profile.toml") {
        static uint64 counter = 0;
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir = std::filesystem::temp_directory_path() / fmt::format("vgasync-cli-tests-{}-{}", stamp, counter++);
        std::filesystem::create_directories(dir);
        path = dir / fileName;

        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        out << contents;
    }

    ~TempProfile() {
        std::error_code ec{};
        std::filesystem::remove_all(dir, ec);
    }

    std::filesystem::path dir;
    std::filesystem::path path;
};

app::ProfileLoadResult::Type LoadType(std::string_view contents) {
    TempProfile file{contents};
    app::ProfileFile profileFile{};
    return profileFile.Load(file.path).type;
}

} // namespace profile_file

using namespace profile_file;

TEST_CASE("Profile files load every key", "[cli][profile_file]") {
    TempProfile file{R"(ProfileVersion = 1
Name = "VGA 640x480 @ 60Hz"
PixelClockMHz = 25.175

[Horizontal]
Visible = 640
FrontPorch = 16
SyncPulse = 96
BackPorch = 48
Total = 800

[Vertical]
Visible = 480
FrontPorch = 10
SyncPulse = 2
BackPorch = 33
Total = 525
)"};

    app::ProfileFile profileFile{};
    const app::ProfileLoadResult result = profileFile.Load(file.path);
    REQUIRE(result.type == app::ProfileLoadResult::Type::Success);
    CHECK(static_cast<bool>(result));
    CHECK(result.string() == "Success");

    CHECK(profileFile.name == "VGA 640x480 @ 60Hz");
    CHECK(profileFile.pixelClockHz == 25'175'000);

    const vga::TimingProfile &profile = profileFile.profile;
    CHECK(profile.hVisible == 640);
    CHECK(profile.hFrontPorch == 16);
    CHECK(profile.hSyncPulse == 96);
    CHECK(profile.hBackPorch == 48);
    CHECK(profile.hTotal == 800);
    CHECK(profile.vVisible == 480);
    CHECK(profile.vFrontPorch == 10);
    CHECK(profile.vSyncPulse == 2);
    CHECK(profile.vBackPorch == 33);
    CHECK(profile.vTotal == 525);
    CHECK(vga::ValidateProfile(profile));
}

TEST_CASE("Profile files fall back to defaults for missing keys", "[cli][profile_file]") {
    app::ProfileFile profileFile{};

    SECTION("empty file") {
        TempProfile file{"", "svga-defaults.toml"};
        REQUIRE(profileFile.Load(file.path));

        CHECK(profileFile.name == "svga-defaults");
        CHECK(profileFile.pixelClockHz == 40'000'000);
        CHECK(profileFile.profile == vga::kDefaultProfile);
    }

    SECTION("partial tables") {
        TempProfile file{R"(
[Horizontal]
BackPorch = 80
Total = 1048

[Vertical]
Total = 630
)",
                         "svga-partial.toml"};
        REQUIRE(profileFile.Load(file.path));

        vga::TimingProfile expected = vga::kDefaultProfile;
        expected.hBackPorch = 80;
        expected.hTotal = 1048;
        expected.vTotal = 630;

        CHECK(profileFile.name == "svga-partial");
        CHECK(profileFile.pixelClockHz == 40'000'000);
        CHECK(profileFile.profile == expected);
    }

    SECTION("values from a previous load are discarded") {
        TempProfile custom{"Name = \"custom\"\nPixelClockMHz = 65.0\n[Vertical]\nVisible = 768\n"};
        REQUIRE(profileFile.Load(custom.path));
        CHECK(profileFile.profile.vVisible == 768);

        TempProfile empty{"", "svga-reload.toml"};
        REQUIRE(profileFile.Load(empty.path));
        CHECK(profileFile.name == "svga-reload");
        CHECK(profileFile.pixelClockHz == 40'000'000);
        CHECK(profileFile.profile == vga::kDefaultProfile);
    }
}

TEST_CASE("Profile files reject unsupported versions", "[cli][profile_file]") {
    using Type = app::ProfileLoadResult::Type;

    CHECK(LoadType("ProfileVersion = 1") == Type::Success);
    CHECK(LoadType("ProfileVersion = 2") == Type::UnsupportedProfileVersion);
    CHECK(LoadType("ProfileVersion = 0") == Type::UnsupportedProfileVersion);
    CHECK(LoadType("ProfileVersion = -3") == Type::UnsupportedProfileVersion);

    TempProfile file{"ProfileVersion = 7"};
    app::ProfileFile profileFile{};
    const app::ProfileLoadResult result = profileFile.Load(file.path);
    CHECK_FALSE(static_cast<bool>(result));
    CHECK(result.string() == "Unsupported profile version: 7");
}

TEST_CASE("Profile files reject invalid values", "[cli][profile_file]") {
    using Type = app::ProfileLoadResult::Type;

    SECTION("wrong types") {
        CHECK(LoadType("Name = 3") == Type::InvalidProfile);
        CHECK(LoadType("PixelClockMHz = \"fast\"") == Type::InvalidProfile);
        CHECK(LoadType("[Horizontal]\nVisible = \"wide\"") == Type::InvalidProfile);
        CHECK(LoadType("[Vertical]\nTotal = 525.5") == Type::InvalidProfile);
    }

    SECTION("out of range") {
        CHECK(LoadType("PixelClockMHz = 0") == Type::InvalidProfile);
        CHECK(LoadType("PixelClockMHz = -25.175") == Type::InvalidProfile);
        CHECK(LoadType("PixelClockMHz = nan") == Type::InvalidProfile);
        CHECK(LoadType("PixelClockMHz = inf") == Type::InvalidProfile);
        CHECK(LoadType("[Horizontal]\nVisible = -1") == Type::InvalidProfile);
        CHECK(LoadType("[Vertical]\nSyncPulse = 5000000000") == Type::InvalidProfile);
    }

    SECTION("messages name the offending key") {
        app::ProfileFile profileFile{};

        TempProfile badAxis{"[Horizontal]\nVisible = -1"};
        CHECK(profileFile.Load(badAxis.path).string() ==
              "Invalid profile: Horizontal.Visible must be an integer between 0 and 4294967295");

        TempProfile badName{"Name = 3", "vgasync-test-name.toml"};
        CHECK(profileFile.Load(badName.path).string() == "Invalid profile: Name must be a string");

        TempProfile badClock{"PixelClockMHz = 0", "vgasync-test-clock.toml"};
        CHECK(profileFile.Load(badClock.path).string() == "Invalid profile: PixelClockMHz must be a positive number");
    }

    SECTION("inconsistent timings are left to the display system") {
        CHECK(LoadType("[Horizontal]\nTotal = 1000") == Type::Success);
    }
}

TEST_CASE("Profile files report TOML errors", "[cli][profile_file]") {
    using Type = app::ProfileLoadResult::Type;

    SECTION("malformed document") {
        TempProfile file{"[Horizontal\nVisible = 640"};
        app::ProfileFile profileFile{};
        const app::ProfileLoadResult result = profileFile.Load(file.path);
        CHECK(result.type == Type::TOMLParseError);
        CHECK(result.string().starts_with("TOML parse error: "));
    }

    SECTION("duplicate keys") {
        CHECK(LoadType("Name = \"a\"\nName = \"b\"") == Type::TOMLParseError);
    }

    SECTION("missing file") {
        TempProfile file{""};
        std::filesystem::remove(file.path);

        app::ProfileFile profileFile{};
        CHECK(profileFile.Load(file.path).type == Type::TOMLParseError);
    }
}
