#include <catch2/catch_test_macros.hpp>

#include <vgasync/vgasync.hpp>

#include <fmt/format.h>

#include <cmath>
#include <string>
#include <string_view>
#include <type_traits>

using namespace vgasync;

namespace display_system {

struct FrameCounter {
    uint64 frames = 0;

    void FrameStart(uint64) {
        ++frames;
    }
};

} // namespace display_system

using namespace display_system;

// Configuration observers point back at the instance that registered them
static_assert(!std::is_copy_constructible_v<DisplaySystem>);
static_assert(!std::is_move_constructible_v<DisplaySystem>);
static_assert(!std::is_copy_assignable_v<DisplaySystem>);
static_assert(!std::is_move_assignable_v<DisplaySystem>);

TEST_CASE("Display system powers on with the default preset", "[sys][system]") {
    DisplaySystem system{};

    CHECK(system.GetProfile() == vga::kDefaultProfile);
    CHECK(system.GetPixelClockHz() == 40'000'000);
    CHECK(std::abs(system.GetScanRates().frameRateHz - 60.3165) < 0.0001);

    // Held in reset for one tick, then disabled for one tick
    CHECK(system.GetClock().GetTickCount() == 2);
    CHECK(system.GetGenerator().GetHPos() == 0);
    CHECK(system.GetGenerator().GetVPos() == 0);
    CHECK(system.GetClock().GetInputs().enable);
    CHECK_FALSE(system.GetClock().GetInputs().resetActive);
    CHECK(system.GetMonitor().GetSampleCount() == 0);

    system.RunTicks(1);
    CHECK(system.GetGenerator().GetOutputs().active);
}

TEST_CASE("Display system measures whole frames", "[sys][system]") {
    DisplaySystem system{};
    system.RunFrames(2);
    system.RunTicks(8 * 1056);

    const auto &monitor = system.GetMonitor();
    CHECK(monitor.GetSampleCount() == 2 * 628ull * 1056ull + 8 * 1056ull);
    CHECK(monitor.Active().GetLastHighRun() == 800);
    CHECK(monitor.HSync().GetLastHighRun() == 128);
    CHECK(monitor.HSync().GetLastPeriod() == 1056);
    CHECK(monitor.VSync().GetLastHighRun() == 4 * 1056);
    CHECK(monitor.VSync().GetLastPeriod() == 628 * 1056);
    CHECK(monitor.GetLastFrameActiveLines() == 600);
    CHECK(system.GetGenerator().GetFrameCount() == 2);
}

TEST_CASE("Display system profile changes", "[sys][system]") {
    DisplaySystem system{};
    system.RunTicks(5000);

    SECTION("valid profile") {
        const vga::Preset *preset = vga::FindPreset("640x480@60");
        REQUIRE(preset != nullptr);

        const auto result = system.SetProfile(preset->profile, preset->pixelClockHz);
        CHECK(result);
        CHECK(system.GetProfile() == preset->profile);
        CHECK(system.GetPixelClockHz() == 25'175'000);
        CHECK(system.GetClock().GetTickCount() == 2);
        CHECK(system.GetGenerator().GetHPos() == 0);
        CHECK(system.GetMonitor().GetSampleCount() == 0);
    }

    SECTION("inconsistent profile is used when validation warns") {
        vga::TimingProfile profile = vga::kDefaultProfile;
        profile.hTotal = 1000;

        const auto result = system.SetProfile(profile, 40'000'000);
        CHECK(result.type == vga::ProfileCheckResult::Type::HorizontalTotalMismatch);
        CHECK(system.GetProfile() == profile);
    }

    SECTION("inconsistent profile is rejected when validation rejects") {
        system.configuration.video.profileValidation = core::config::video::ProfileValidation::Reject;

        vga::TimingProfile profile = vga::kDefaultProfile;
        profile.vSyncPulse = 0;

        const auto result = system.SetProfile(profile, 40'000'000);
        CHECK(result.type == vga::ProfileCheckResult::Type::ZeroSyncPulse);
        CHECK(system.GetProfile() == vga::kDefaultProfile);
        CHECK(system.GetClock().GetTickCount() == 2 + 5000);
    }
}

TEST_CASE("Display system runs to the end of a frame", "[sys][system]") {
    DisplaySystem system{};

    SECTION("from power-on") {
        system.RunToEndOfFrame();
        CHECK(system.GetClock().GetTickCount() == 2 + 628ull * 1056ull);
    }

    SECTION("from the middle of a frame") {
        system.RunTicks(123'456);
        system.RunToEndOfFrame();
        CHECK(system.GetGenerator().GetHPos() == 1056);
        CHECK(system.GetGenerator().GetVPos() == 627);
        CHECK(system.GetGenerator().GetFrameCount() == 0);

        system.RunTicks(1);
        CHECK(system.GetGenerator().GetFrameCount() == 1);
    }

    SECTION("already at the end of a frame") {
        system.RunFrames(1);
        const uint64 ticks = system.GetClock().GetTickCount();
        system.RunToEndOfFrame();
        CHECK(system.GetClock().GetTickCount() == ticks);
    }

    SECTION("whole frames measured after a save state is loaded") {
        system.RunTicks(300'000);
        state::TimingState saved{};
        system.SaveState(saved);

        DisplaySystem other{};
        REQUIRE(other.LoadState(saved));
        other.RunToEndOfFrame();
        other.RunFrames(2);
        CHECK(other.GetMonitor().Active().GetLastLowRun() == 256);
        CHECK(other.GetMonitor().VSync().GetLastPeriod() == 628 * 1056);
        CHECK(other.GetMonitor().GetLastFrameActiveLines() == 600);
    }
}

TEST_CASE("Display system keeps the generator across profile changes", "[sys][system][callbacks]") {
    DisplaySystem system{};
    FrameCounter counter{};

    vga::TimingGenerator &generator = system.GetGenerator();
    sys::PixelClock &clock = system.GetClock();
    generator.MapCallbacks({}, {}, util::MakeClassMemberOptionalCallback<&FrameCounter::FrameStart>(&counter));

    // Two frames worth of ticks from power-on cross one frame boundary
    system.RunFrames(2);
    CHECK(counter.frames == 1);

    SECTION("preset switch") {
        system.configuration.video.preset = std::string{"640x480@60"};
        const vga::Preset *preset = vga::FindPreset("640x480@60");
        REQUIRE(preset != nullptr);

        CHECK(&system.GetGenerator() == &generator);
        CHECK(&system.GetClock() == &clock);
        CHECK(generator.GetProfile() == preset->profile);
        CHECK(clock.GetTickCount() == 2);

        system.RunFrames(2);
        CHECK(counter.frames == 2);
        CHECK(clock.GetTickCount() == 2 + 2 * sys::TicksPerFrame(preset->profile));
    }

    SECTION("custom profile") {
        vga::TimingProfile profile = vga::kDefaultProfile;
        profile.vBackPorch = 13;
        profile.vTotal = 618;
        REQUIRE(system.SetProfile(profile, 40'000'000));
        CHECK(&system.GetGenerator() == &generator);

        system.RunFrames(3);
        CHECK(counter.frames == 3);
        CHECK(system.GetMonitor().VSync().GetLastPeriod() == 618 * 1056);
    }
}

TEST_CASE("Display system power-on sequence is configurable", "[sys][system]") {
    DisplaySystem system{};
    system.configuration.powerOn.resetTicks = 10;
    system.configuration.powerOn.disableTicks = 5;
    system.RunTicks(3000);

    system.PowerOn();
    CHECK(system.GetClock().GetTickCount() == 15);
    CHECK(system.GetGenerator().GetHPos() == 0);
    CHECK(system.GetGenerator().GetVPos() == 0);
    CHECK(system.GetMonitor().GetSampleCount() == 0);
}

TEST_CASE("Display system save states", "[sys][system][state]") {
    DisplaySystem system{};
    system.RunTicks(100'000);

    state::TimingState saved{};
    system.SaveState(saved);
    const uint32 hPos = system.GetGenerator().GetHPos();
    const uint32 vPos = system.GetGenerator().GetVPos();

    system.RunTicks(50'000);
    REQUIRE(system.LoadState(saved));
    CHECK(system.GetGenerator().GetHPos() == hPos);
    CHECK(system.GetGenerator().GetVPos() == vPos);
    CHECK(system.GetMonitor().GetSampleCount() == 0);

    state::TimingState bad = saved;
    bad.vPos = 1000;
    CHECK_FALSE(system.LoadState(bad));
    CHECK(system.GetGenerator().GetVPos() == vPos);
}

TEST_CASE("Library version", "[sys][version]") {
    CHECK(std::string_view{version::string} ==
          fmt::format("{}.{}.{}", version::major, version::minor, version::patch));
}
