#include <catch2/catch_test_macros.hpp>

#include <vgasync/hw/vga/signal_monitor.hpp>
#include <vgasync/hw/vga/timing_generator.hpp>

using namespace vgasync;

TEST_CASE("Pulse tracker measures runs between observed edges", "[vga][monitor]") {
    vga::PulseTracker tracker{};

    SECTION("the run in progress when sampling starts is not measured") {
        for (int i = 0; i < 5; i++) {
            CHECK(tracker.Sample(true) == vga::PulseTracker::Edge::None);
        }
        CHECK(tracker.Sample(false) == vga::PulseTracker::Edge::Falling);
        CHECK(tracker.GetLastHighRun() == 0);
        CHECK(tracker.GetFallingEdges() == 1);
        CHECK(tracker.GetRisingEdges() == 0);
    }

    SECTION("high and low runs and the period") {
        tracker.Sample(false);
        for (int cycle = 0; cycle < 3; cycle++) {
            for (int i = 0; i < 3; i++) {
                tracker.Sample(true);
            }
            for (int i = 0; i < 7; i++) {
                tracker.Sample(false);
            }
        }
        CHECK(tracker.GetLastHighRun() == 3);
        CHECK(tracker.GetLastLowRun() == 7);
        CHECK(tracker.GetLastPeriod() == 10);
        CHECK(tracker.GetRisingEdges() == 3);
        CHECK(tracker.GetFallingEdges() == 3);
        CHECK_FALSE(tracker.GetLevel());
        CHECK(tracker.GetCurrentRun() == 7);
    }

    SECTION("reset forgets everything") {
        tracker.Sample(false);
        tracker.Sample(true);
        tracker.Sample(false);
        tracker.Reset();
        CHECK(tracker.GetRisingEdges() == 0);
        CHECK(tracker.GetFallingEdges() == 0);
        CHECK(tracker.GetLastHighRun() == 0);
        CHECK(tracker.GetCurrentRun() == 0);
    }
}

TEST_CASE("Signal monitor measures the default profile", "[vga][monitor]") {
    vga::TimingGenerator generator{vga::kDefaultProfile};
    vga::SignalMonitor monitor{};

    generator.Tick({.resetActive = true, .enable = false, .sync = false});
    monitor.Sample(generator.GetOutputs());

    // Two full frames plus a bit so that the second VSYNC pulse completes
    const uint64 ticks = 2 * 628ull * 1056ull + 8 * 1056ull;
    for (uint64 i = 0; i < ticks; i++) {
        monitor.Sample(generator.Tick({.resetActive = false, .enable = true, .sync = false}));
    }

    CHECK(monitor.GetSampleCount() == ticks + 1);

    CHECK(monitor.Active().GetLastHighRun() == 800);
    CHECK(monitor.Active().GetLastLowRun() == 256);

    CHECK(monitor.HSync().GetLastHighRun() == 128);
    CHECK(monitor.HSync().GetLastLowRun() == 928);
    CHECK(monitor.HSync().GetLastPeriod() == 1056);

    CHECK(monitor.VSync().GetLastHighRun() == 4 * 1056);
    CHECK(monitor.VSync().GetLastPeriod() == 628 * 1056);
    CHECK(monitor.VSync().GetRisingEdges() == 2);

    CHECK(monitor.GetLastFrameActiveLines() == 600);
}
