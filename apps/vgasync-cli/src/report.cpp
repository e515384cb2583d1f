#include "report.hpp"

#include <fmt/format.h>

#include <algorithm>

using namespace vgasync;

namespace app {

bool PhaseReport::AllMatch() const {
    return std::all_of(rows.begin(), rows.end(), [](const Row &row) { return row.Matches(); });
}

PhaseReport MakeReport(const DisplaySystem &system, std::string_view modeName, uint64 frames) {
    const vga::TimingProfile &profile = system.GetProfile();
    const vga::SignalMonitor &monitor = system.GetMonitor();

    // Inconsistent profiles may have phases longer than the line or frame; those runs never occur
    auto remainder = [](uint64 total, uint64 width) -> uint64 { return total > width ? total - width : 0; };

    const uint64 hTotal = profile.hTotal;

    PhaseReport report{};
    report.modeName = modeName;
    report.pixelClockHz = system.GetPixelClockHz();
    report.scanRates = system.GetScanRates();
    report.frames = frames;

    // The monitor only reports runs bounded by two observed edges. After whole frames the clock stops on the last
    // back porch tick of the frame, so the active low run is the horizontal blank of the second-to-last visible line.
    report.rows = {
        {"active", "high run", profile.hVisible, monitor.Active().GetLastHighRun()},
        {"active", "low run", remainder(hTotal, profile.hVisible), monitor.Active().GetLastLowRun()},
        {"hsync", "high run", profile.hSyncPulse, monitor.HSync().GetLastHighRun()},
        {"hsync", "low run", remainder(hTotal, profile.hSyncPulse), monitor.HSync().GetLastLowRun()},
        {"hsync", "period", hTotal, monitor.HSync().GetLastPeriod()},
        {"vsync", "high run", uint64(profile.vSyncPulse) * hTotal, monitor.VSync().GetLastHighRun()},
        {"vsync", "low run", remainder(profile.vTotal, profile.vSyncPulse) * hTotal, monitor.VSync().GetLastLowRun()},
        {"vsync", "period", sys::TicksPerFrame(profile), monitor.VSync().GetLastPeriod()},
        {"active", "lines/frame", profile.vVisible, monitor.GetLastFrameActiveLines()},
    };
    return report;
}

void PrintReport(const PhaseReport &report) {
    fmt::print("Mode:        {}\n", report.modeName);
    fmt::print("Pixel clock: {:.3f} MHz\n", static_cast<double>(report.pixelClockHz) / 1'000'000.0);
    fmt::print("Line rate:   {:.3f} kHz\n", report.scanRates.lineRateHz / 1000.0);
    fmt::print("Frame rate:  {:.3f} Hz\n", report.scanRates.frameRateHz);
    fmt::print("Frames run:  {}\n", report.frames);
    fmt::print("\n");
    fmt::print("{:<8} {:<12} {:>10} {:>10}\n", "Signal", "Measurement", "Expected", "Measured");
    for (const auto &row : report.rows) {
        fmt::print("{:<8} {:<12} {:>10} {:>10}  {}\n", row.signal, row.measurement, row.expected, row.measured,
                   row.Matches() ? "ok" : "MISMATCH");
    }
    fmt::print("\n");
    fmt::print("{}\n", report.AllMatch() ? "All phase widths match the profile." : "Phase widths do not match.");
}

} // namespace app
