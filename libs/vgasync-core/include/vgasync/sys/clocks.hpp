#pragma once

#include <vgasync/hw/vga/timing_profile.hpp>

#include <vgasync/core/types.hpp>

namespace vgasync::sys {

// Scan rates derived from the pixel clock:
// - line rate  = pixel clock / hTotal
// - frame rate = pixel clock / (hTotal * vTotal)
//
// Reference rates for the built-in presets:
//   Mode            Pixel clock   Line rate    Frame rate
//   640x480@60      25.175 MHz    31.469 kHz   59.940 Hz
//   640x480@72      31.500 MHz    37.861 kHz   72.809 Hz
//   800x600@60      40.000 MHz    37.879 kHz   60.317 Hz
//   800x600@72      50.000 MHz    48.077 kHz   72.188 Hz
//   1024x768@60     65.000 MHz    48.363 kHz   60.004 Hz

struct ScanRates {
    double lineRateHz;
    double frameRateHz;
};

inline constexpr uint64 TicksPerFrame(const vga::TimingProfile &profile) {
    return uint64(profile.hTotal) * profile.vTotal;
}

inline constexpr ScanRates CalcScanRates(const vga::TimingProfile &profile, uint64 pixelClockHz) {
    if (profile.hTotal == 0 || profile.vTotal == 0) {
        return {0.0, 0.0};
    }
    const double clock = static_cast<double>(pixelClockHz);
    return {
        .lineRateHz = clock / profile.hTotal,
        .frameRateHz = clock / static_cast<double>(TicksPerFrame(profile)),
    };
}

} // namespace vgasync::sys
