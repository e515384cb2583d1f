#pragma once

/**
@file
@brief The facade of the vgasync library.
Defines `vgasync::DisplaySystem`, which ties a timing generator to its pixel clock, configuration and signal monitor.
*/

#include <vgasync/core/configuration.hpp>

#include <vgasync/state/state_timing.hpp>

#include "clocks.hpp"
#include "pixel_clock.hpp"

#include <vgasync/hw/vga/signal_monitor.hpp>
#include <vgasync/hw/vga/timing_generator.hpp>
#include <vgasync/hw/vga/timing_profile.hpp>

#include <string>

namespace vgasync {

/// @brief A timing generator driven by its own pixel clock.
///
/// The system starts with the preset named in `configuration.video.preset` and runs the power-on sequence described by
/// `configuration.powerOn` whenever the profile changes or `PowerOn()` is invoked. A `vga::SignalMonitor` samples the
/// outputs on every tick.
struct DisplaySystem {
    /// @brief Creates a display system running the default preset, with the power-on sequence already applied.
    DisplaySystem();

    // Observers registered on the configuration refer back to this instance
    DisplaySystem(const DisplaySystem &) = delete;
    DisplaySystem(DisplaySystem &&) = delete;
    DisplaySystem &operator=(const DisplaySystem &) = delete;
    DisplaySystem &operator=(DisplaySystem &&) = delete;

    /// @brief Resets the generator, then holds it in reset and disabled for the configured number of ticks.
    ///
    /// The signal monitor is cleared once the sequence completes.
    void PowerOn();

    /// @brief Switches to a new timing profile and runs the power-on sequence.
    ///
    /// The profile is validated first. Invalid profiles are rejected if `configuration.video.profileValidation` is
    /// `Reject`; otherwise they are used as given. The generator and clock are re-profiled in place, so references
    /// obtained from `GetGenerator()` and `GetClock()` and callbacks mapped on the generator stay valid.
    ///
    /// @param[in] profile the new profile
    /// @param[in] pixelClockHz the pixel clock frequency, used to compute scan rates
    /// @return the validation result
    vga::ProfileCheckResult SetProfile(const vga::TimingProfile &profile, uint64 pixelClockHz);

    [[nodiscard]] const vga::TimingProfile &GetProfile() const noexcept {
        return m_generator.GetProfile();
    }

    [[nodiscard]] uint64 GetPixelClockHz() const noexcept {
        return m_pixelClockHz;
    }

    [[nodiscard]] sys::ScanRates GetScanRates() const noexcept {
        return sys::CalcScanRates(GetProfile(), m_pixelClockHz);
    }

    /// @brief Runs the pixel clock for the given number of ticks.
    void RunTicks(uint64 ticks);

    /// @brief Runs the pixel clock for the given number of whole frames worth of ticks.
    void RunFrames(uint64 frames);

    /// @brief Runs the pixel clock until the tick right before the next frame starts.
    ///
    /// Afterwards the generator sits where the power-on sequence would leave it after whole frames, so that
    /// `RunFrames` measures complete frames. Does nothing if the generator is already there.
    void RunToEndOfFrame();

    vga::TimingGenerator &GetGenerator() {
        return m_generator;
    }

    const vga::TimingGenerator &GetGenerator() const {
        return m_generator;
    }

    sys::PixelClock &GetClock() {
        return m_clock;
    }

    const vga::SignalMonitor &GetMonitor() const {
        return m_monitor;
    }

    // -------------------------------------------------------------------------
    // Save states

    void SaveState(state::TimingState &state) const;

    /// @brief Loads a previously saved state after validating it against the current profile.
    /// @return `true` if the state was valid and loaded
    [[nodiscard]] bool LoadState(const state::TimingState &state);

    /// @brief The display system configuration.
    core::Configuration configuration;

private:
    vga::TimingGenerator m_generator;
    sys::PixelClock m_clock;
    vga::SignalMonitor m_monitor;

    uint64 m_pixelClockHz;

    core::config::video::ProfileValidation m_profileValidation;

    void ApplyPreset(const std::string &name);
};

} // namespace vgasync
