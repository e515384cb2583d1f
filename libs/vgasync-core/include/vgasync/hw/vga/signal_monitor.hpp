#pragma once

/**
@file
@brief Edge recorder for the timing generator outputs.
*/

#include "timing_defs.hpp"

#include <vgasync/core/types.hpp>

namespace vgasync::vga {

/// @brief Measures pulse widths and periods of a single digital signal sampled once per tick.
///
/// A run is only reported once both of its edges have been observed, so the partial run in progress when sampling
/// starts is never measured.
class PulseTracker {
public:
    enum class Edge { None, Rising, Falling };

    PulseTracker() {
        Reset();
    }

    void Reset();

    /// @brief Records one sample of the signal.
    /// @param[in] level the signal level on this tick
    /// @return the edge detected on this tick, if any
    Edge Sample(bool level);

    bool GetLevel() const {
        return m_level;
    }

    // Length in ticks of the most recently completed high run, or 0 if none was completed yet.
    uint64 GetLastHighRun() const {
        return m_lastHighRun;
    }

    // Length in ticks of the most recently completed low run, or 0 if none was completed yet.
    uint64 GetLastLowRun() const {
        return m_lastLowRun;
    }

    // Ticks between the two most recent rising edges, or 0 if fewer than two were seen.
    uint64 GetLastPeriod() const {
        return m_lastPeriod;
    }

    uint64 GetRisingEdges() const {
        return m_risingEdges;
    }

    uint64 GetFallingEdges() const {
        return m_fallingEdges;
    }

    // Length in ticks of the run in progress.
    uint64 GetCurrentRun() const {
        return m_currentRun;
    }

private:
    bool m_started;
    bool m_level;
    bool m_edgeSeen;
    bool m_riseSeen;

    uint64 m_currentRun;
    uint64 m_sinceRise;

    uint64 m_lastHighRun;
    uint64 m_lastLowRun;
    uint64 m_lastPeriod;

    uint64 m_risingEdges;
    uint64 m_fallingEdges;
};

/// @brief Observes the generator outputs once per tick and measures the phase widths they describe.
class SignalMonitor {
public:
    SignalMonitor() {
        Reset();
    }

    void Reset();

    /// @brief Records the outputs of one tick.
    /// @param[in] outputs the generator outputs after the tick
    void Sample(const TimingOutputs &outputs);

    const PulseTracker &Active() const {
        return m_active;
    }

    const PulseTracker &HSync() const {
        return m_hSync;
    }

    const PulseTracker &VSync() const {
        return m_vSync;
    }

    uint64 GetSampleCount() const {
        return m_samples;
    }

    // Number of lines with active video between the two most recent VSYNC rising edges, or 0 if fewer than two were
    // seen.
    uint64 GetLastFrameActiveLines() const {
        return m_lastFrameActiveLines;
    }

private:
    PulseTracker m_active;
    PulseTracker m_hSync;
    PulseTracker m_vSync;

    uint64 m_samples;

    uint64 m_activeLines;
    uint64 m_lastFrameActiveLines;
};

} // namespace vgasync::vga
