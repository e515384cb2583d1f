#pragma once

/**
@file
@brief Raster timing generator.
*/

#include "timing_callbacks.hpp"
#include "timing_defs.hpp"
#include "timing_profile.hpp"
#include "timing_state.hpp"

#include <vgasync/state/state_timing.hpp>

#include <vgasync/core/types.hpp>

#include <vgasync/util/inline.hpp>

namespace vgasync::vga {

/// @brief Generates the active video, horizontal sync and vertical sync signals of a raster display, one pixel clock
/// tick at a time.
///
/// The generator holds a horizontal and a vertical counter. Every enabled tick advances the horizontal counter; when it
/// reaches the horizontal total, it restarts at 1 and the vertical counter advances, wrapping to 0 after the last line
/// of the frame.
///
/// `hSync` and `vSync` are registered: each tick computes them from the counter values entering the tick, so they lag
/// the counters by one tick. `active` is registered in the same way from the horizontal counter, then gated on the
/// vertical counter as it stands after the tick.
///
/// Inputs resolve in a fixed priority order: `resetActive`, then `sync`, then `enable`.
///
/// The generator never fails. Profiles that don't add up produce deterministic but wrong waveforms; check them with
/// `ValidateProfile` beforehand.
class TimingGenerator {
public:
    explicit TimingGenerator(const TimingProfile &profile);

    /// @brief Returns the generator to the state it had right after construction.
    void Reset();

    /// @brief Switches to a new timing profile and resets the generator.
    ///
    /// Mapped callbacks are kept.
    void SetProfile(const TimingProfile &profile);

    void MapCallbacks(CBSyncChange cbHSyncChange, CBSyncChange cbVSyncChange, CBFrameStart cbFrameStart) {
        m_cbHSyncChange = cbHSyncChange;
        m_cbVSyncChange = cbVSyncChange;
        m_cbFrameStart = cbFrameStart;
    }

    /// @brief Advances the generator by one pixel clock tick.
    /// @param[in] inputs the control inputs sampled on this tick
    /// @return the outputs after the tick
    TimingOutputs Tick(const TimingInputs &inputs);

    // -------------------------------------------------------------------------
    // Accessors

    const TimingProfile &GetProfile() const {
        return m_profile;
    }

    const TimingState &GetState() const {
        return m_state;
    }

    uint32 GetHPos() const {
        return m_state.hPos;
    }

    uint32 GetVPos() const {
        return m_state.vPos;
    }

    uint64 GetFrameCount() const {
        return m_state.frameCount;
    }

    /// @brief Returns the outputs as they currently stand.
    ///
    /// `active` combines the registered horizontal window with the current vertical position, so that active video only
    /// occurs on visible lines.
    FORCE_INLINE TimingOutputs GetOutputs() const {
        return {
            .active = m_state.active && m_state.vPos < m_profile.vVisible,
            .hSync = m_state.hSync,
            .vSync = m_state.vSync,
        };
    }

    // -------------------------------------------------------------------------
    // Save states

    void SaveState(state::TimingState &state) const;
    bool ValidateState(const state::TimingState &state) const;
    void LoadState(const state::TimingState &state);

private:
    TimingProfile m_profile;
    TimingState m_state;

    CBSyncChange m_cbHSyncChange;
    CBSyncChange m_cbVSyncChange;
    CBFrameStart m_cbFrameStart;

    // Advances the counters and recomputes the output latches.
    // Returns true if the vertical counter wrapped around to the first line.
    bool Count();
};

} // namespace vgasync::vga
