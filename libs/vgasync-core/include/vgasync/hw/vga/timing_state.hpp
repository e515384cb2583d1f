#pragma once

#include <vgasync/state/state_timing.hpp>

#include <vgasync/core/types.hpp>

namespace vgasync::vga {

/// @brief Contains the entire state of the timing generator.
///
/// `active`, `hSync` and `vSync` are registered outputs: they are computed from the counter values that entered the
/// previous tick, not from the counters currently held here.
struct TimingState {
    TimingState() {
        Reset();
    }

    /// @brief Restores the state found right after construction.
    ///
    /// The active latch starts high; a reset input drives it low instead (see `Clear`).
    void Reset() {
        Clear();
        active = true;
    }

    /// @brief Forces the counters and output latches to zero.
    void Clear() {
        hPos = 0;
        vPos = 0;
        active = false;
        hSync = false;
        vSync = false;
        frameCount = 0;
    }

    // -------------------------------------------------------------------------
    // Save states

    void SaveState(state::TimingState &state) const {
        state.hPos = hPos;
        state.vPos = vPos;
        state.active = active;
        state.hSync = hSync;
        state.vSync = vSync;
        state.frameCount = frameCount;
    }

    void LoadState(const state::TimingState &state) {
        hPos = state.hPos;
        vPos = state.vPos;
        active = state.active;
        hSync = state.hSync;
        vSync = state.vSync;
        frameCount = state.frameCount;
    }

    // -------------------------------------------------------------------------
    // Counters

    uint32 hPos; // [0, hTotal]; stays within [1, hTotal] after the first line
    uint32 vPos; // [0, vTotal - 1]

    uint64 frameCount; // Frames completed since construction or the last reset

    // -------------------------------------------------------------------------
    // Output latches

    bool active;
    bool hSync;
    bool vSync;
};

} // namespace vgasync::vga
