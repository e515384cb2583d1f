#pragma once

/**
@file
@brief Timing generator signal definitions.
*/

#include "timing_profile.hpp"

#include <vgasync/core/types.hpp>

#include <vgasync/util/inline.hpp>
#include <vgasync/util/unreachable.hpp>

#include <string_view>

namespace vgasync::vga {

/// @brief Per-tick control inputs.
struct TimingInputs {
    bool resetActive = false; ///< Forces the counters and outputs to zero. Wins over every other input.
    bool enable = true;       ///< Gates counting and output generation.
    bool sync = false;        ///< Forces the counters and outputs to zero after counting.
};

/// @brief Per-tick outputs.
struct TimingOutputs {
    bool active = false; ///< Inside the visible area
    bool hSync = false;  ///< Horizontal sync pulse
    bool vSync = false;  ///< Vertical sync pulse

    constexpr bool operator==(const TimingOutputs &) const = default;
};

// -----------------------------------------------------------------------------
// Phases

enum class HorizontalPhase { Visible, FrontPorch, Sync, BackPorch };
enum class VerticalPhase { Visible, FrontPorch, Sync, BackPorch };

// Horizontal positions cover [1, hTotal] once the generator is running; position hTotal is the first pixel of the next
// line, and position 0 only occurs on the first line after a reset.
FORCE_INLINE HorizontalPhase GetHorizontalPhase(const TimingProfile &profile, uint32 hPos) {
    if (hPos < profile.hVisible || hPos == profile.hTotal) {
        return HorizontalPhase::Visible;
    }
    if (hPos < profile.HSyncStart()) {
        return HorizontalPhase::FrontPorch;
    }
    if (hPos < profile.HSyncEnd()) {
        return HorizontalPhase::Sync;
    }
    return HorizontalPhase::BackPorch;
}

FORCE_INLINE VerticalPhase GetVerticalPhase(const TimingProfile &profile, uint32 vPos) {
    if (vPos < profile.vVisible) {
        return VerticalPhase::Visible;
    }
    if (vPos < profile.VSyncStart()) {
        return VerticalPhase::FrontPorch;
    }
    if (vPos < profile.VSyncEnd()) {
        return VerticalPhase::Sync;
    }
    return VerticalPhase::BackPorch;
}

inline std::string_view PhaseName(HorizontalPhase phase) {
    switch (phase) {
    case HorizontalPhase::Visible: return "visible";
    case HorizontalPhase::FrontPorch: return "front porch";
    case HorizontalPhase::Sync: return "sync";
    case HorizontalPhase::BackPorch: return "back porch";
    }
    util::unreachable();
}

inline std::string_view PhaseName(VerticalPhase phase) {
    switch (phase) {
    case VerticalPhase::Visible: return "visible";
    case VerticalPhase::FrontPorch: return "front porch";
    case VerticalPhase::Sync: return "sync";
    case VerticalPhase::BackPorch: return "back porch";
    }
    util::unreachable();
}

} // namespace vgasync::vga
