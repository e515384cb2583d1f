#pragma once

/**
@file
@brief Raster timing profiles: the front porch/sync pulse/back porch model, built-in presets and validation.
*/

#include <vgasync/core/types.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace vgasync::vga {

/// @brief Horizontal and vertical phase widths of a raster display mode.
///
/// Horizontal widths are measured in pixel clock ticks, vertical widths in lines. Each total is expected to be the
/// sum of its four phase widths. `TimingGenerator` does not check this; use `ValidateProfile` to do so.
struct TimingProfile {
    uint32 hVisible;
    uint32 hFrontPorch;
    uint32 hSyncPulse;
    uint32 hBackPorch;
    uint32 hTotal;

    uint32 vVisible;
    uint32 vFrontPorch;
    uint32 vSyncPulse;
    uint32 vBackPorch;
    uint32 vTotal;

    /// @brief First horizontal position inside the sync pulse.
    constexpr uint32 HSyncStart() const {
        return hVisible + hFrontPorch;
    }

    /// @brief First horizontal position past the sync pulse.
    constexpr uint32 HSyncEnd() const {
        return HSyncStart() + hSyncPulse;
    }

    /// @brief First line inside the vertical sync pulse.
    constexpr uint32 VSyncStart() const {
        return vVisible + vFrontPorch;
    }

    /// @brief First line past the vertical sync pulse.
    constexpr uint32 VSyncEnd() const {
        return VSyncStart() + vSyncPulse;
    }

    constexpr bool operator==(const TimingProfile &) const = default;
};

/// @brief SVGA 800x600 @ 60 Hz, the default profile.
inline constexpr TimingProfile kDefaultProfile{
    .hVisible = 800,
    .hFrontPorch = 40,
    .hSyncPulse = 128,
    .hBackPorch = 88,
    .hTotal = 1056,

    .vVisible = 600,
    .vFrontPorch = 1,
    .vSyncPulse = 4,
    .vBackPorch = 23,
    .vTotal = 628,
};

// -----------------------------------------------------------------------------
// Presets

/// @brief A named built-in display mode.
struct Preset {
    std::string_view name;
    std::string_view description;
    uint64 pixelClockHz;
    TimingProfile profile;
};

// Pixel clocks and porch widths from the VESA DMT tables.
inline constexpr std::array<Preset, 5> kPresets{{
    {"640x480@60", "VGA 640x480 @ 60Hz", 25'175'000, {640, 16, 96, 48, 800, 480, 10, 2, 33, 525}},
    {"640x480@72", "VGA 640x480 @ 72Hz", 31'500'000, {640, 24, 40, 128, 832, 480, 9, 3, 28, 520}},
    {"800x600@60", "SVGA 800x600 @ 60Hz", 40'000'000, kDefaultProfile},
    {"800x600@72", "SVGA 800x600 @ 72Hz", 50'000'000, {800, 56, 120, 64, 1040, 600, 37, 6, 23, 666}},
    {"1024x768@60", "XGA 1024x768 @ 60Hz", 65'000'000, {1024, 24, 136, 160, 1344, 768, 3, 6, 29, 806}},
}};

/// @brief Looks up a preset by name. The comparison is case-insensitive.
/// @param[in] name the preset name, e.g. `"800x600@60"`
/// @return a pointer to the preset, or `nullptr` if there is no preset with that name
const Preset *FindPreset(std::string_view name);

// -----------------------------------------------------------------------------
// Validation

/// @brief The result of checking a timing profile for internal consistency.
struct ProfileCheckResult {
    enum class Type { Valid, ZeroVisibleArea, ZeroSyncPulse, HorizontalTotalMismatch, VerticalTotalMismatch };

    static ProfileCheckResult Valid() {
        return {.type = Type::Valid};
    }

    static ProfileCheckResult ZeroVisibleArea() {
        return {.type = Type::ZeroVisibleArea};
    }

    static ProfileCheckResult ZeroSyncPulse() {
        return {.type = Type::ZeroSyncPulse};
    }

    static ProfileCheckResult HorizontalTotalMismatch(uint32 total, uint32 sum) {
        return {.type = Type::HorizontalTotalMismatch, .total = total, .sum = sum};
    }

    static ProfileCheckResult VerticalTotalMismatch(uint32 total, uint32 sum) {
        return {.type = Type::VerticalTotalMismatch, .total = total, .sum = sum};
    }

    explicit operator bool() const {
        return type == Type::Valid;
    }

    std::string string() const;

    Type type;
    uint32 total = 0; ///< The total width given by the profile (mismatch results only)
    uint32 sum = 0;   ///< The sum of the phase widths (mismatch results only)
};

/// @brief Checks that a profile describes a well-formed raster.
///
/// A well-formed profile has nonzero visible areas and sync pulses, and each total equals the sum of its visible area,
/// front porch, sync pulse and back porch.
ProfileCheckResult ValidateProfile(const TimingProfile &profile);

// -----------------------------------------------------------------------------
// Modelines

/// @brief A display mode parsed from an X11-style modeline.
struct Modeline {
    std::string name;
    uint64 pixelClockHz;
    TimingProfile profile;
    bool hSyncPositive = true;
    bool vSyncPositive = true;
};

/// @brief Parses an X11-style modeline.
///
/// Accepts `[Modeline ["name"]] <MHz> <hdisp> <hsyncstart> <hsyncend> <htotal> <vdisp> <vsyncstart> <vsyncend>
/// <vtotal> [+hsync|-hsync] [+vsync|-vsync]`. Interlaced and double-scan modes are rejected.
///
/// @param[in] text the modeline
/// @return the parsed mode, or `std::nullopt` if the text is malformed or the positions are not monotonic
std::optional<Modeline> ParseModeline(std::string_view text);

} // namespace vgasync::vga
