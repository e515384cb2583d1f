#include <vgasync/hw/vga/timing_profile.hpp>

#include <vgasync/util/dev_log.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <vector>

namespace vgasync::vga {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // profile

    struct profile {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Profile";
    };

} // namespace grp

static bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

const Preset *FindPreset(std::string_view name) {
    for (const auto &preset : kPresets) {
        if (EqualsIgnoreCase(preset.name, name)) {
            return &preset;
        }
    }
    return nullptr;
}

// -----------------------------------------------------------------------------
// Validation

std::string ProfileCheckResult::string() const {
    switch (type) {
    case Type::Valid: return "Valid";
    case Type::ZeroVisibleArea: return "Visible area is empty";
    case Type::ZeroSyncPulse: return "Sync pulse width is zero";
    case Type::HorizontalTotalMismatch:
        return fmt::format("Horizontal total {} does not match the sum of its phases ({})", total, sum);
    case Type::VerticalTotalMismatch:
        return fmt::format("Vertical total {} does not match the sum of its phases ({})", total, sum);
    default: return "Unspecified error";
    }
}

ProfileCheckResult ValidateProfile(const TimingProfile &profile) {
    if (profile.hVisible == 0 || profile.vVisible == 0) {
        return ProfileCheckResult::ZeroVisibleArea();
    }
    if (profile.hSyncPulse == 0 || profile.vSyncPulse == 0) {
        return ProfileCheckResult::ZeroSyncPulse();
    }

    // Sums are done in 64 bits so that huge widths cannot wrap around into a matching total
    const uint64 hSum = uint64(profile.hVisible) + profile.hFrontPorch + profile.hSyncPulse + profile.hBackPorch;
    if (hSum != profile.hTotal) {
        return ProfileCheckResult::HorizontalTotalMismatch(profile.hTotal, static_cast<uint32>(hSum));
    }
    const uint64 vSum = uint64(profile.vVisible) + profile.vFrontPorch + profile.vSyncPulse + profile.vBackPorch;
    if (vSum != profile.vTotal) {
        return ProfileCheckResult::VerticalTotalMismatch(profile.vTotal, static_cast<uint32>(vSum));
    }
    return ProfileCheckResult::Valid();
}

// -----------------------------------------------------------------------------
// Modelines

std::optional<Modeline> ParseModeline(std::string_view text) {
    std::vector<std::string> tokens{};
    {
        std::istringstream in{std::string{text}};
        std::string token{};
        while (in >> token) {
            tokens.push_back(token);
        }
    }

    Modeline mode{};
    size_t pos = 0;
    if (pos < tokens.size() && EqualsIgnoreCase(tokens[pos], "Modeline")) {
        ++pos;
    }
    if (pos < tokens.size() && tokens[pos].starts_with('"')) {
        // The name may contain spaces; consume tokens until the closing quote
        std::string name = tokens[pos++];
        while (name.size() < 2 || !name.ends_with('"')) {
            if (pos >= tokens.size()) {
                devlog::debug<grp::profile>("Modeline name is missing its closing quote");
                return std::nullopt;
            }
            name += ' ';
            name += tokens[pos++];
        }
        mode.name = name.substr(1, name.size() - 2);
    }

    if (tokens.size() - pos < 9) {
        devlog::debug<grp::profile>("Modeline has too few fields");
        return std::nullopt;
    }

    double clockMHz = 0.0;
    {
        std::istringstream in{tokens[pos++]};
        if (!(in >> clockMHz) || !in.eof() || clockMHz <= 0.0) {
            devlog::debug<grp::profile>("Invalid modeline pixel clock");
            return std::nullopt;
        }
    }
    mode.pixelClockHz = static_cast<uint64>(std::llround(clockMHz * 1'000'000.0));

    std::array<uint32, 8> positions{};
    for (auto &position : positions) {
        std::istringstream in{tokens[pos++]};
        if (!(in >> position) || !in.eof()) {
            devlog::debug<grp::profile>("Invalid modeline position: {}", tokens[pos - 1]);
            return std::nullopt;
        }
    }

    // display, sync start, sync end, total must be monotonic on both axes
    const auto [hDisp, hSyncStart, hSyncEnd, hTotal, vDisp, vSyncStart, vSyncEnd, vTotal] = positions;
    if (hDisp > hSyncStart || hSyncStart > hSyncEnd || hSyncEnd > hTotal) {
        devlog::debug<grp::profile>("Modeline horizontal positions are not monotonic");
        return std::nullopt;
    }
    if (vDisp > vSyncStart || vSyncStart > vSyncEnd || vSyncEnd > vTotal) {
        devlog::debug<grp::profile>("Modeline vertical positions are not monotonic");
        return std::nullopt;
    }

    mode.profile = TimingProfile{
        .hVisible = hDisp,
        .hFrontPorch = hSyncStart - hDisp,
        .hSyncPulse = hSyncEnd - hSyncStart,
        .hBackPorch = hTotal - hSyncEnd,
        .hTotal = hTotal,

        .vVisible = vDisp,
        .vFrontPorch = vSyncStart - vDisp,
        .vSyncPulse = vSyncEnd - vSyncStart,
        .vBackPorch = vTotal - vSyncEnd,
        .vTotal = vTotal,
    };

    for (; pos < tokens.size(); ++pos) {
        const std::string_view flag = tokens[pos];
        if (EqualsIgnoreCase(flag, "+hsync")) {
            mode.hSyncPositive = true;
        } else if (EqualsIgnoreCase(flag, "-hsync")) {
            mode.hSyncPositive = false;
        } else if (EqualsIgnoreCase(flag, "+vsync")) {
            mode.vSyncPositive = true;
        } else if (EqualsIgnoreCase(flag, "-vsync")) {
            mode.vSyncPositive = false;
        } else if (EqualsIgnoreCase(flag, "interlace") || EqualsIgnoreCase(flag, "doublescan")) {
            devlog::debug<grp::profile>("Unsupported modeline flag: {}", flag);
            return std::nullopt;
        } else {
            devlog::debug<grp::profile>("Ignoring unknown modeline flag: {}", flag);
        }
    }

    return mode;
}

} // namespace vgasync::vga
