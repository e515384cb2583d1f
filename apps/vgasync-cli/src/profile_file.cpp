#include "profile_file.hpp"

#include <vgasync/util/dev_log.hpp>
#include <vgasync/util/inline.hpp>

#include <cmath>
#include <limits>
#include <optional>

using namespace vgasync;

namespace app {

// Increment this version when making breaking changes to the profile file structure.
inline constexpr sint64 kProfileVersion = 1;

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // profile_file

    struct profile_file {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "ProfileFile";
    };

} // namespace grp

// -------------------------------------------------------------------------------------------------
// Parsers

// Missing keys leave the value untouched. Keys of the wrong type or out of range fail the parse.
template <typename T>
FORCE_INLINE static bool Parse(toml::node_view<toml::node> &node, const char *name, T &value) {
    toml::node_view view{node[name]};
    if (!view) {
        return true;
    }
    if (auto opt = view.value<T>()) {
        value = *opt;
        return true;
    }
    return false;
}

// Returns the name of the first key that failed to parse.
static std::optional<std::string> ParseAxis(toml::node_view<toml::node> &tbl, const char *axis, uint32 &visible,
                                            uint32 &frontPorch, uint32 &syncPulse, uint32 &backPorch, uint32 &total) {
    auto parse = [&](const char *name, uint32 &value) -> std::optional<std::string> {
        if (!Parse(tbl, name, value)) {
            return fmt::format("{}.{} must be an integer between 0 and {}", axis, name,
                               std::numeric_limits<uint32>::max());
        }
        return std::nullopt;
    };

    if (auto err = parse("Visible", visible)) {
        return err;
    }
    if (auto err = parse("FrontPorch", frontPorch)) {
        return err;
    }
    if (auto err = parse("SyncPulse", syncPulse)) {
        return err;
    }
    if (auto err = parse("BackPorch", backPorch)) {
        return err;
    }
    return parse("Total", total);
}

// -------------------------------------------------------------------------------------------------
// Implementation

void ProfileFile::ResetToDefaults() {
    name.clear();
    pixelClockHz = 40'000'000;
    profile = vga::kDefaultProfile;
}

ProfileLoadResult ProfileFile::Load(const std::filesystem::path &path) {
    auto parseResult = toml::parse_file(path.native());
    if (parseResult.failed()) {
        return ProfileLoadResult::TOMLParseError(parseResult.error());
    }
    auto &data = parseResult.table();

    ResetToDefaults();
    name = path.stem().string();

    sint64 profileVersion = kProfileVersion;
    if (auto opt = data["ProfileVersion"].value<sint64>()) {
        profileVersion = *opt;
    }
    if (profileVersion < 1 || profileVersion > kProfileVersion) {
        return ProfileLoadResult::UnsupportedProfileVersion(profileVersion);
    }

    toml::node_view<toml::node> root{data};
    if (!Parse(root, "Name", name)) {
        return ProfileLoadResult::InvalidProfile("Name must be a string");
    }

    double pixelClockMHz = static_cast<double>(pixelClockHz) / 1'000'000.0;
    if (!Parse(root, "PixelClockMHz", pixelClockMHz) || !std::isfinite(pixelClockMHz) || pixelClockMHz <= 0.0) {
        return ProfileLoadResult::InvalidProfile("PixelClockMHz must be a positive number");
    }
    pixelClockHz = static_cast<uint64>(std::llround(pixelClockMHz * 1'000'000.0));

    if (auto tblHorizontal = data["Horizontal"]) {
        if (auto err = ParseAxis(tblHorizontal, "Horizontal", profile.hVisible, profile.hFrontPorch,
                                 profile.hSyncPulse, profile.hBackPorch, profile.hTotal)) {
            return ProfileLoadResult::InvalidProfile(*err);
        }
    }

    if (auto tblVertical = data["Vertical"]) {
        if (auto err = ParseAxis(tblVertical, "Vertical", profile.vVisible, profile.vFrontPorch, profile.vSyncPulse,
                                 profile.vBackPorch, profile.vTotal)) {
            return ProfileLoadResult::InvalidProfile(*err);
        }
    }

    devlog::debug<grp::profile_file>("Loaded profile \"{}\" from {}", name, path.string());
    return ProfileLoadResult::Success();
}

} // namespace app
