#pragma once

#include <vgasync/hw/vga/timing_profile.hpp>

#include <vgasync/core/types.hpp>

#include <fmt/format.h>

#include <toml++/toml.hpp>

#include <filesystem>
#include <sstream>
#include <string>
#include <variant>

namespace app {

struct ProfileLoadResult {
    enum class Type { Success, TOMLParseError, UnsupportedProfileVersion, InvalidProfile };

    static ProfileLoadResult Success() {
        return {.type = Type::Success};
    }

    static ProfileLoadResult TOMLParseError(toml::parse_error error) {
        return {.type = Type::TOMLParseError, .value = error};
    }

    static ProfileLoadResult UnsupportedProfileVersion(sint64 version) {
        return {.type = Type::UnsupportedProfileVersion, .value = version};
    }

    static ProfileLoadResult InvalidProfile(std::string message) {
        return {.type = Type::InvalidProfile, .value = std::move(message)};
    }

    explicit operator bool() const {
        return type == Type::Success;
    }

    std::string string() const {
        switch (type) {
        case Type::Success: return "Success";
        case Type::TOMLParseError: //
        {
            auto &error = std::get<toml::parse_error>(value);
            std::ostringstream ss{};
            ss << error.source();
            return fmt::format("TOML parse error: {} (at {})", error.description(), ss.str());
        }
        case Type::UnsupportedProfileVersion:
            return fmt::format("Unsupported profile version: {}", std::get<sint64>(value));
        case Type::InvalidProfile: return fmt::format("Invalid profile: {}", std::get<std::string>(value));
        default: return "Unspecified error";
        }
    }

    Type type;
    std::variant<std::monostate, toml::parse_error, sint64, std::string> value;
};

/// @brief A timing profile stored in a TOML file.
///
/// ```toml
/// ProfileVersion = 1
/// Name = "SVGA 800x600 @ 60Hz"
/// PixelClockMHz = 40.0
///
/// [Horizontal]
/// Visible = 800
/// FrontPorch = 40
/// SyncPulse = 128
/// BackPorch = 88
/// Total = 1056
///
/// [Vertical]
/// Visible = 600
/// FrontPorch = 1
/// SyncPulse = 4
/// BackPorch = 23
/// Total = 628
/// ```
///
/// Missing keys keep the values of the default 800x600 @ 60Hz profile.
struct ProfileFile {
    ProfileFile() {
        ResetToDefaults();
    }

    void ResetToDefaults();

    ProfileLoadResult Load(const std::filesystem::path &path);

    std::string name;
    uint64 pixelClockHz;
    vgasync::vga::TimingProfile profile;
};

} // namespace app
