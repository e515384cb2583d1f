#include <vgasync/vgasync.hpp>

#include "profile_file.hpp"
#include "report.hpp"
#include "state_file.hpp"

#include <cxxopts.hpp>
#include <fmt/format.h>

#include <optional>
#include <string>

using namespace vgasync;

namespace {

// Exit codes
inline constexpr int kExitMatch = 0;
inline constexpr int kExitMismatch = 1;
inline constexpr int kExitBadArguments = 2;

void ListModes() {
    fmt::print("{:<12} {:<24} {:>12} {:>12} {:>10}\n", "Name", "Description", "Pixel clock", "Line rate",
               "Frame rate");
    for (const auto &preset : vga::kPresets) {
        const auto rates = sys::CalcScanRates(preset.profile, preset.pixelClockHz);
        fmt::print("{:<12} {:<24} {:>8.3f} MHz {:>8.3f} kHz {:>7.3f} Hz\n", preset.name, preset.description,
                   static_cast<double>(preset.pixelClockHz) / 1'000'000.0, rates.lineRateHz / 1000.0,
                   rates.frameRateHz);
    }
}

} // namespace

int main(int argc, char *argv[]) {
    bool showHelp = false;
    bool listModes = false;
    bool strict = false;
    std::string mode{};
    std::string profilePath{};
    std::string modelineText{};
    std::string loadStatePath{};
    std::string saveStatePath{};
    uint64 frames = 3;

    cxxopts::Options options("vgasync-cli", "Raster display timing simulator\nVersion " VgaSync_VERSION);
    options.add_options()("h,help", "Display this help text.", cxxopts::value(showHelp)->default_value("false"));
    options.add_options()("list-modes", "List the built-in display modes and exit.",
                          cxxopts::value(listModes)->default_value("false"));
    options.add_options()("m,mode", "Run a built-in display mode (see --list-modes).", cxxopts::value(mode),
                          "name");
    options.add_options()("p,profile", "Run the timing profile stored in a TOML file.", cxxopts::value(profilePath),
                          "path");
    options.add_options()("modeline", "Run the timing described by an X11 modeline.", cxxopts::value(modelineText),
                          "text");
    options.add_options()("f,frames", "Number of frames to run. Must be at least 2.",
                          cxxopts::value(frames)->default_value("3"), "count");
    options.add_options()("strict", "Refuse to run timing profiles that fail validation.",
                          cxxopts::value(strict)->default_value("false"));
    options.add_options()("load-state", "Resume from a save state before running.", cxxopts::value(loadStatePath),
                          "path");
    options.add_options()("save-state", "Write a save state after running.", cxxopts::value(saveStatePath), "path");

    auto printHelp = [&] {
        fmt::print("{}\n", options.help());
        fmt::print("  At most one of --mode, --profile and --modeline may be given. Without any of them,\n");
        fmt::print("  vgasync-cli runs the default SVGA 800x600 @ 60Hz mode.\n");
        fmt::print("\n");
        fmt::print("  Exit codes:\n");
        fmt::print("    0  all measured phase widths match the profile\n");
        fmt::print("    1  at least one measured phase width differs from the profile\n");
        fmt::print("    2  invalid arguments, the profile could not be loaded or was refused, or a save state\n");
        fmt::print("       could not be read or written\n");
    };

    try {
        options.parse(argc, argv);

        // Show help if requested
        if (showHelp) {
            printHelp();
            return kExitMatch;
        }

        if (listModes) {
            ListModes();
            return kExitMatch;
        }

        const int sources = !mode.empty() + !profilePath.empty() + !modelineText.empty();
        if (sources > 1) {
            fmt::print("Only one of --mode, --profile and --modeline may be given\n");
            fmt::print("\n");
            printHelp();
            return kExitBadArguments;
        }

        // The monitor needs two VSYNC pulses to measure a whole frame
        if (frames < 2) {
            fmt::print("Invalid frame count: {}; at least 2 frames are needed\n", frames);
            return kExitBadArguments;
        }

        DisplaySystem system{};
        if (strict) {
            system.configuration.video.profileValidation = core::config::video::ProfileValidation::Reject;
        }

        std::string modeName{};

        auto applyProfile = [&](const vga::TimingProfile &profile, uint64 pixelClockHz) {
            const vga::ProfileCheckResult result = system.SetProfile(profile, pixelClockHz);
            if (!result) {
                if (strict) {
                    fmt::print("Refusing to run inconsistent profile: {}\n", result.string());
                    return false;
                }
                fmt::print("Warning: inconsistent profile: {}\n", result.string());
            }
            return true;
        };

        if (!mode.empty()) {
            const vga::Preset *preset = vga::FindPreset(mode);
            if (preset == nullptr) {
                fmt::print("Unknown display mode: {}\n", mode);
                fmt::print("Use --list-modes to list the built-in display modes.\n");
                return kExitBadArguments;
            }
            system.configuration.video.preset = std::string{preset->name};
            modeName = preset->description;
        } else if (!profilePath.empty()) {
            app::ProfileFile file{};
            if (auto result = file.Load(profilePath); !result) {
                fmt::print("Could not load profile {}: {}\n", profilePath, result.string());
                return kExitBadArguments;
            }
            if (!applyProfile(file.profile, file.pixelClockHz)) {
                return kExitBadArguments;
            }
            modeName = file.name;
        } else if (!modelineText.empty()) {
            const std::optional<vga::Modeline> modeline = vga::ParseModeline(modelineText);
            if (!modeline) {
                fmt::print("Invalid modeline: {}\n", modelineText);
                return kExitBadArguments;
            }
            if (!applyProfile(modeline->profile, modeline->pixelClockHz)) {
                return kExitBadArguments;
            }
            modeName = modeline->name.empty() ? std::string{"modeline"} : modeline->name;
            fmt::print("Sync polarity: {}hsync {}vsync\n", modeline->hSyncPositive ? '+' : '-',
                       modeline->vSyncPositive ? '+' : '-');
        } else {
            modeName = vga::FindPreset(*system.configuration.video.preset)->description;
        }

        if (!loadStatePath.empty()) {
            state::TimingState state{};
            std::string error{};
            if (!app::ReadStateFile(loadStatePath, state, error)) {
                fmt::print("Could not load save state {}: {}\n", loadStatePath, error);
                return kExitBadArguments;
            }
            if (!system.LoadState(state)) {
                fmt::print("Save state {} does not fit the selected profile\n", loadStatePath);
                return kExitBadArguments;
            }
            // Measure whole frames from here on
            system.RunToEndOfFrame();
        }

        system.RunFrames(frames);

        if (!saveStatePath.empty()) {
            state::TimingState state{};
            system.SaveState(state);
            std::string error{};
            if (!app::WriteStateFile(saveStatePath, state, error)) {
                fmt::print("Could not write save state {}: {}\n", saveStatePath, error);
                return kExitBadArguments;
            }
        }

        const app::PhaseReport report = app::MakeReport(system, modeName, frames);
        app::PrintReport(report);
        return report.AllMatch() ? kExitMatch : kExitMismatch;
    } catch (const cxxopts::exceptions::exception &e) {
        fmt::print("Failed to parse arguments: {}\n", e.what());
        return kExitBadArguments;
    } catch (const std::exception &e) {
        fmt::print("Unhandled exception: {}\n", e.what());
        return kExitBadArguments;
    }
}
