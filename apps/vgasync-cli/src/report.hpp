#pragma once

#include <vgasync/sys/display_system.hpp>

#include <vgasync/core/types.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace app {

/// @brief Phase widths measured by the signal monitor compared against the widths the profile calls for.
struct PhaseReport {
    struct Row {
        std::string_view signal;
        std::string_view measurement;
        uint64 expected;
        uint64 measured;

        bool Matches() const {
            return expected == measured;
        }
    };

    std::string modeName;
    uint64 pixelClockHz;
    vgasync::sys::ScanRates scanRates;
    uint64 frames;
    std::vector<Row> rows;

    bool AllMatch() const;
};

/// @brief Builds a report from the measurements of a display system that has run at least two whole frames.
PhaseReport MakeReport(const vgasync::DisplaySystem &system, std::string_view modeName, uint64 frames);

void PrintReport(const PhaseReport &report);

} // namespace app
