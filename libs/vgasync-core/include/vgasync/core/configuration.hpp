#pragma once

/**
@file
@brief Defines `vgasync::core::Configuration` for configuring the display system.
*/

#include "configuration_defs.hpp"

#include <vgasync/util/observable.hpp>

#include <vgasync/core/types.hpp>

#include <string>

namespace vgasync::core {

/// @brief Display system configuration.
///
/// Observable values notify the display system immediately when assigned. Assign them from the thread that drives the
/// pixel clock.
struct Configuration {
    /// @brief Display mode configuration.
    struct Video {
        /// @brief Name of the built-in preset to run. See `vga::kPresets`.
        ///
        /// Unknown names are ignored and leave the current profile in place.
        util::Observable<std::string> preset = std::string{"800x600@60"};

        /// @brief What to do with timing profiles that fail validation.
        util::Observable<config::video::ProfileValidation> profileValidation = config::video::ProfileValidation::Warn;
    } video;

    /// @brief Power-on signal sequence.
    struct PowerOn {
        /// @brief Number of ticks the generator is held in reset.
        uint32 resetTicks = 1;

        /// @brief Number of ticks the generator is held disabled after reset is released.
        uint32 disableTicks = 1;
    } powerOn;

    /// @brief Notifies all observers registered with all observables.
    ///
    /// This is useful to apply the default values without going through a configuration file.
    void NotifyObservers();
};

} // namespace vgasync::core
