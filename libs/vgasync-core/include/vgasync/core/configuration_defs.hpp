#pragma once

/**
@file
@brief Library configuration definitions.
*/

namespace vgasync::core::config {

namespace video {
    /// @brief How the display system treats timing profiles that fail validation.
    enum class ProfileValidation {
        /// @brief Log a warning and use the profile anyway.
        ///
        /// The generator produces a deterministic waveform with the wrong phase widths.
        Warn,

        /// @brief Refuse the profile and keep the current one.
        Reject,
    };
} // namespace video

} // namespace vgasync::core::config
