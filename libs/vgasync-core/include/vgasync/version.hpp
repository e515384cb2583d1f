#pragma once

/**
@file
@brief vgasync library version definitions.
*/

namespace vgasync::version {

/// @brief The library version string in the format "<major>.<minor>.<patch>".
inline constexpr auto string = VgaSync_VERSION;

inline constexpr auto major = static_cast<unsigned>(VgaSync_VERSION_MAJOR); ///< The library's major version
inline constexpr auto minor = static_cast<unsigned>(VgaSync_VERSION_MINOR); ///< The library's minor version
inline constexpr auto patch = static_cast<unsigned>(VgaSync_VERSION_PATCH); ///< The library's patch version

} // namespace vgasync::version
