#pragma once

/**
@file
@brief Defines the `util::unreachable()` function that marks code as unreachable.
*/

namespace util {

/// @brief Marks a point in code as unreachable.
///
/// Used after exhaustive `switch` statements over enums to silence missing return warnings.
[[noreturn]] inline void unreachable() {
#if defined(__clang__) || defined(__GNUC__) || defined(__GNUG__)
    __builtin_unreachable();
#elif defined(_MSC_VER)
    __assume(0);
#endif
}

} // namespace util
