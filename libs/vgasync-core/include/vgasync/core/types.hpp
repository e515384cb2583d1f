#pragma once

/**
@file
@brief Core type definitions.

Defines aliases for the fixed-width integer types used throughout the library.
*/

#include <cstdint>

using uint32 = uint32_t;
using uint64 = uint64_t;

using sint64 = int64_t;
