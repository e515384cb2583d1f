#pragma once

/**
@file
@brief Timing generator callbacks.
*/

#include <vgasync/core/types.hpp>

#include <vgasync/util/callback.hpp>

namespace vgasync::vga {

// Invoked when the emitted HSYNC or VSYNC signal changes level.
// The argument is the new level.
using CBSyncChange = util::OptionalCallback<void(bool level)>;

// Invoked when the vertical counter wraps around to the first line of a new frame.
// The argument is the number of frames completed since construction or the last reset.
using CBFrameStart = util::OptionalCallback<void(uint64 frame)>;

} // namespace vgasync::vga
