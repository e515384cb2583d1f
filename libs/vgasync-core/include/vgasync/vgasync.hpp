#pragma once

/**
@file
@brief The entrypoint of the vgasync library. Includes all functionality needed to generate and measure timings.
*/

#include <vgasync/version.hpp>

#include <vgasync/sys/display_system.hpp>
