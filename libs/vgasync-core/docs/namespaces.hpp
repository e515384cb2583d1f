/**
@file
@brief Namespaces documentation.
*/

/**
@namespace devlog
@brief Development logging utilities.

@namespace devlog::level
@brief Dev log levels.

@namespace util
@brief Utility functions, types, constants and concepts.

@namespace util::detail
@brief Internal implementation details for utilities.

@namespace vgasync
@brief vgasync core namespace.

@namespace vgasync::core
@brief Core components.

@namespace vgasync::core::config
@brief Core configuration.

@namespace vgasync::core::config::video
@brief Display mode parameters.

@namespace vgasync::state
@brief Save state data structures.

@namespace vgasync::state::v1
@brief Save state data structures, version 1.

@namespace vgasync::sys
@brief System components: the pixel clock and scan rate calculations.

@namespace vgasync::version
@brief Library version constants.

@namespace vgasync::vga
@brief Raster timing generation: profiles, the timing generator and the signal monitor.
*/
