#pragma once

/**
 * @file config.hpp
 * @brief Compile-time configuration for the spatial library.
 * @details Every macro here may be defined before the first spatial header is
 * included to override the default.
 */

#include <cassert>

/**
 * @brief Debug-only precondition check.
 * @details Compiled out with NDEBUG. Release builds let degenerate input
 * propagate as NaN/inf instead of trapping.
 */
#ifndef SPATIAL_ASSERT
#define SPATIAL_ASSERT(expr, msg) assert((expr) && (msg))
#endif

/**
 * @brief Smallest squared sine of the angle between `up` and `direction` in `look_to`.
 * @details Below this the two inputs are treated as parallel.
 */
#ifndef SPATIAL_PARALLEL_EPSILON
#define SPATIAL_PARALLEL_EPSILON 1e-12
#endif
