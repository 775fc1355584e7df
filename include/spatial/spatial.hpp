#pragma once

/**
 * @file spatial.hpp
 * @brief Main entry point for the spatial library.
 * @details Includes transforms, bounding volumes, frusta, depth ordering and the
 * propagation and visibility passes.
 */

#include "bounds.hpp"
#include "config.hpp"
#include "frustum.hpp"
#include "math.hpp"
#include "plane.hpp"
#include "projection.hpp"
#include "rangefinder.hpp"
#include "transform.hpp"
#include "transform_propagation.hpp"
#include "visibility.hpp"
#include "world_transform.hpp"
