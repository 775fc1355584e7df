#pragma once
#include "math.hpp"

#include <cmath>

#include <glm/gtc/matrix_transform.hpp>

/**
 * @file projection.hpp
 * @brief Projection matrices matching Frustum::from_view_projection.
 * @details All projections here are right-handed (camera looks down -Z) and reverse-Z:
 * depth is 1 at the near plane and 0 at the far plane (or at infinity). The frustum
 * extraction derives its near plane from that convention.
 */

namespace spatial {

/**
 * @brief Reverse-Z perspective projection with the far plane at infinity.
 * @param fov_y Vertical field of view in radians.
 * @param aspect Width over height.
 * @param z_near Distance to the near plane (> 0).
 */
inline DMat4 perspective_infinite_reverse(double fov_y, double aspect, double z_near) {
    const double f = 1.0 / std::tan(0.5 * fov_y);
    DMat4 m(0.0);
    m[0][0] = f / aspect;
    m[1][1] = f;
    m[2][3] = -1.0;
    m[3][2] = z_near;
    return m;
}

/** @brief Reverse-Z perspective projection with a finite far plane. */
inline DMat4 perspective_reverse(double fov_y, double aspect, double z_near, double z_far) {
    // Swapping near and far in a [0, 1] depth projection reverses it.
    return glm::perspectiveRH_ZO(fov_y, aspect, z_far, z_near);
}

/** @brief Reverse-Z orthographic projection, e.g. for directional light shadows. */
inline DMat4 orthographic_reverse(double left, double right, double bottom, double top,
                                  double z_near, double z_far) {
    return glm::orthoRH_ZO(left, right, bottom, top, z_far, z_near);
}

} // namespace spatial
