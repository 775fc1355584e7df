#pragma once

#include "../math.hpp"
#include "../transform.hpp"
#include "../world_transform.hpp"

#include "raylib.h"

/**
 * @file raylib.hpp
 * @brief raylib Integration Bridge.
 * @details Conversions between the library's double-precision types and raylib's
 * single-precision ones, for debug visualisation.
 */

namespace spatial {

inline Vector3 to_raylib(const DVec3& v) {
    return Vector3{static_cast<float>(v.x), static_cast<float>(v.y), static_cast<float>(v.z)};
}

inline DVec3 from_raylib(const Vector3& v) { return DVec3(v.x, v.y, v.z); }

/**
 * @brief World transform of a raylib camera.
 * @details raylib cameras look from `position` towards `target`; the result's forward()
 * is that direction, matching the -Z camera convention of the projections.
 */
inline WorldTransform camera_world_transform(const Camera3D& camera) {
    const LocalTransform t = LocalTransform::from_translation(from_raylib(camera.position))
                                 .looking_at(from_raylib(camera.target), from_raylib(camera.up));
    return WorldTransform(t);
}

} // namespace spatial
