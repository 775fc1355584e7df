#pragma once
#include "bounds.hpp"
#include "frustum.hpp"
#include "rangefinder.hpp"
#include "world_transform.hpp"

#include <algorithm>
#include <cstddef>
#include <vector>

namespace spatial {

/**
 * @brief A renderable as seen by the culling pass.
 * @details `bounds` stays in the mesh's local space; `world` places it.
 */
struct CullObject {
    Aabb bounds;
    WorldTransform world;
};

/** @brief A surviving object and its sort key. */
struct VisibleEntry {
    /** @brief Index into the culled object list. */
    std::size_t index = 0;
    /** @brief View-space Z of the object's origin (negative in front of the view). */
    double distance = 0.0;
};

/** @brief Draw order for sort_by_depth. */
enum class DepthOrder {
    /** @brief Nearest first; opaque geometry, to maximise early depth rejection. */
    FrontToBack,
    /** @brief Farthest first; blended geometry. */
    BackToFront,
};

/**
 * @brief Bounding sphere of `aabb` once placed by `world`.
 * @details Encloses every corner of the placed box, sheared or not.
 */
inline BoundingSphere world_bounding_sphere(const Aabb& aabb, const WorldTransform& world) {
    return BoundingSphere{world.transform_point(aabb.center), world.radius(aabb.half_extents)};
}

/**
 * @brief Frustum test for one object.
 * @details The sphere test is cheaper and rejects most invisible objects; only objects it
 * accepts pay for the oriented-box test.
 */
inline bool is_visible(const Frustum& frustum, const Aabb& aabb, const WorldTransform& world,
                       bool intersect_far = true) {
    if (!frustum.intersects_sphere(world_bounding_sphere(aabb, world), intersect_far))
        return false;
    return frustum.intersects_obb(aabb, world, intersect_far);
}

/** @brief Whether the object lies within a point light's range sphere. */
inline bool is_lit_by_point_light(const BoundingSphere& light_range, const Aabb& aabb,
                                  const WorldTransform& world) {
    return light_range.intersects_obb(aabb, world);
}

/**
 * @brief Culls `objects` against `frustum` and records the depth of each survivor.
 * @param out Cleared, then filled with one entry per visible object, in input order.
 */
inline void collect_visible(const Frustum& frustum, const std::vector<CullObject>& objects,
                            const ViewRangefinder& rangefinder, std::vector<VisibleEntry>& out,
                            bool intersect_far = true) {
    out.clear();
    for (std::size_t i = 0; i < objects.size(); ++i) {
        const CullObject& o = objects[i];
        if (is_visible(frustum, o.bounds, o.world, intersect_far))
            out.push_back({i, rangefinder.distance(o.world)});
    }
}

/**
 * @brief Sorts entries by view depth. Equal depths keep their input order.
 */
inline void sort_by_depth(std::vector<VisibleEntry>& entries, DepthOrder order) {
    if (order == DepthOrder::FrontToBack) {
        // View-space Z decreases away from the camera
        std::stable_sort(entries.begin(), entries.end(),
                         [](const VisibleEntry& a, const VisibleEntry& b) {
                             return a.distance > b.distance;
                         });
    } else {
        std::stable_sort(entries.begin(), entries.end(),
                         [](const VisibleEntry& a, const VisibleEntry& b) {
                             return a.distance < b.distance;
                         });
    }
}

} // namespace spatial
