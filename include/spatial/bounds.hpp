#pragma once
#include "math.hpp"
#include "world_transform.hpp"

#include <optional>
#include <vector>

namespace spatial {

struct BoundingSphere;

/**
 * @brief An axis-aligned bounding box stored as center and half-extents.
 * @details Usually computed once from mesh vertices and kept in the mesh's local space;
 * it becomes an oriented box when combined with a WorldTransform at query time.
 * Half-extents are componentwise non-negative. Zero extents describe a point box.
 */
struct Aabb {
    DVec3 center = DVec3(0.0);
    DVec3 half_extents = DVec3(0.0);

    static Aabb from_min_max(const DVec3& minimum, const DVec3& maximum) {
        return Aabb{0.5 * (maximum + minimum), 0.5 * (maximum - minimum)};
    }

    /** @brief Smallest box enclosing `points`; empty input has no box. */
    static std::optional<Aabb> from_points(const std::vector<DVec3>& points) {
        if (points.empty())
            return std::nullopt;
        DVec3 minimum = points.front();
        DVec3 maximum = points.front();
        for (const auto& p : points) {
            minimum = glm::min(minimum, p);
            maximum = glm::max(maximum, p);
        }
        return from_min_max(minimum, maximum);
    }

    /** @brief A cube enclosing `sphere`. */
    static Aabb from_sphere(const BoundingSphere& sphere);

    DVec3 min() const { return center - half_extents; }
    DVec3 max() const { return center + half_extents; }

    /**
     * @brief Half-length of this box, transformed by `axes`, projected onto `normal`.
     * @details `axes` are the images of the local X, Y and Z axes (the columns of the
     * local-to-world linear part; they need not be orthonormal). `normal` must be unit length.
     * Computes |n.ax| hx + |n.ay| hy + |n.az| hz.
     */
    double relative_radius(const DVec3& normal, const DMat3& axes) const {
        const DVec3 projected(glm::dot(normal, axes[0]), glm::dot(normal, axes[1]),
                              glm::dot(normal, axes[2]));
        return glm::dot(glm::abs(projected), half_extents);
    }

    bool operator==(const Aabb& o) const {
        return center == o.center && half_extents == o.half_extents;
    }
    bool operator!=(const Aabb& o) const { return !(*this == o); }
};

/**
 * @brief A bounding sphere.
 * @details Used both for object bounds and for a point light's area of influence.
 */
struct BoundingSphere {
    DVec3 center = DVec3(0.0);
    double radius = 0.0;

    /**
     * @brief Tests whether this sphere overlaps `aabb` transformed by `local_to_world`.
     * @details Projects the box onto the direction between the two centers. This is the
     * point-light-versus-object test. Coincident centers always overlap.
     */
    bool intersects_obb(const Aabb& aabb, const Affine3& local_to_world) const {
        const DVec3 v = local_to_world.transform_point(aabb.center) - center;
        const double d = glm::length(v);
        if (d == 0.0)
            return true;
        const double relative_radius = aabb.relative_radius(v / d, local_to_world.matrix3);
        return d < radius + relative_radius;
    }

    bool intersects_obb(const Aabb& aabb, const DMat4& local_to_world) const {
        return intersects_obb(aabb, Affine3::from_mat4(local_to_world));
    }

    bool intersects_obb(const Aabb& aabb, const WorldTransform& local_to_world) const {
        return intersects_obb(aabb, local_to_world.affine());
    }

    bool operator==(const BoundingSphere& o) const {
        return center == o.center && radius == o.radius;
    }
    bool operator!=(const BoundingSphere& o) const { return !(*this == o); }
};

inline Aabb Aabb::from_sphere(const BoundingSphere& sphere) {
    return Aabb{sphere.center, DVec3(sphere.radius)};
}

} // namespace spatial
