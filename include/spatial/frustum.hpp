#pragma once
#include "bounds.hpp"
#include "math.hpp"
#include "plane.hpp"
#include "projection.hpp"
#include "transform.hpp"
#include "world_transform.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

#include <glm/gtc/constants.hpp>

namespace spatial {

/** @brief Index of each plane inside a Frustum. */
enum FrustumPlane : std::size_t {
    FRUSTUM_LEFT = 0,
    FRUSTUM_RIGHT = 1,
    FRUSTUM_TOP = 2,
    FRUSTUM_BOTTOM = 3,
    FRUSTUM_NEAR = 4,
    FRUSTUM_FAR = 5,
};

/**
 * @brief A view volume bounded by 6 planes whose normals point inside.
 * @details Planes are ordered left, right, top, bottom, near, far. A frustum is rebuilt
 * every frame for every camera and light; it has no identity beyond that frame.
 *
 * The culling predicates are conservative: they never report a visible object as
 * invisible, but may accept objects just outside a corner where two planes meet.
 */
class Frustum {
public:
    Frustum() = default;

    explicit Frustum(const std::array<Plane, 6>& planes) : planes_(planes) {}

    static Frustum from_planes(const std::array<Plane, 6>& planes) { return Frustum(planes); }

    /**
     * @brief Extracts the frustum of a reverse-Z view-projection matrix.
     * @details Side planes are sums and differences of the matrix rows (Gribb/Hartmann).
     * The near plane is `row3 - row2`, which bounds depth <= 1 in a reverse-Z projection.
     * The far plane is not taken from the matrix: it sits `far` units in front of the view
     * along its forward axis, so projections with an infinite far plane still cull to a
     * finite distance.
     * @param view_projection projection * inverse(view world matrix).
     * @param view_translation World position of the view.
     * @param view_backward Unit vector pointing out of the back of the view (+Z of the view).
     * @param far Culling distance.
     */
    static Frustum from_view_projection(const DMat4& view_projection, const DVec3& view_translation,
                                        const DVec3& view_backward, double far) {
        const DVec4 row3 = glm::row(view_projection, 3);
        std::array<Plane, 6> planes;
        for (std::size_t i = 0; i < FRUSTUM_FAR; ++i) {
            const DVec4 row = glm::row(view_projection, static_cast<glm::length_t>(i / 2));
            planes[i] = Plane((i & 1) == 0 && i != FRUSTUM_NEAR ? row3 + row : row3 - row);
        }
        const DVec3 far_center = view_translation - far * view_backward;
        planes[FRUSTUM_FAR] = Plane(DVec4(view_backward, -glm::dot(view_backward, far_center)));
        return Frustum(planes);
    }

    /**
     * @brief Builds the frustum of a view placed at `view` with `projection`.
     * @details The view matrix is the inverse of the view's world matrix.
     */
    static Frustum from_view(const WorldTransform& view, const DMat4& projection, double far) {
        const DMat4 view_projection = projection * glm::inverse(view.compute_matrix());
        return from_view_projection(view_projection, view.translation(), view.back(), far);
    }

    const std::array<Plane, 6>& planes() const { return planes_; }
    std::array<Plane, 6>& planes() { return planes_; }

    const Plane& plane(FrustumPlane index) const { return planes_[index]; }

    /**
     * @brief Tests a sphere against the frustum.
     * @details Rejects when the sphere lies entirely on the outside of any tested plane.
     * @param intersect_far Whether the far plane takes part in the test.
     */
    bool intersects_sphere(const BoundingSphere& sphere, bool intersect_far) const {
        const DVec4 sphere_center(sphere.center, 1.0);
        const std::size_t count = intersect_far ? 6 : 5;
        for (std::size_t i = 0; i < count; ++i) {
            if (glm::dot(planes_[i].normal_d(), sphere_center) + sphere.radius <= 0.0)
                return false;
        }
        return true;
    }

    /**
     * @brief Tests an oriented box (`aabb` transformed by `model_to_world`) against the frustum.
     * @details For each plane the box is reduced to its projected radius along the plane
     * normal. This is exact per plane but does not test edge/edge axes, so it may accept
     * boxes that a full separating-axis test would reject near frustum corners.
     */
    bool intersects_obb(const Aabb& aabb, const Affine3& model_to_world, bool intersect_far) const {
        const DVec4 aabb_center_world(model_to_world.transform_point(aabb.center), 1.0);
        const std::size_t count = intersect_far ? 6 : 5;
        for (std::size_t i = 0; i < count; ++i) {
            const Plane& p = planes_[i];
            const double relative_radius = aabb.relative_radius(p.normal(), model_to_world.matrix3);
            if (glm::dot(p.normal_d(), aabb_center_world) + relative_radius <= 0.0)
                return false;
        }
        return true;
    }

    bool intersects_obb(const Aabb& aabb, const DMat4& model_to_world, bool intersect_far) const {
        return intersects_obb(aabb, Affine3::from_mat4(model_to_world), intersect_far);
    }

    bool intersects_obb(const Aabb& aabb, const WorldTransform& model_to_world,
                        bool intersect_far) const {
        return intersects_obb(aabb, model_to_world.affine(), intersect_far);
    }

    /** @brief Whether `point` is strictly inside every tested plane. */
    bool contains_point(const DVec3& point, bool intersect_far) const {
        const std::size_t count = intersect_far ? 6 : 5;
        for (std::size_t i = 0; i < count; ++i) {
            if (planes_[i].signed_distance(point) <= 0.0)
                return false;
        }
        return true;
    }

    /**
     * @brief The 8 corners, near face first, each face wound left-top, right-top,
     * right-bottom, left-bottom.
     * @details Intended for debug drawing. Parallel planes produce non-finite corners.
     */
    std::array<DVec3, 8> corners() const {
        std::array<DVec3, 8> out;
        const FrustumPlane depth[2] = {FRUSTUM_NEAR, FRUSTUM_FAR};
        const FrustumPlane sides[4][2] = {{FRUSTUM_LEFT, FRUSTUM_TOP},
                                          {FRUSTUM_RIGHT, FRUSTUM_TOP},
                                          {FRUSTUM_RIGHT, FRUSTUM_BOTTOM},
                                          {FRUSTUM_LEFT, FRUSTUM_BOTTOM}};
        for (int f = 0; f < 2; ++f) {
            for (int c = 0; c < 4; ++c)
                out[f * 4 + c] = intersect_planes(planes_[sides[c][0]], planes_[sides[c][1]],
                                                  planes_[depth[f]]);
        }
        return out;
    }

private:
    static DVec3 intersect_planes(const Plane& a, const Plane& b, const Plane& c) {
        const DVec3 na = a.normal(), nb = b.normal(), nc = c.normal();
        const DVec3 bc = glm::cross(nb, nc);
        const double denom = glm::dot(na, bc);
        return -(a.d() * bc + b.d() * glm::cross(nc, na) + c.d() * glm::cross(na, nb)) / denom;
    }

    std::array<Plane, 6> planes_;
};

/**
 * @brief Six frusta, one per cube face, for omnidirectional (point light) visibility.
 * @details Face order is +X, -X, +Y, -Y, +Z, -Z.
 */
class CubemapFrusta {
public:
    CubemapFrusta() = default;

    explicit CubemapFrusta(const std::array<Frustum, 6>& frusta) : frusta_(frusta) {}

    /**
     * @brief Builds the six 90 degree face frusta around a point light.
     * @details Face orientations follow the OpenGL cube map convention.
     * @param position World position of the light.
     * @param z_near Near plane distance of each face projection.
     * @param far Culling distance, usually the light's range.
     */
    static CubemapFrusta from_point_light(const DVec3& position, double z_near, double far) {
        const DVec3 targets[6] = {unit_x(), -unit_x(), unit_y(), -unit_y(), unit_z(), -unit_z()};
        const DVec3 ups[6] = {-unit_y(), -unit_y(), unit_z(), -unit_z(), -unit_y(), -unit_y()};

        const DMat4 projection = perspective_infinite_reverse(glm::half_pi<double>(), 1.0, z_near);
        std::array<Frustum, 6> frusta;
        for (std::size_t i = 0; i < 6; ++i) {
            const LocalTransform face =
                LocalTransform::from_translation(position).looking_to(targets[i], ups[i]);
            frusta[i] = Frustum::from_view(WorldTransform(face), projection, far);
        }
        return CubemapFrusta(frusta);
    }

    const Frustum& operator[](std::size_t face) const { return frusta_[face]; }
    Frustum& operator[](std::size_t face) { return frusta_[face]; }

    std::array<Frustum, 6>::const_iterator begin() const { return frusta_.begin(); }
    std::array<Frustum, 6>::const_iterator end() const { return frusta_.end(); }
    std::array<Frustum, 6>::iterator begin() { return frusta_.begin(); }
    std::array<Frustum, 6>::iterator end() { return frusta_.end(); }

    /** @brief Whether any face sees the sphere. */
    bool intersects_sphere(const BoundingSphere& sphere, bool intersect_far) const {
        for (const auto& f : frusta_) {
            if (f.intersects_sphere(sphere, intersect_far))
                return true;
        }
        return false;
    }

    /** @brief Whether any face sees the oriented box. */
    bool intersects_obb(const Aabb& aabb, const WorldTransform& model_to_world,
                        bool intersect_far) const {
        return visible_faces_obb(aabb, model_to_world, intersect_far) != 0;
    }

    /** @brief Bit `i` is set when face `i` sees the oriented box. */
    uint8_t visible_faces_obb(const Aabb& aabb, const WorldTransform& model_to_world,
                              bool intersect_far) const {
        uint8_t mask = 0;
        for (std::size_t i = 0; i < 6; ++i) {
            if (frusta_[i].intersects_obb(aabb, model_to_world, intersect_far))
                mask |= static_cast<uint8_t>(1u << i);
        }
        return mask;
    }

private:
    std::array<Frustum, 6> frusta_;
};

} // namespace spatial
