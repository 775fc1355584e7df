#pragma once
#include "math.hpp"
#include "transform.hpp"

#include <cmath>

namespace spatial {

/**
 * @brief An object's resolved transform from local space to world space.
 * @details Computed by combining the `LocalTransform` with the parent's `WorldTransform`,
 * usually by `propagate_transforms`. This is the transform used for culling and rendering.
 *
 * Stored as a single affine map, never as translation/rotation/scale: composing a rotated
 * child under a non-uniformly scaled parent produces shear, which TRS cannot express.
 * `compute_transform()` is the lossy way back for callers who know there is no shear.
 */
class WorldTransform {
public:
    /** @brief Default constructor initializes to Identity. */
    WorldTransform() = default;

    explicit WorldTransform(const Affine3& affine) : affine_(affine) {}

    /** @brief Converts a local transform as if it had no parent. */
    explicit WorldTransform(const LocalTransform& local) : affine_(local.compute_affine()) {}

    /** @brief Takes the affine part of `matrix`; the bottom row is ignored. */
    explicit WorldTransform(const DMat4& matrix) : affine_(Affine3::from_mat4(matrix)) {}

    /** @brief Maps every point to itself. */
    static WorldTransform identity() { return WorldTransform{}; }

    static WorldTransform from_xyz(double x, double y, double z) {
        return from_translation(DVec3(x, y, z));
    }

    static WorldTransform from_translation(const DVec3& translation) {
        return WorldTransform(Affine3::from_translation(translation));
    }

    static WorldTransform from_rotation(const DQuat& rotation) {
        return WorldTransform(Affine3::from_rotation_translation(rotation, DVec3(0.0)));
    }

    static WorldTransform from_scale(const DVec3& scale) {
        return WorldTransform(Affine3::from_scale(scale));
    }

    /** @brief Returns the affine map as a 4x4 matrix. */
    DMat4 compute_matrix() const { return affine_.to_mat4(); }

    /** @brief Returns the affine map as a single-precision matrix, for GPU upload. */
    glm::mat4 compute_matrix_f32() const { return glm::mat4(affine_.to_mat4()); }

    /** @brief Returns the underlying affine map. */
    const Affine3& affine() const { return affine_; }

    /**
     * @brief Decomposes into a LocalTransform.
     * @details The transform is expected to be non-degenerate and without shear, or the
     * output will be invalid. Shear is not detected.
     */
    LocalTransform compute_transform() const {
        const auto srt = affine_.to_scale_rotation_translation();
        LocalTransform t;
        t.translation = srt.translation;
        t.rotation = srt.rotation;
        t.scale = srt.scale;
        return t;
    }

    /**
     * @brief Extracts scale, rotation and translation.
     * @details Same constraints as compute_transform().
     */
    ScaleRotationTranslation to_scale_rotation_translation() const {
        return affine_.to_scale_rotation_translation();
    }

    // Directions are the normalized columns of the linear part. Uniform scale is tolerated;
    // non-uniform scale or shear bends them away from the true rotated axes.

    DVec3 right() const { return glm::normalize(affine_.matrix3[0]); }
    DVec3 left() const { return -right(); }
    DVec3 up() const { return glm::normalize(affine_.matrix3[1]); }
    DVec3 down() const { return -up(); }
    DVec3 back() const { return glm::normalize(affine_.matrix3[2]); }
    DVec3 forward() const { return -back(); }

    /** @brief World-space position of the local origin. */
    const DVec3& translation() const { return affine_.translation; }

    glm::vec3 translation_f32() const { return glm::vec3(affine_.translation); }

    /** @brief Mutable access to the translation, for snapping without recomposition. */
    DVec3& translation_mut() { return affine_.translation; }

    /**
     * @brief World-space distance from a box's center to its farthest corner.
     * @details The box has half-size `extents` in local space. Every corner is checked
     * (opposite corners pair up, so four suffice), which keeps the bound exact when the
     * linear part carries shear.
     */
    double radius(const DVec3& extents) const {
        const DMat3& m = affine_.matrix3;
        const DVec3 x = m[0] * extents.x;
        const DVec3 y = m[1] * extents.y;
        const DVec3 z = m[2] * extents.z;
        double r2 = glm::dot(x + y + z, x + y + z);
        r2 = glm::max(r2, glm::dot(x + y - z, x + y - z));
        r2 = glm::max(r2, glm::dot(x - y + z, x - y + z));
        r2 = glm::max(r2, glm::dot(x - y - z, x - y - z));
        return std::sqrt(r2);
    }

    /** @brief Maps a local-space point into world space, applying shear, scale, rotation and translation. */
    DVec3 transform_point(const DVec3& point) const { return affine_.transform_point(point); }

    glm::vec3 transform_point(const glm::vec3& point) const {
        return glm::vec3(affine_.transform_point(DVec3(point)));
    }

    /**
     * @brief Composes a child's local transform under this one.
     * @details Multiplies the affine maps directly, so scale and shear compound exactly.
     */
    WorldTransform mul_transform(const LocalTransform& child) const {
        return WorldTransform(affine_ * child.compute_affine());
    }

    WorldTransform operator*(const WorldTransform& o) const {
        return WorldTransform(affine_ * o.affine_);
    }
    WorldTransform operator*(const LocalTransform& child) const { return mul_transform(child); }
    DVec3 operator*(const DVec3& point) const { return transform_point(point); }

    /** @brief Checks exact equality. */
    bool operator==(const WorldTransform& o) const { return affine_ == o.affine_; }
    bool operator!=(const WorldTransform& o) const { return !(*this == o); }

private:
    Affine3 affine_;
};

} // namespace spatial
