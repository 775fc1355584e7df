#pragma once
#include "config.hpp"
#include "math.hpp"

namespace spatial {

/**
 * @brief An object's transform relative to its parent (or to the world for roots).
 * @details Stores Translation, Rotation (Quaternion) and Scale directly (TRS).
 * This structure is designed for ease of use in gameplay logic: it is mutated freely
 * every frame and converted to an affine map only during propagation to WorldTransform.
 *
 * Points are mapped by scaling first, then rotating, then translating. Zero or negative
 * scale components are representable but produce degenerate or mirrored maps.
 */
struct LocalTransform {
    /** @brief Translation relative to parent. */
    DVec3 translation = DVec3(0.0);
    /** @brief Rotation relative to parent. Defaults to Identity (w = 1). */
    DQuat rotation = quat_identity();
    /** @brief Scale relative to parent. Defaults to (1,1,1). */
    DVec3 scale = DVec3(1.0);

    /** @brief No translation, no rotation, unit scale. */
    static LocalTransform identity() { return LocalTransform{}; }

    /** @brief Creates a transform at `(x, y, z)`. */
    static LocalTransform from_xyz(double x, double y, double z) {
        return from_translation(DVec3(x, y, z));
    }

    static LocalTransform from_translation(const DVec3& translation) {
        LocalTransform t;
        t.translation = translation;
        return t;
    }

    static LocalTransform from_rotation(const DQuat& rotation) {
        LocalTransform t;
        t.rotation = rotation;
        return t;
    }

    static LocalTransform from_scale(const DVec3& scale) {
        LocalTransform t;
        t.scale = scale;
        return t;
    }

    /**
     * @brief Extracts translation, rotation and scale from `matrix`.
     * @details The matrix must be a shear-free 3D affine transform, otherwise the result is
     * an approximation.
     */
    static LocalTransform from_matrix(const DMat4& matrix) {
        const auto srt = Affine3::from_mat4(matrix).to_scale_rotation_translation();
        LocalTransform t;
        t.translation = srt.translation;
        t.rotation = srt.rotation;
        t.scale = srt.scale;
        return t;
    }

    /** @brief Single-precision variant of from_matrix(const DMat4&). */
    static LocalTransform from_matrix(const glm::mat4& matrix) { return from_matrix(DMat4(matrix)); }

    /** @brief Returns a copy rotated so that forward() points at `target` and up() towards `up`. */
    LocalTransform looking_at(const DVec3& target, const DVec3& up) const {
        LocalTransform t = *this;
        t.look_at(target, up);
        return t;
    }

    /** @brief Returns a copy rotated so that forward() points along `direction`. */
    LocalTransform looking_to(const DVec3& direction, const DVec3& up) const {
        LocalTransform t = *this;
        t.look_to(direction, up);
        return t;
    }

    LocalTransform with_translation(const DVec3& value) const {
        LocalTransform t = *this;
        t.translation = value;
        return t;
    }

    LocalTransform with_rotation(const DQuat& value) const {
        LocalTransform t = *this;
        t.rotation = value;
        return t;
    }

    LocalTransform with_scale(const DVec3& value) const {
        LocalTransform t = *this;
        t.scale = value;
        return t;
    }

    /** @brief Returns the 4x4 matrix Translation * Rotation * Scale. */
    DMat4 compute_matrix() const { return compute_affine().to_mat4(); }

    /** @brief Returns the affine map Translation * Rotation * Scale. */
    Affine3 compute_affine() const {
        return Affine3::from_scale_rotation_translation(scale, rotation, translation);
    }

    /** @brief Unit vector along the local X axis. */
    DVec3 local_x() const { return rotation * unit_x(); }
    /** @brief Unit vector along the local Y axis. */
    DVec3 local_y() const { return rotation * unit_y(); }
    /** @brief Unit vector along the local Z axis. */
    DVec3 local_z() const { return rotation * unit_z(); }

    DVec3 right() const { return local_x(); }
    DVec3 left() const { return -local_x(); }
    DVec3 up() const { return local_y(); }
    DVec3 down() const { return -local_y(); }
    /** @brief -Z is forward (right-handed, camera convention). */
    DVec3 forward() const { return -local_z(); }
    DVec3 back() const { return local_z(); }

    /**
     * @brief Rotates by `value`, expressed in the parent's frame.
     * @details Pre-multiplies: `rotation = value * rotation`.
     */
    void rotate(const DQuat& value) { rotation = value * rotation; }

    /** @brief Rotates around a parent-space `axis` (unit length) by `angle` radians. */
    void rotate_axis(const DVec3& axis, double angle) { rotate(glm::angleAxis(angle, axis)); }
    void rotate_x(double angle) { rotate_axis(unit_x(), angle); }
    void rotate_y(double angle) { rotate_axis(unit_y(), angle); }
    void rotate_z(double angle) { rotate_axis(unit_z(), angle); }

    /**
     * @brief Rotates by `value`, expressed in this transform's own frame.
     * @details Post-multiplies: `rotation = rotation * value`.
     */
    void rotate_local(const DQuat& value) { rotation = rotation * value; }

    /** @brief Rotates around a local `axis` (unit length) by `angle` radians. */
    void rotate_local_axis(const DVec3& axis, double angle) {
        rotate_local(glm::angleAxis(angle, axis));
    }
    void rotate_local_x(double angle) { rotate_local_axis(unit_x(), angle); }
    void rotate_local_y(double angle) { rotate_local_axis(unit_y(), angle); }
    void rotate_local_z(double angle) { rotate_local_axis(unit_z(), angle); }

    /** @brief Moves the translation around `point` by `value`; orientation is untouched. */
    void translate_around(const DVec3& point, const DQuat& value) {
        translation = point + value * (translation - point);
    }

    /** @brief Orbits around `point` by `value`, turning the orientation with it. */
    void rotate_around(const DVec3& point, const DQuat& value) {
        translate_around(point, value);
        rotate(value);
    }

    /** @brief Rotates so that forward() points at `target` and up() towards `up`. */
    void look_at(const DVec3& target, const DVec3& up) { look_to(target - translation, up); }

    /**
     * @brief Rotates so that forward() points along `direction` and up() towards `up`.
     * @details `direction` and `up` must be non-zero and not parallel; violating that yields
     * a NaN rotation in release builds. Only the directions of the inputs matter.
     */
    void look_to(const DVec3& direction, const DVec3& up) {
        SPATIAL_ASSERT(glm::dot(direction, direction) > 0.0, "look_to direction must be non-zero");
        const DVec3 forward_axis = -glm::normalize(direction);
        const DVec3 unnormalized_right = glm::cross(glm::normalize(up), forward_axis);
        SPATIAL_ASSERT(glm::dot(unnormalized_right, unnormalized_right) > SPATIAL_PARALLEL_EPSILON,
                       "look_to up must not be parallel to direction");
        const DVec3 right_axis = glm::normalize(unnormalized_right);
        const DVec3 up_axis = glm::cross(forward_axis, right_axis);
        rotation = glm::quat_cast(DMat3(right_axis, up_axis, forward_axis));
    }

    /**
     * @brief Composes `child` (expressed relative to this) into this transform's parent frame.
     * @details Works component by component, so it cannot represent the shear that arises
     * from a rotated child under non-uniform scale. Use WorldTransform for exact composition.
     */
    LocalTransform mul_transform(const LocalTransform& child) const {
        LocalTransform r;
        r.translation = transform_point(child.translation);
        r.rotation = rotation * child.rotation;
        r.scale = scale * child.scale;
        return r;
    }

    /** @brief Applies scale, then rotation, then translation to `point`. */
    DVec3 transform_point(const DVec3& point) const {
        DVec3 p = scale * point;
        p = rotation * p;
        p += translation;
        return p;
    }

    LocalTransform operator*(const LocalTransform& child) const { return mul_transform(child); }
    DVec3 operator*(const DVec3& point) const { return transform_point(point); }

    /** @brief Checks exact equality. */
    bool operator==(const LocalTransform& o) const {
        return translation == o.translation && rotation == o.rotation && scale == o.scale;
    }
    bool operator!=(const LocalTransform& o) const { return !(*this == o); }
};

} // namespace spatial
