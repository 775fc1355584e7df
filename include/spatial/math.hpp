#pragma once
#include "config.hpp"

// We are committing to GLM as our backend implementation
#include <glm/glm.hpp>
#include <glm/gtc/matrix_access.hpp>
#include <glm/gtc/quaternion.hpp>

namespace spatial {

/** @brief Double-precision 3-vector. Source of truth for positions and extents. */
using DVec3 = glm::dvec3;
/** @brief Double-precision 4-vector (planes, homogeneous points). */
using DVec4 = glm::dvec4;
/** @brief Double-precision unit quaternion. */
using DQuat = glm::dquat;
/** @brief Double-precision 3x3 matrix, column-major. */
using DMat3 = glm::dmat3;
/**
 * @brief Double-precision 4x4 matrix.
 * @details Stored in column-major order (OpenGL style), `m[3]` is the translation column.
 */
using DMat4 = glm::dmat4;

/** @brief Unit X axis. */
inline DVec3 unit_x() { return DVec3(1.0, 0.0, 0.0); }
/** @brief Unit Y axis. */
inline DVec3 unit_y() { return DVec3(0.0, 1.0, 0.0); }
/** @brief Unit Z axis. */
inline DVec3 unit_z() { return DVec3(0.0, 0.0, 1.0); }

/** @brief Identity rotation (w = 1). */
inline DQuat quat_identity() { return DQuat(1.0, 0.0, 0.0, 0.0); }

/**
 * @brief Result of decomposing an affine map into scale, rotation and translation.
 * @details Usable with structured bindings: `auto [s, r, t] = a.to_scale_rotation_translation();`
 */
struct ScaleRotationTranslation {
    DVec3 scale;
    DQuat rotation;
    DVec3 translation;
};

/**
 * @brief A 3D affine transform: a 3x3 linear part followed by a translation.
 * @details Applied as `p' = matrix3 * p + translation`. The linear part may contain
 * rotation, non-uniform scale and shear. The implicit fourth row is (0, 0, 0, 1).
 */
struct Affine3 {
    /** @brief Linear part. Columns are the images of the local X, Y and Z axes. */
    DMat3 matrix3 = DMat3(1.0);
    /** @brief Translation part. */
    DVec3 translation = DVec3(0.0);

    /** @brief Creates a pure translation. */
    static Affine3 from_translation(const DVec3& translation) {
        Affine3 a;
        a.translation = translation;
        return a;
    }

    /** @brief Creates a pure (possibly non-uniform) scale. */
    static Affine3 from_scale(const DVec3& scale) {
        Affine3 a;
        a.matrix3[0][0] = scale.x;
        a.matrix3[1][1] = scale.y;
        a.matrix3[2][2] = scale.z;
        return a;
    }

    /** @brief Creates a rotation followed by a translation. */
    static Affine3 from_rotation_translation(const DQuat& rotation, const DVec3& translation) {
        Affine3 a;
        a.matrix3 = glm::mat3_cast(rotation);
        a.translation = translation;
        return a;
    }

    /**
     * @brief Composes an affine map from scale, rotation and translation.
     * @details Computes M = Translation * Rotation * Scale.
     * @param scale The scale vector.
     * @param rotation The rotation quaternion.
     * @param translation The translation vector.
     * @return The composed transform.
     */
    static Affine3 from_scale_rotation_translation(const DVec3& scale, const DQuat& rotation,
                                                   const DVec3& translation) {
        Affine3 a;

        // 1. Rotation (Quat -> Mat3)
        a.matrix3 = glm::mat3_cast(rotation);

        // 2. Scale (Apply to columns 0, 1, 2)
        a.matrix3[0] *= scale.x;
        a.matrix3[1] *= scale.y;
        a.matrix3[2] *= scale.z;

        // 3. Translation
        a.translation = translation;
        return a;
    }

    /**
     * @brief Extracts the affine part of a 4x4 matrix.
     * @details The bottom row is ignored; the matrix is expected to be affine.
     */
    static Affine3 from_mat4(const DMat4& m) {
        Affine3 a;
        a.matrix3 = DMat3(m);
        a.translation = DVec3(m[3]);
        return a;
    }

    /** @brief Expands to a 4x4 matrix with bottom row (0, 0, 0, 1). */
    DMat4 to_mat4() const {
        DMat4 m(matrix3);
        m[3] = DVec4(translation, 1.0);
        return m;
    }

    /** @brief Applies the linear part and the translation to `point`. */
    DVec3 transform_point(const DVec3& point) const { return matrix3 * point + translation; }

    /** @brief Applies only the linear part to `vector`. */
    DVec3 transform_vector(const DVec3& vector) const { return matrix3 * vector; }

    /**
     * @brief Decomposes into scale, rotation and translation.
     * @details Valid only for non-degenerate maps without shear; shear is not detected
     * and yields a meaningless rotation. A negative determinant (mirroring) is folded
     * into the sign of the X scale.
     */
    ScaleRotationTranslation to_scale_rotation_translation() const {
        const double det = glm::determinant(matrix3);
        const DVec3 scale(glm::length(matrix3[0]) * (det < 0.0 ? -1.0 : 1.0),
                          glm::length(matrix3[1]), glm::length(matrix3[2]));

        const DVec3 inv_scale = 1.0 / scale;
        const DMat3 rotation_matrix(matrix3[0] * inv_scale.x, matrix3[1] * inv_scale.y,
                                    matrix3[2] * inv_scale.z);

        return {scale, glm::quat_cast(rotation_matrix), translation};
    }

    /** @brief Composition: `(a * b).transform_point(p) == a.transform_point(b.transform_point(p))`. */
    Affine3 operator*(const Affine3& o) const {
        Affine3 r;
        r.matrix3 = matrix3 * o.matrix3;
        r.translation = matrix3 * o.translation + translation;
        return r;
    }

    /** @brief Checks exact equality. */
    bool operator==(const Affine3& o) const {
        return matrix3 == o.matrix3 && translation == o.translation;
    }
    bool operator!=(const Affine3& o) const { return !(*this == o); }
};

} // namespace spatial
