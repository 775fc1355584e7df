#pragma once
#include "config.hpp"
#include "math.hpp"

namespace spatial {

/**
 * @brief A plane defined by a unit normal and a signed distance from the origin.
 * @details A point `p` lies in the plane when `dot(n, p) + d == 0`. For planes bounding a
 * half-space (such as frustum planes), `dot(n, p) + d > 0` is the positive (inside) side.
 */
class Plane {
public:
    /** @brief Zero plane; placeholder until assigned. */
    Plane() = default;

    /**
     * @brief Constructs from a normal (xyz) and a distance along it (w).
     * @details Divides all four components by the length of the normal so that the normal is
     * unit length and `d()` is a true signed distance. A zero normal yields NaN.
     */
    explicit Plane(const DVec4& normal_d) {
        const double length = glm::length(DVec3(normal_d));
        SPATIAL_ASSERT(length > 0.0, "plane normal must be non-zero");
        normal_d_ = normal_d * (1.0 / length);
    }

    /** @brief Unit normal. */
    DVec3 normal() const { return DVec3(normal_d_); }

    /** @brief Signed distance such that `dot(normal(), p) + d() == 0` on the plane. */
    double d() const { return normal_d_.w; }

    /** @brief Normal and distance packed as (nx, ny, nz, d). */
    const DVec4& normal_d() const { return normal_d_; }

    /** @brief Signed distance of `point`; positive on the inside. */
    double signed_distance(const DVec3& point) const {
        return glm::dot(normal_d_, DVec4(point, 1.0));
    }

private:
    DVec4 normal_d_ = DVec4(0.0);
};

} // namespace spatial
