#pragma once
#include "config.hpp"
#include "math.hpp"
#include "world_transform.hpp"

namespace spatial {

/**
 * @brief Computes the view-space depth of objects, for ordering draw submission.
 * @details Built once per view per frame. Only row 2 of the inverse view matrix is kept:
 * dotted with an object's translation column it yields the view-space Z of the object's
 * origin, without a full matrix multiply per object. Z is negative in front of the camera.
 */
class ViewRangefinder {
public:
    /**
     * @brief Creates a rangefinder for a view.
     * @param view_matrix The view's world matrix (camera-to-world). It must be invertible.
     */
    static ViewRangefinder from_view_matrix(const DMat4& view_matrix) {
        SPATIAL_ASSERT(glm::determinant(view_matrix) != 0.0, "view matrix must be invertible");
        ViewRangefinder r;
        r.inverse_view_row_2_ = glm::row(glm::inverse(view_matrix), 2);
        return r;
    }

    static ViewRangefinder from_view(const WorldTransform& view) {
        return from_view_matrix(view.compute_matrix());
    }

    /** @brief View-space Z of the origin of `transform`. */
    double distance(const DMat4& transform) const {
        return glm::dot(inverse_view_row_2_, transform[3]);
    }

    double distance(const glm::mat4& transform) const {
        return glm::dot(inverse_view_row_2_, DVec4(transform[3]));
    }

    double distance(const WorldTransform& transform) const {
        return glm::dot(inverse_view_row_2_, DVec4(transform.translation(), 1.0));
    }

    const DVec4& inverse_view_row_2() const { return inverse_view_row_2_; }

private:
    DVec4 inverse_view_row_2_ = DVec4(0.0, 0.0, 1.0, 0.0);
};

} // namespace spatial
