#pragma once

#include <Eigen/Core>

namespace droneinspector::geometry
{
    // Displacement expressed in the vehicle's body frame.
    struct BodyDisplacement
    {
        float forward{0.0f}; // along the heading (camera direction)
        float lateral{0.0f}; // to the right of the heading (strafe direction)
    };

    /// Projects an absolute-frame displacement onto the body axes for the given heading.
    /// Heading 0 faces +X, counter-clockwise positive. Forward axis is (cos h, sin h),
    /// lateral axis is (sin h, -cos h).
    [[nodiscard]] BodyDisplacement decompose(const Eigen::Vector2f &displacement, float heading) noexcept;

    /// Wraps an angle into (-pi, pi].
    [[nodiscard]] float normalizeAngle(float angle) noexcept;

} // namespace droneinspector::geometry
