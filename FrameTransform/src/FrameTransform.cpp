#include <FrameTransform/FrameTransform.hpp>

#include <cmath>
#include <numbers>

namespace droneinspector::geometry
{
    BodyDisplacement decompose(const Eigen::Vector2f &displacement, float heading) noexcept
    {
        const float c = std::cos(heading);
        const float s = std::sin(heading);

        BodyDisplacement body;
        body.forward = displacement.x() * c + displacement.y() * s;
        body.lateral = displacement.x() * s - displacement.y() * c;
        return body;
    }

    float normalizeAngle(float angle) noexcept
    {
        constexpr float pi = std::numbers::pi_v<float>;
        constexpr float twoPi = 2.0f * pi;

        if (angle > -pi && angle <= pi)
            return angle; // already wrapped, keeps the operation idempotent

        float wrapped = std::fmod(angle + pi, twoPi);
        if (wrapped <= 0.0f)
            wrapped += twoPi;

        float result = wrapped - pi;
        if (result <= -pi)
            result += twoPi;
        return result;
    }

} // namespace droneinspector::geometry
