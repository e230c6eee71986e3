#include <Stabilizer/AttitudeStabilizer.hpp>

#include <algorithm>

namespace droneinspector::stabilizer
{
    AttitudeStabilizer::AttitudeStabilizer(const StabilizerGains &gains) : m_gains(gains) {}

    float AttitudeStabilizer::verticalInput(float targetAltitude, float altitude) const noexcept
    {
        const float clampedError = std::clamp(targetAltitude - altitude + m_gains.verticalOffset, -1.0f, 1.0f);
        return m_gains.verticalP * clampedError * clampedError * clampedError;
    }

    std::array<float, 4> AttitudeStabilizer::computeRotorVelocities(const SensorReadings &readings,
                                                                    float targetAltitude,
                                                                    const ControlDisturbances &disturbances) const noexcept
    {
        // Only the attitude angles are clamped; disturbances pass through untouched.
        const float rollInput = m_gains.rollP * std::clamp(readings.roll, -1.0f, 1.0f) + readings.roll_rate + disturbances.roll;
        const float pitchInput = m_gains.pitchP * std::clamp(readings.pitch, -1.0f, 1.0f) + readings.pitch_rate + disturbances.pitch;
        const float yawInput = disturbances.yaw;

        const float collective = m_gains.verticalThrust + verticalInput(targetAltitude, readings.position.z());

        const float frontLeft = collective - rollInput + pitchInput - yawInput;
        const float frontRight = collective + rollInput + pitchInput + yawInput;
        const float rearLeft = collective - rollInput - pitchInput + yawInput;
        const float rearRight = collective + rollInput - pitchInput - yawInput;

        return {frontLeft, -frontRight, -rearLeft, rearRight};
    }

    const StabilizerGains &AttitudeStabilizer::gains() const noexcept
    {
        return m_gains;
    }

} // namespace droneinspector::stabilizer
