#pragma once

#include <DroneInspector/Messages.hpp>

#include <array>

namespace droneinspector::stabilizer
{
    // Calibration constants of the attitude/altitude loop. Not tuned at runtime.
    struct StabilizerGains
    {
        float verticalThrust = 68.5f; // rad/s, rotor speed that roughly balances gravity
        float verticalOffset = 0.6f;  // m, biases the altitude error toward lift
        float verticalP = 3.0f;
        float rollP = 50.0f;
        float pitchP = 30.0f;
    };

    // Stateless mixer: turns attitude readings, the altitude error and the navigation
    // disturbances into four signed rotor velocities for an X-configuration quad-rotor.
    class AttitudeStabilizer
    {
    public:
        explicit AttitudeStabilizer(const StabilizerGains &gains = {});

        /// Rotor velocities in FL, FR, RL, RR order, already sign-corrected for the two
        /// rotors that spin in the opposite sense (FR and RL).
        [[nodiscard]] std::array<float, 4> computeRotorVelocities(const SensorReadings &readings,
                                                                  float targetAltitude,
                                                                  const ControlDisturbances &disturbances) const noexcept;

        /// Cubic vertical response: verticalP * clamp(target - altitude + verticalOffset, -1, 1)^3.
        [[nodiscard]] float verticalInput(float targetAltitude, float altitude) const noexcept;

        [[nodiscard]] const StabilizerGains &gains() const noexcept;

    private:
        StabilizerGains m_gains;
    };

} // namespace droneinspector::stabilizer
