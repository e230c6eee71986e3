#pragma once

#include <PlatformPort/PlatformPort.hpp>
#include <VirtualTime/VirtualClock.hpp>

#include <atomic>
#include <Eigen/Core>

namespace droneinspector::platform
{
    struct AirframeConfig
    {
        float attitudeResponse = 0.2f; // rad/s of attitude rate per unit of roll/pitch input
        float yawResponse = 1.0f;      // rad/s of yaw rate per unit of yaw input
        float climbResponse = 0.5f;    // m/s of climb per rad/s of collective above hover
        float hoverCollective = 69.148f; // thrust bias plus the vertical offset response at zero error
        float tiltToSpeed = 50.0f;     // m/s of horizontal speed per radian of tilt
        float initialYaw = 0.0f;
        Eigen::Vector3f initialPosition{Eigen::Vector3f::Zero()};
        int cameraWidth = 64;
        int cameraHeight = 48;
        bool available = true;
    };

    // First-order quad-rotor model behind the PlatformPort. Recovers collective, roll,
    // pitch and yaw inputs by inverting the X-configuration mix, then integrates a
    // damped response once per clock step.
    class SimulatedQuadrotor : public PlatformPort
    {
    public:
        SimulatedQuadrotor(const AirframeConfig &config, time::VirtualClock &clock);

        [[nodiscard]] bool isAvailable() const override;
        bool step() override;

        [[nodiscard]] SensorReadings read() const override;
        void write(const ActuatorCommand &command) override;

        void setLeds(bool frontLeft, bool frontRight) override;
        [[nodiscard]] CameraFrame captureFrame() const override;

        /// Stops the host loop: step() returns false from now on.
        void shutdown() noexcept;

        [[nodiscard]] const ActuatorCommand &lastCommand() const noexcept;
        [[nodiscard]] bool frontLeftLed() const noexcept;
        [[nodiscard]] bool frontRightLed() const noexcept;
        [[nodiscard]] Eigen::Vector3f position() const;

    private:
        AirframeConfig m_cfg;
        time::VirtualClock &m_clock;
        std::atomic<bool> m_running{true};

        Eigen::Vector3f m_position{Eigen::Vector3f::Zero()};
        Eigen::Vector3f m_attitude{Eigen::Vector3f::Zero()}; // roll, pitch, yaw
        Eigen::Vector3f m_rates{Eigen::Vector3f::Zero()};

        ActuatorCommand m_command{};
        bool m_frontLeftLed{false};
        bool m_frontRightLed{false};
    };

} // namespace droneinspector::platform
