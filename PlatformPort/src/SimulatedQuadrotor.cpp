#include <PlatformPort/SimulatedQuadrotor.hpp>
#include <FrameTransform/FrameTransform.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>

namespace droneinspector::platform
{
    SimulatedQuadrotor::SimulatedQuadrotor(const AirframeConfig &config, time::VirtualClock &clock)
        : m_cfg(config), m_clock(clock)
    {
        m_position = m_cfg.initialPosition;
        m_position.z() = std::max(0.0f, m_position.z());
        m_attitude.z() = geometry::normalizeAngle(m_cfg.initialYaw);
    }

    bool SimulatedQuadrotor::isAvailable() const
    {
        return m_cfg.available;
    }

    void SimulatedQuadrotor::shutdown() noexcept
    {
        m_running = false;
    }

    bool SimulatedQuadrotor::step()
    {
        if (!m_cfg.available || !m_running)
            return false;

        const float dt = static_cast<float>(std::chrono::duration<double>(m_clock.step()).count());

        // Undo the motor sign convention: FR and RL spin in the opposite sense.
        const auto &w = m_command.rotor_velocities;
        const float fl = w[0];
        const float fr = -w[1];
        const float rl = -w[2];
        const float rr = w[3];

        const float collective = 0.25f * (fl + fr + rl + rr);
        const float rollInput = 0.25f * (-fl + fr - rl + rr);
        const float pitchInput = 0.25f * (fl + fr - rl - rr);
        const float yawInput = 0.25f * (-fl + fr + rl - rr);

        // Attitude: the rate opposes the stabilizer's corrective input.
        m_rates.x() = -m_cfg.attitudeResponse * rollInput;
        m_rates.y() = -m_cfg.attitudeResponse * pitchInput;
        m_rates.z() = m_cfg.yawResponse * yawInput;

        m_attitude += m_rates * dt;
        m_attitude.z() = geometry::normalizeAngle(m_attitude.z());

        float climbRate = m_cfg.climbResponse * (collective - m_cfg.hoverCollective);
        const bool grounded = m_position.z() <= 0.0f;
        if (grounded && climbRate < 0.0f)
            climbRate = 0.0f;

        // Horizontal speed follows tilt: roll drifts right, pitch drifts forward.
        Eigen::Vector2f velocity = Eigen::Vector2f::Zero();
        if (!grounded)
        {
            const float forwardSpeed = m_cfg.tiltToSpeed * m_attitude.y();
            const float rightSpeed = m_cfg.tiltToSpeed * m_attitude.x();
            const float c = std::cos(m_attitude.z());
            const float s = std::sin(m_attitude.z());
            velocity.x() = forwardSpeed * c + rightSpeed * s;
            velocity.y() = forwardSpeed * s - rightSpeed * c;
        }

        m_position.x() += velocity.x() * dt;
        m_position.y() += velocity.y() * dt;
        m_position.z() = std::max(0.0f, m_position.z() + climbRate * dt);

        m_clock.tick();
        return true;
    }

    SensorReadings SimulatedQuadrotor::read() const
    {
        SensorReadings r;
        r.timestamp = m_clock.now();
        r.roll = m_attitude.x();
        r.pitch = m_attitude.y();
        r.yaw = m_attitude.z();
        r.roll_rate = m_rates.x();
        r.pitch_rate = m_rates.y();
        r.position = m_position;
        return r;
    }

    void SimulatedQuadrotor::write(const ActuatorCommand &command)
    {
        m_command = command;
    }

    void SimulatedQuadrotor::setLeds(bool frontLeft, bool frontRight)
    {
        m_frontLeftLed = frontLeft;
        m_frontRightLed = frontRight;
    }

    CameraFrame SimulatedQuadrotor::captureFrame() const
    {
        CameraFrame frame;
        frame.timestamp = m_clock.now();
        frame.width = m_cfg.cameraWidth;
        frame.height = m_cfg.cameraHeight;
        frame.rgb.resize(static_cast<std::size_t>(frame.width) * static_cast<std::size_t>(frame.height) * 3);

        // Synthetic facade: a gradient shifted by the camera position so frames differ along a side.
        const int shift = static_cast<int>(std::fabs(m_position.x() + m_position.y()) * 10.0f);
        std::size_t i = 0;
        for (int y = 0; y < frame.height; ++y)
        {
            for (int x = 0; x < frame.width; ++x)
            {
                frame.rgb[i++] = static_cast<std::uint8_t>((x * 4 + shift) % 256);
                frame.rgb[i++] = static_cast<std::uint8_t>((y * 5) % 256);
                frame.rgb[i++] = static_cast<std::uint8_t>(static_cast<int>(m_position.z() * 20.0f) % 256);
            }
        }
        return frame;
    }

    const ActuatorCommand &SimulatedQuadrotor::lastCommand() const noexcept
    {
        return m_command;
    }

    bool SimulatedQuadrotor::frontLeftLed() const noexcept
    {
        return m_frontLeftLed;
    }

    bool SimulatedQuadrotor::frontRightLed() const noexcept
    {
        return m_frontRightLed;
    }

    Eigen::Vector3f SimulatedQuadrotor::position() const
    {
        return m_position;
    }

} // namespace droneinspector::platform
