#pragma once

#include <DroneInspector/FlightPhase.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <Eigen/Core>

namespace droneinspector
{
    // One platform sample: IMU attitude, gyro rates and GPS position.
    struct SensorReadings
    {
        std::chrono::steady_clock::time_point timestamp;

        // Attitude in radians
        float roll{0.0f};
        float pitch{0.0f};
        float yaw{0.0f};

        // Angular rates in rad/s
        float roll_rate{0.0f};
        float pitch_rate{0.0f};

        // Absolute position in meters, z is altitude
        Eigen::Vector3f position{Eigen::Vector3f::Zero()};
    };

    // Navigation intent handed to the stabilizer as additive bias terms.
    struct ControlDisturbances
    {
        float roll{0.0f};
        float pitch{0.0f};
        float yaw{0.0f};
    };

    // Rotor order is front-left, front-right, rear-left, rear-right.
    struct ActuatorCommand
    {
        std::array<float, 4> rotor_velocities{};
        float gimbal_roll{0.0f};
        float gimbal_pitch{0.0f};
    };

    // 8-bit interleaved RGB image from the onboard camera.
    struct CameraFrame
    {
        std::chrono::steady_clock::time_point timestamp;
        int width{0};
        int height{0};
        std::vector<std::uint8_t> rgb;
    };

    // Emitted once per crossed capture threshold; consumed by the image store.
    struct CaptureRequest
    {
        std::chrono::steady_clock::time_point timestamp;
        std::uint64_t sequence{0};
        FlightPhase phase{FlightPhase::Side1};
        std::size_t photo_index{0}; // 1-based within the side
        float distance{0.0f};
        CameraFrame frame;
    };

    struct FlightTelemetry
    {
        std::chrono::steady_clock::time_point timestamp;
        FlightPhase phase{FlightPhase::Takeoff};
        Eigen::Vector3f position{Eigen::Vector3f::Zero()};
        Eigen::Vector3f attitude{Eigen::Vector3f::Zero()}; // roll, pitch, yaw
        float target_altitude{0.0f};
        float side_progress{0.0f};
    };

    enum class SystemEventType
    {
        PhaseTransition,
        CaptureEmitted,
        Fault
    };

    struct SystemEvent
    {
        std::chrono::steady_clock::time_point timestamp;
        SystemEventType type{SystemEventType::PhaseTransition};
        std::string description;
    };
} // namespace droneinspector
