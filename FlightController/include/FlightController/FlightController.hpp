#pragma once

#include <CommunicationBus/CommunicationBus.hpp>
#include <DroneInspector/Messages.hpp>
#include <Mission/InspectionPlan.hpp>
#include <Navigation/FlightStateMachine.hpp>
#include <PlatformPort/PlatformPort.hpp>
#include <Stabilizer/AttitudeStabilizer.hpp>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace droneinspector::control
{
    struct ControllerConfig
    {
        float cameraTilt = 0.3f;        // rad, gimbal looks down at the building face
        float gimbalRollGain = -0.115f; // rad per rad/s of roll rate
        float gimbalPitchGain = -0.1f;  // rad per rad/s of pitch rate
        std::chrono::milliseconds sensorWarmup{1000};
        unsigned telemetryDecimation = 10; // publish telemetry every N ticks
    };

    class PlatformUnavailableError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct FlightSummary
    {
        std::uint64_t ticks{0};
        std::uint64_t captures{0};
        FlightPhase finalPhase{FlightPhase::Takeoff};
        double elapsedSeconds{0.0};
    };

    // Per-tick control loop: read the platform, step navigation, mix rotor
    // commands and write them back. Captures, phase changes and telemetry go
    // out on the bus; nothing in the loop blocks on a collaborator.
    class FlightController
    {
    public:
        FlightController(const ControllerConfig &config,
                         const navigation::NavigationConfig &navigationConfig,
                         const stabilizer::StabilizerGains &gains,
                         const mission::InspectionPlan &plan,
                         platform::PlatformPort &port,
                         bus::CommunicationBus &bus);

        /// Throws PlatformUnavailableError if the platform cannot be reached, then waits
        /// out the sensor warm-up and calibrates the commanded heading from the IMU yaw.
        void initialize();

        /// One control step. Returns false once the flight is Done.
        bool tick();

        /// initialize() followed by ticks until Done or the host stops stepping.
        FlightSummary run();

        [[nodiscard]] FlightPhase phase() const noexcept;
        [[nodiscard]] const std::vector<FlightPhase> &phaseHistory() const noexcept;
        [[nodiscard]] std::uint64_t captureCount() const noexcept;
        [[nodiscard]] std::uint64_t tickCount() const noexcept;
        [[nodiscard]] const navigation::FlightStateMachine &navigation() const noexcept;

    private:
        void announcePlan() const;
        void updateLedsAndGimbal(const SensorReadings &readings, ActuatorCommand &command);
        void reportTransition(const navigation::PhaseTransition &transition, const SensorReadings &readings);
        void emitCapture(const capture::CaptureTrigger &trigger, FlightPhase phase, const SensorReadings &readings);
        void publishTelemetry(const SensorReadings &readings, const navigation::NavigationOutput &nav);

        ControllerConfig m_config;
        platform::PlatformPort &m_port;
        bus::CommunicationBus &m_bus;

        navigation::FlightStateMachine m_navigation;
        stabilizer::AttitudeStabilizer m_stabilizer;

        bool m_initialized{false};
        std::uint64_t m_ticks{0};
        std::uint64_t m_captures{0};
        std::chrono::steady_clock::time_point m_startTime{};
        std::chrono::steady_clock::time_point m_lastTime{};
        std::vector<FlightPhase> m_phaseHistory{FlightPhase::Takeoff};
    };

} // namespace droneinspector::control
