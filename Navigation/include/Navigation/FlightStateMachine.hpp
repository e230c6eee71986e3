#pragma once

#include <CaptureScheduler/CaptureScheduler.hpp>
#include <DroneInspector/Messages.hpp>
#include <Mission/InspectionPlan.hpp>
#include <Navigation/NavigationState.hpp>

#include <chrono>
#include <optional>

namespace droneinspector::navigation
{
    struct NavigationConfig
    {
        float strafeSpeed = 1.0f;           // roll disturbance magnitude while flying a side
        float forwardCorrectionGain = 3.0f; // pitch disturbance per meter of drift toward the face
        float yawCorrectionGain = 2.0f;     // yaw disturbance per radian of heading error
        float angleTolerance = 0.05f;       // rad, turn completes below this error
        float takeoffMargin = 0.3f;         // m below target altitude that ends takeoff
        float landingStep = 0.005f;         // m of target altitude removed per tick while landing
        float landedAltitude = 0.3f;        // m
        std::chrono::milliseconds settleDuration{3000};
    };

    struct PhaseTransition
    {
        FlightPhase from{FlightPhase::Takeoff};
        FlightPhase to{FlightPhase::Takeoff};
        std::chrono::steady_clock::time_point timestamp;
    };

    // Result of one navigation step.
    struct NavigationOutput
    {
        ControlDisturbances disturbances{};
        float target_altitude{0.0f};
        float side_progress{0.0f}; // |lateral distance| on the current side, 0 outside sides
        std::optional<capture::CaptureTrigger> capture;
        std::optional<PhaseTransition> transition;
    };

    // Discrete controller for the rectangular inspection flight. Called once per tick;
    // decides the disturbances for the stabilizer and drives the capture scheduler.
    class FlightStateMachine
    {
    public:
        FlightStateMachine(const NavigationConfig &config, const mission::InspectionPlan &plan);

        /// Aligns the commanded heading with the measured yaw before the flight starts.
        void calibrateHeading(float initialYaw) noexcept;

        NavigationOutput step(const SensorReadings &readings);

        [[nodiscard]] FlightPhase phase() const noexcept;
        [[nodiscard]] const NavigationState &state() const noexcept;
        [[nodiscard]] const capture::CaptureScheduler &captureScheduler() const noexcept;
        [[nodiscard]] const mission::InspectionPlan &plan() const noexcept;

    private:
        void stepSide(const SensorReadings &readings, NavigationOutput &out);
        void stepTurn(const SensorReadings &readings, NavigationOutput &out);
        void enterPhase(FlightPhase next, std::chrono::steady_clock::time_point now, NavigationOutput &out);
        void beginSide(std::size_t index, const Eigen::Vector3f &position);

        NavigationConfig m_config;
        mission::InspectionPlan m_plan;
        NavigationState m_state;
        capture::CaptureScheduler m_capture;
    };

} // namespace droneinspector::navigation
