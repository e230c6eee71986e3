#include <Navigation/FlightStateMachine.hpp>
#include <FrameTransform/FrameTransform.hpp>

#include <algorithm>
#include <cmath>
#include <numbers>

namespace droneinspector::navigation
{
    FlightStateMachine::FlightStateMachine(const NavigationConfig &config, const mission::InspectionPlan &plan)
        : m_config(config), m_plan(plan)
    {
        m_state.target_altitude = m_plan.targetAltitude();
    }

    void FlightStateMachine::calibrateHeading(float initialYaw) noexcept
    {
        m_state.accumulated_heading = initialYaw;
        m_state.turn_target = initialYaw;
    }

    FlightPhase FlightStateMachine::phase() const noexcept
    {
        return m_state.phase;
    }

    const NavigationState &FlightStateMachine::state() const noexcept
    {
        return m_state;
    }

    const capture::CaptureScheduler &FlightStateMachine::captureScheduler() const noexcept
    {
        return m_capture;
    }

    const mission::InspectionPlan &FlightStateMachine::plan() const noexcept
    {
        return m_plan;
    }

    void FlightStateMachine::enterPhase(FlightPhase next, std::chrono::steady_clock::time_point now, NavigationOutput &out)
    {
        out.transition = PhaseTransition{m_state.phase, next, now};
        m_state.phase = next;
        m_state.phase_entry_time = now;

        if (!isSidePhase(next))
            m_state.side_origin.reset();
    }

    void FlightStateMachine::beginSide(std::size_t index, const Eigen::Vector3f &position)
    {
        m_state.beginSide(m_plan, index, position);
        m_capture.beginSide(m_state.currentSideLength(m_plan));
    }

    NavigationOutput FlightStateMachine::step(const SensorReadings &readings)
    {
        NavigationOutput out;
        const float altitude = readings.position.z();

        switch (m_state.phase)
        {
        case FlightPhase::Takeoff:
            if (altitude > m_plan.targetAltitude() - m_config.takeoffMargin)
                enterPhase(FlightPhase::Stabilize, readings.timestamp, out);
            break;

        case FlightPhase::Stabilize:
            if (readings.timestamp - m_state.phase_entry_time > m_config.settleDuration)
            {
                enterPhase(FlightPhase::Side1, readings.timestamp, out);
                beginSide(0, readings.position);
            }
            break;

        case FlightPhase::Side1:
        case FlightPhase::Side2:
        case FlightPhase::Side3:
        case FlightPhase::Side4:
            stepSide(readings, out);
            break;

        case FlightPhase::Turn1:
        case FlightPhase::Turn2:
        case FlightPhase::Turn3:
            stepTurn(readings, out);
            break;

        case FlightPhase::Land:
            m_state.target_altitude = std::max(0.0f, m_state.target_altitude - m_config.landingStep);
            if (altitude < m_config.landedAltitude)
                enterPhase(FlightPhase::Done, readings.timestamp, out);
            break;

        case FlightPhase::Done:
            break;
        }

        out.target_altitude = m_state.target_altitude;
        return out;
    }

    void FlightStateMachine::stepSide(const SensorReadings &readings, NavigationOutput &out)
    {
        // Strafe right; negative roll disturbance tilts the vehicle to the right.
        out.disturbances.roll = -m_config.strafeSpeed;

        const Eigen::Vector3f origin = m_state.side_origin.value_or(readings.position);
        const Eigen::Vector2f displacement = (readings.position - origin).head<2>();
        const auto body = geometry::decompose(displacement, m_state.accumulated_heading);

        // Positive pitch disturbance pushes the vehicle back, away from the building face.
        out.disturbances.pitch = m_config.forwardCorrectionGain * body.forward;

        const float yawError = geometry::normalizeAngle(m_state.accumulated_heading - readings.yaw);
        out.disturbances.yaw = m_config.yawCorrectionGain * yawError;

        const float distance = std::fabs(body.lateral);
        out.side_progress = distance;
        out.capture = m_capture.onProgress(distance);

        if (distance < m_state.currentSideLength(m_plan))
            return;

        if (m_state.phase == FlightPhase::Side4)
        {
            enterPhase(FlightPhase::Land, readings.timestamp, out);
            return;
        }

        // Turn left by a quarter revolution before the next side.
        m_state.accumulated_heading += std::numbers::pi_v<float> / 2.0f;
        m_state.turn_target = m_state.accumulated_heading;
        enterPhase(successor(m_state.phase), readings.timestamp, out);
    }

    void FlightStateMachine::stepTurn(const SensorReadings &readings, NavigationOutput &out)
    {
        const float yawError = geometry::normalizeAngle(m_state.turn_target - readings.yaw);
        out.disturbances.yaw = m_config.yawCorrectionGain * yawError;

        if (std::fabs(yawError) >= m_config.angleTolerance)
            return;

        const FlightPhase next = successor(m_state.phase);
        enterPhase(next, readings.timestamp, out);
        beginSide(sideIndexOf(next), readings.position);
    }

} // namespace droneinspector::navigation
