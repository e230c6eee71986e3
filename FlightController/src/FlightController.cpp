#include <FlightController/FlightController.hpp>

#include <cmath>
#include <iomanip>
#include <iostream>
#include <numbers>
#include <sstream>

namespace droneinspector::control
{
    namespace
    {
        double secondsOf(std::chrono::steady_clock::time_point t)
        {
            return std::chrono::duration<double>(t.time_since_epoch()).count();
        }
    } // namespace

    FlightController::FlightController(const ControllerConfig &config,
                                       const navigation::NavigationConfig &navigationConfig,
                                       const stabilizer::StabilizerGains &gains,
                                       const mission::InspectionPlan &plan,
                                       platform::PlatformPort &port,
                                       bus::CommunicationBus &bus)
        : m_config(config), m_port(port), m_bus(bus), m_navigation(navigationConfig, plan), m_stabilizer(gains)
    {
        if (m_config.telemetryDecimation == 0)
            m_config.telemetryDecimation = 1;
    }

    void FlightController::announcePlan() const
    {
        const auto &plan = m_navigation.plan();
        const auto &dims = plan.dimensions();
        std::cout << "[DRONE] Starting drone inspection controller...\n"
                  << "[DRONE] Target altitude: " << plan.targetAltitude() << " m\n"
                  << "[DRONE] Flight path: " << dims.length << "m -> turn -> " << dims.breadth << "m -> turn -> "
                  << dims.length << "m -> turn -> " << dims.breadth << "m -> land\n"
                  << "[DRONE] Capturing " << capture::kCapturesPerSide << " images per side ("
                  << capture::kCapturesPerSide * 4 << " total)\n";
    }

    void FlightController::initialize()
    {
        if (m_initialized)
            return;

        if (!m_port.isAvailable())
        {
            SystemEvent fault;
            fault.type = SystemEventType::Fault;
            fault.description = "platform unavailable";
            m_bus.publish(fault);
            throw PlatformUnavailableError("vehicle platform unavailable, flight cannot start");
        }

        announcePlan();

        // Let the sensors settle before trusting the yaw reading.
        const auto start = m_port.read().timestamp;
        while (m_port.read().timestamp - start <= m_config.sensorWarmup)
        {
            if (!m_port.step())
                break;
        }

        const SensorReadings readings = m_port.read();
        m_navigation.calibrateHeading(readings.yaw);
        m_startTime = readings.timestamp;
        m_lastTime = readings.timestamp;
        m_initialized = true;

        std::ostringstream msg;
        msg << std::fixed << std::setprecision(1) << readings.yaw * 180.0f / std::numbers::pi_v<float>;
        std::cout << "[DRONE] Initial yaw: " << msg.str() << " deg\n";
    }

    bool FlightController::tick()
    {
        if (m_navigation.phase() == FlightPhase::Done)
            return false;

        const SensorReadings readings = m_port.read();
        m_lastTime = readings.timestamp;

        ActuatorCommand command;
        updateLedsAndGimbal(readings, command);

        const FlightPhase phaseBefore = m_navigation.phase();
        const navigation::NavigationOutput nav = m_navigation.step(readings);

        if (nav.capture)
            emitCapture(*nav.capture, phaseBefore, readings);

        if (nav.transition)
            reportTransition(*nav.transition, readings);

        ++m_ticks;

        if (m_navigation.phase() == FlightPhase::Done)
        {
            command.rotor_velocities.fill(0.0f);
            m_port.write(command);
            publishTelemetry(readings, nav);
            return false;
        }

        command.rotor_velocities = m_stabilizer.computeRotorVelocities(readings, nav.target_altitude, nav.disturbances);
        m_port.write(command);

        if (m_ticks % m_config.telemetryDecimation == 0)
            publishTelemetry(readings, nav);

        return true;
    }

    FlightSummary FlightController::run()
    {
        initialize();

        while (m_port.step())
        {
            if (!tick())
                break;
        }

        FlightSummary summary;
        summary.ticks = m_ticks;
        summary.captures = m_captures;
        summary.finalPhase = m_navigation.phase();
        summary.elapsedSeconds = std::chrono::duration<double>(m_lastTime - m_startTime).count();

        std::cout << "[DRONE] Controller finished.\n";
        return summary;
    }

    void FlightController::updateLedsAndGimbal(const SensorReadings &readings, ActuatorCommand &command)
    {
        // Front LEDs alternate once per second.
        const bool ledOn = static_cast<long long>(std::floor(secondsOf(readings.timestamp))) % 2 == 1;
        m_port.setLeds(ledOn, !ledOn);

        command.gimbal_roll = m_config.gimbalRollGain * readings.roll_rate;
        command.gimbal_pitch = m_config.gimbalPitchGain * readings.pitch_rate + m_config.cameraTilt;
    }

    void FlightController::reportTransition(const navigation::PhaseTransition &transition, const SensorReadings &readings)
    {
        m_phaseHistory.push_back(transition.to);

        const auto &state = m_navigation.state();
        const auto &plan = m_navigation.plan();
        std::ostringstream msg;
        msg << std::fixed << std::setprecision(1);

        switch (transition.to)
        {
        case FlightPhase::Stabilize:
            msg << "Reached target altitude " << readings.position.z() << "m - stabilizing...";
            break;
        case FlightPhase::Side1:
            msg << "Stabilized. Beginning inspection - SIDE_1 (" << state.currentSideLength(plan) << "m)";
            break;
        case FlightPhase::Side2:
        case FlightPhase::Side3:
        case FlightPhase::Side4:
            msg << "Turn complete. " << phaseName(transition.to) << " (" << state.currentSideLength(plan) << "m)";
            break;
        case FlightPhase::Turn1:
        case FlightPhase::Turn2:
        case FlightPhase::Turn3:
            msg << phaseName(transition.from) << " complete. Turning left 90 deg...";
            break;
        case FlightPhase::Land:
            msg << phaseName(transition.from) << " complete. Inspection finished - landing...";
            break;
        case FlightPhase::Done:
            msg << "Landed. Inspection complete!";
            break;
        case FlightPhase::Takeoff:
            msg << "Taking off";
            break;
        }

        std::cout << "[DRONE] " << msg.str() << "\n";

        SystemEvent event;
        event.timestamp = transition.timestamp;
        event.type = SystemEventType::PhaseTransition;
        event.description = std::string(phaseName(transition.from)) + "->" + std::string(phaseName(transition.to));
        m_bus.publish(event);
    }

    void FlightController::emitCapture(const capture::CaptureTrigger &trigger, FlightPhase phase, const SensorReadings &readings)
    {
        CaptureRequest request;
        request.timestamp = readings.timestamp;
        request.sequence = trigger.sequence;
        request.phase = phase;
        request.photo_index = trigger.photo_index;
        request.distance = trigger.distance;
        request.frame = m_port.captureFrame();
        m_bus.publish(request);
        ++m_captures;

        std::ostringstream msg;
        msg << std::fixed << std::setprecision(1) << trigger.distance;
        std::cout << "[CAMERA] " << phaseName(phase) << " - photo " << trigger.photo_index << "/"
                  << capture::kCapturesPerSide << " at " << msg.str() << "m -> "
                  << "capture_" << std::setw(4) << std::setfill('0') << trigger.sequence << std::setfill(' ') << "\n";

        SystemEvent event;
        event.timestamp = readings.timestamp;
        event.type = SystemEventType::CaptureEmitted;
        event.description = "capture " + std::to_string(trigger.sequence);
        m_bus.publish(event);
    }

    void FlightController::publishTelemetry(const SensorReadings &readings, const navigation::NavigationOutput &nav)
    {
        FlightTelemetry t;
        t.timestamp = readings.timestamp;
        t.phase = m_navigation.phase();
        t.position = readings.position;
        t.attitude = Eigen::Vector3f(readings.roll, readings.pitch, readings.yaw);
        t.target_altitude = nav.target_altitude;
        t.side_progress = nav.side_progress;
        m_bus.publish(t);
    }

    FlightPhase FlightController::phase() const noexcept
    {
        return m_navigation.phase();
    }

    const std::vector<FlightPhase> &FlightController::phaseHistory() const noexcept
    {
        return m_phaseHistory;
    }

    std::uint64_t FlightController::captureCount() const noexcept
    {
        return m_captures;
    }

    std::uint64_t FlightController::tickCount() const noexcept
    {
        return m_ticks;
    }

    const navigation::FlightStateMachine &FlightController::navigation() const noexcept
    {
        return m_navigation;
    }

} // namespace droneinspector::control
