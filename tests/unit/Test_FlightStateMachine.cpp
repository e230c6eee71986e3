#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <Navigation/FlightStateMachine.hpp>
#include <FrameTransform/FrameTransform.hpp>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <numbers>
#include <vector>

using namespace droneinspector;
using namespace std::chrono_literals;
using navigation::FlightStateMachine;
using navigation::NavigationConfig;
using Catch::Approx;

namespace
{
    constexpr float kPi = std::numbers::pi_v<float>;

    // Feeds hand-made readings into the state machine and records what comes out.
    struct ScriptedFlight
    {
        FlightStateMachine sm{NavigationConfig{}, mission::InspectionPlan{}};
        std::chrono::steady_clock::time_point now{};
        Eigen::Vector3f position{Eigen::Vector3f::Zero()};
        float yaw{0.0f};

        std::vector<FlightPhase> phases{FlightPhase::Takeoff};
        std::vector<std::uint64_t> sequences;
        bool originMatchedPhase{true};

        navigation::NavigationOutput step(std::chrono::milliseconds dt = 8ms)
        {
            now += dt;
            SensorReadings r{};
            r.timestamp = now;
            r.yaw = yaw;
            r.position = position;

            auto out = sm.step(r);
            if (out.transition)
                phases.push_back(out.transition->to);
            if (out.capture)
                sequences.push_back(out.capture->sequence);
            if (sm.state().side_origin.has_value() != isSidePhase(sm.phase()))
                originMatchedPhase = false;
            return out;
        }

        // Strafes right along the commanded heading until the side completes.
        void flySide(float heading)
        {
            const FlightPhase side = sm.phase();
            const Eigen::Vector3f origin = position;
            const Eigen::Vector3f right(std::sin(heading), -std::cos(heading), 0.0f);
            yaw = heading > kPi ? heading - 2.0f * kPi : heading;

            for (int i = 1; i <= 400 && sm.phase() == side; ++i)
            {
                position = origin + right * (static_cast<float>(i) / 10.0f);
                step();
            }
        }

        void takeOffAndSettle()
        {
            position.z() = 1.0f;
            step();
            position.z() = 3.8f;
            step();
            step(3100ms);
        }
    };
} // namespace

TEST_CASE("FlightStateMachine visits every phase exactly once in order", "[Navigation]")
{
    ScriptedFlight flight;
    flight.sm.calibrateHeading(0.0f);

    flight.takeOffAndSettle();
    REQUIRE(flight.sm.phase() == FlightPhase::Side1);

    for (int side = 0; side < 4; ++side)
    {
        const float heading = static_cast<float>(side) * kPi / 2.0f;
        flight.flySide(heading);

        if (side < 3)
        {
            REQUIRE(isTurnPhase(flight.sm.phase()));
            REQUIRE(flight.sm.state().turn_target == Approx(heading + kPi / 2.0f));

            // Still pointing the old way: the turn holds.
            flight.step();
            REQUIRE(isTurnPhase(flight.sm.phase()));

            flight.yaw = geometry::normalizeAngle(heading + kPi / 2.0f - 0.01f);
            flight.step();
            REQUIRE(isSidePhase(flight.sm.phase()));
        }
    }

    REQUIRE(flight.sm.phase() == FlightPhase::Land);

    flight.position.z() = 2.0f;
    flight.step();
    REQUIRE(flight.sm.phase() == FlightPhase::Land);
    flight.position.z() = 0.2f;
    flight.step();
    REQUIRE(flight.sm.phase() == FlightPhase::Done);

    // Terminal: further steps change nothing.
    const auto out = flight.step();
    REQUIRE_FALSE(out.transition.has_value());
    REQUIRE(flight.sm.phase() == FlightPhase::Done);

    const std::vector<FlightPhase> expected{
        FlightPhase::Takeoff, FlightPhase::Stabilize,
        FlightPhase::Side1, FlightPhase::Turn1,
        FlightPhase::Side2, FlightPhase::Turn2,
        FlightPhase::Side3, FlightPhase::Turn3,
        FlightPhase::Side4, FlightPhase::Land, FlightPhase::Done};
    REQUIRE(flight.phases == expected);

    REQUIRE(flight.sequences.size() == 16);
    for (std::size_t i = 0; i < flight.sequences.size(); ++i)
        REQUIRE(flight.sequences[i] == i + 1);

    REQUIRE(flight.originMatchedPhase);
    REQUIRE(flight.sm.state().accumulated_heading == Approx(1.5f * kPi));
}

TEST_CASE("FlightStateMachine holds takeoff until just below the target altitude", "[Navigation]")
{
    ScriptedFlight flight;
    flight.position.z() = 3.65f;
    auto out = flight.step();
    REQUIRE(flight.sm.phase() == FlightPhase::Takeoff);
    REQUIRE(out.target_altitude == Approx(4.0f));
    REQUIRE(out.disturbances.roll == 0.0f);
    REQUIRE(out.disturbances.pitch == 0.0f);
    REQUIRE(out.disturbances.yaw == 0.0f);

    flight.position.z() = 3.75f;
    out = flight.step();
    REQUIRE(flight.sm.phase() == FlightPhase::Stabilize);
    REQUIRE(out.transition.has_value());
    REQUIRE(out.transition->from == FlightPhase::Takeoff);
}

TEST_CASE("FlightStateMachine waits out the settle duration before the first side", "[Navigation]")
{
    ScriptedFlight flight;
    flight.position.z() = 4.0f;
    flight.step();
    REQUIRE(flight.sm.phase() == FlightPhase::Stabilize);

    flight.step(3000ms);
    REQUIRE(flight.sm.phase() == FlightPhase::Stabilize);
    REQUIRE_FALSE(flight.sm.state().side_origin.has_value());

    flight.step(1ms);
    REQUIRE(flight.sm.phase() == FlightPhase::Side1);
    REQUIRE(flight.sm.state().side_origin.has_value());
    REQUIRE(flight.sm.state().side_index == 0);
    REQUIRE(flight.sm.captureScheduler().thresholds()[3] == Approx(20.0f));
}

TEST_CASE("Side phase strafes right and corrects drift and heading", "[Navigation]")
{
    ScriptedFlight flight;
    flight.sm.calibrateHeading(0.0f);
    flight.takeOffAndSettle();
    REQUIRE(flight.sm.phase() == FlightPhase::Side1);

    // Drifted 0.5 m toward the face (forward, +X at heading 0), yawed 0.1 rad left.
    flight.position += Eigen::Vector3f(0.5f, -3.0f, 0.0f);
    flight.yaw = 0.1f;
    const auto out = flight.step();

    REQUIRE(out.disturbances.roll == Approx(-1.0f));
    REQUIRE(out.disturbances.pitch == Approx(3.0f * 0.5f));
    REQUIRE(out.disturbances.yaw == Approx(2.0f * -0.1f));
    REQUIRE(out.side_progress == Approx(3.0f));
    REQUIRE_FALSE(out.capture.has_value());
}

TEST_CASE("Heading error wraps across the pi boundary", "[Navigation]")
{
    ScriptedFlight flight;
    flight.sm.calibrateHeading(kPi - 0.05f);
    flight.takeOffAndSettle();

    // Measured yaw just across the wrap point is a small error, not a full turn.
    flight.yaw = -kPi + 0.05f;
    const auto out = flight.step();
    REQUIRE(out.disturbances.yaw == Approx(2.0f * -0.1f).margin(1e-4));
}

TEST_CASE("Land lowers the target altitude each tick and floors it at zero", "[Navigation]")
{
    NavigationConfig cfg;
    cfg.landingStep = 1.5f;

    FlightStateMachine sm(cfg, mission::InspectionPlan{mission::BuildingDimensions{2.0f, 2.0f, 8.0f}});
    sm.calibrateHeading(0.0f);

    std::chrono::steady_clock::time_point now{};
    SensorReadings r{};
    r.position = Eigen::Vector3f(0.0f, 0.0f, 4.0f);

    auto stepAt = [&](std::chrono::milliseconds dt)
    {
        now += dt;
        r.timestamp = now;
        return sm.step(r);
    };

    stepAt(8ms);     // -> Stabilize
    stepAt(3100ms);  // -> Side1
    REQUIRE(sm.phase() == FlightPhase::Side1);

    // Fly each 2 m side in one jump and finish every turn immediately.
    for (int side = 0; side < 4; ++side)
    {
        const float heading = sm.state().accumulated_heading;
        r.position += Eigen::Vector3f(std::sin(heading), -std::cos(heading), 0.0f) * 2.5f;
        stepAt(8ms);
        if (side < 3)
        {
            r.yaw = geometry::normalizeAngle(sm.state().turn_target);
            stepAt(8ms);
        }
    }
    REQUIRE(sm.phase() == FlightPhase::Land);

    REQUIRE(stepAt(8ms).target_altitude == Approx(2.5f));
    REQUIRE(stepAt(8ms).target_altitude == Approx(1.0f));
    REQUIRE(stepAt(8ms).target_altitude == Approx(0.0f));
    REQUIRE(stepAt(8ms).target_altitude == Approx(0.0f));
    REQUIRE(sm.phase() == FlightPhase::Land);

    r.position.z() = 0.1f;
    stepAt(8ms);
    REQUIRE(sm.phase() == FlightPhase::Done);
}
