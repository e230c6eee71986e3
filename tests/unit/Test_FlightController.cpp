#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <CommunicationBus/CommunicationBus.hpp>
#include <FlightController/FlightController.hpp>
#include <PlatformPort/SimulatedQuadrotor.hpp>
#include <VirtualTime/VirtualClock.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <vector>

using namespace droneinspector;
using namespace std::chrono_literals;
using Catch::Approx;

namespace
{
    // Upper bound on control steps for one full inspection (about 240 s of flight).
    constexpr int kMaxTicks = 30000;

    const std::vector<FlightPhase> kNominalHistory{
        FlightPhase::Takeoff, FlightPhase::Stabilize,
        FlightPhase::Side1, FlightPhase::Turn1,
        FlightPhase::Side2, FlightPhase::Turn2,
        FlightPhase::Side3, FlightPhase::Turn3,
        FlightPhase::Side4, FlightPhase::Land, FlightPhase::Done};

    struct Rig
    {
        explicit Rig(const mission::BuildingDimensions &dims = {}, const platform::AirframeConfig &airframe = {})
            : quad(airframe, clock),
              controller(control::ControllerConfig{}, navigation::NavigationConfig{}, stabilizer::StabilizerGains{},
                         mission::InspectionPlan(dims), quad, bus)
        {
        }

        // Same loop as FlightController::run(), bounded so a diverging flight fails instead of hanging.
        void flyToCompletion()
        {
            controller.initialize();
            for (int i = 0; i < kMaxTicks && quad.step(); ++i)
            {
                if (!controller.tick())
                    break;
            }
        }

        time::VirtualClock clock;
        bus::CommunicationBus bus;
        platform::SimulatedQuadrotor quad;
        control::FlightController controller;
    };
} // namespace

TEST_CASE("FlightController inspects the default building end to end", "[FlightController]")
{
    Rig rig;

    std::mutex m;
    std::vector<CaptureRequest> captures;
    std::vector<SystemEvent> transitions;
    std::size_t telemetry = 0;

    rig.bus.subscribe([&](const CaptureRequest &r)
                      {
                          std::lock_guard<std::mutex> lock(m);
                          captures.push_back(r);
                      });
    rig.bus.subscribe([&](const SystemEvent &e)
                      {
                          std::lock_guard<std::mutex> lock(m);
                          if (e.type == SystemEventType::PhaseTransition)
                              transitions.push_back(e);
                      });
    rig.bus.subscribe([&](const FlightTelemetry &)
                      {
                          std::lock_guard<std::mutex> lock(m);
                          ++telemetry;
                      });
    rig.bus.start();

    rig.flyToCompletion();
    rig.bus.stop();

    REQUIRE(rig.controller.phase() == FlightPhase::Done);
    REQUIRE(rig.controller.phaseHistory() == kNominalHistory);
    REQUIRE(rig.controller.captureCount() == 16);
    REQUIRE(rig.controller.tickCount() < static_cast<std::uint64_t>(kMaxTicks));

    // Rotors are stopped once landed and the controller refuses further ticks.
    const auto &rotors = rig.quad.lastCommand().rotor_velocities;
    REQUIRE(std::all_of(rotors.begin(), rotors.end(), [](float w)
                        { return w == 0.0f; }));
    REQUIRE(rig.quad.position().z() < 0.3f);
    REQUIRE_FALSE(rig.controller.tick());

    std::lock_guard<std::mutex> lock(m);
    REQUIRE(captures.size() == 16);
    for (std::size_t i = 0; i < captures.size(); ++i)
    {
        INFO("capture " << i);
        REQUIRE(captures[i].sequence == i + 1);
        REQUIRE(captures[i].photo_index == i % 4 + 1);
        REQUIRE(isSidePhase(captures[i].phase));
        REQUIRE(sideIndexOf(captures[i].phase) == i / 4);
        REQUIRE_FALSE(captures[i].frame.rgb.empty());
    }

    // Side 1 is the 20 m length: thresholds at 5, 10, 15 and 20 m.
    for (std::size_t i = 0; i < 4; ++i)
        REQUIRE(captures[i].distance >= 5.0f * static_cast<float>(i + 1));

    REQUIRE(transitions.size() == kNominalHistory.size() - 1);
    REQUIRE(transitions.front().description == "TAKEOFF->STABILIZE");
    REQUIRE(transitions.back().description == "LAND->DONE");
    REQUIRE(telemetry > 0);
}

TEST_CASE("FlightController::run flies a small building and reports a summary", "[FlightController]")
{
    mission::BuildingDimensions dims;
    dims.length = 4.0f;
    dims.breadth = 3.0f;
    dims.height = 2.0f;
    Rig rig(dims);

    const auto summary = rig.controller.run();

    REQUIRE(summary.finalPhase == FlightPhase::Done);
    REQUIRE(summary.captures == 16);
    REQUIRE(summary.ticks == rig.controller.tickCount());
    REQUIRE(summary.elapsedSeconds > 0.0);
}

TEST_CASE("FlightController refuses to start on an unavailable platform", "[FlightController]")
{
    platform::AirframeConfig offline;
    offline.available = false;
    Rig rig({}, offline);

    std::mutex m;
    std::vector<SystemEvent> events;
    rig.bus.subscribe([&](const SystemEvent &e)
                      {
                          std::lock_guard<std::mutex> lock(m);
                          events.push_back(e);
                      });
    rig.bus.start();

    REQUIRE_THROWS_AS(rig.controller.initialize(), control::PlatformUnavailableError);
    REQUIRE_THROWS_AS(rig.controller.run(), control::PlatformUnavailableError);
    rig.bus.stop();

    REQUIRE(rig.controller.tickCount() == 0);
    REQUIRE(rig.controller.phase() == FlightPhase::Takeoff);

    std::lock_guard<std::mutex> lock(m);
    REQUIRE_FALSE(events.empty());
    REQUIRE(events.front().type == SystemEventType::Fault);
}

TEST_CASE("FlightController calibrates heading after the sensor warm-up", "[FlightController]")
{
    platform::AirframeConfig airframe;
    airframe.initialYaw = 0.7f;
    Rig rig({}, airframe);

    rig.controller.initialize();

    REQUIRE(rig.clock.seconds() > 1.0);
    REQUIRE(rig.controller.navigation().state().accumulated_heading == Approx(0.7f));
    REQUIRE(rig.controller.tickCount() == 0);
}

TEST_CASE("FlightController drives LEDs and tilts the gimbal toward the facade", "[FlightController]")
{
    Rig rig;
    rig.controller.initialize();

    // Warm-up ends just past one second: odd seconds light the left LED.
    REQUIRE(rig.controller.tick());
    REQUIRE(rig.quad.frontLeftLed());
    REQUIRE_FALSE(rig.quad.frontRightLed());
    REQUIRE(rig.quad.lastCommand().gimbal_pitch == Approx(0.3f));
    REQUIRE(rig.quad.lastCommand().gimbal_roll == Approx(0.0f));

    // Takeoff thrust: every rotor above the hover bias, signs follow the motor layout.
    const auto &w = rig.quad.lastCommand().rotor_velocities;
    REQUIRE(w[0] > 68.5f);
    REQUIRE(w[1] < -68.5f);
    REQUIRE(w[2] < -68.5f);
    REQUIRE(w[3] > 68.5f);

    rig.clock.advance(1s);
    REQUIRE(rig.controller.tick());
    REQUIRE_FALSE(rig.quad.frontLeftLed());
    REQUIRE(rig.quad.frontRightLed());
}
