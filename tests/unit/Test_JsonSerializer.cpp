#include <catch2/catch_test_macros.hpp>
#include <Visualization/JsonSerializer.hpp>
#include <DroneInspector/Messages.hpp>
#include <Eigen/Core>

#include <chrono>

using namespace std::chrono_literals;

TEST_CASE("JsonSerializer formats FlightTelemetry", "[JsonSerializer]")
{
    droneinspector::FlightTelemetry t{};
    t.timestamp = std::chrono::steady_clock::time_point{} + 2500ms;
    t.phase = droneinspector::FlightPhase::Side2;
    t.position = Eigen::Vector3f(1.0f, 2.0f, 4.0f);
    t.attitude = Eigen::Vector3f(0.0f, 0.0f, 0.5f);
    t.target_altitude = 4.0f;
    t.side_progress = 3.5f;

    const auto json = droneinspector::viz::JsonSerializer::toJson(t);
    REQUIRE(json == R"({"kind":"telemetry","t":2.5,"phase":"SIDE_2","pos":[1,2,4],"att":[0,0,0.5],"target_alt":4,"progress":3.5})");
}

TEST_CASE("JsonSerializer formats CaptureRequest without pixel data", "[JsonSerializer]")
{
    droneinspector::CaptureRequest c{};
    c.timestamp = std::chrono::steady_clock::time_point{} + 1s;
    c.sequence = 5;
    c.phase = droneinspector::FlightPhase::Side2;
    c.photo_index = 1;
    c.distance = 2.5f;
    c.frame.width = 2;
    c.frame.height = 1;
    c.frame.rgb = {1, 2, 3, 4, 5, 6};

    const auto json = droneinspector::viz::JsonSerializer::toJson(c);
    REQUIRE(json == R"({"kind":"capture","t":1,"seq":5,"phase":"SIDE_2","photo":1,"distance":2.5})");
}

TEST_CASE("JsonSerializer formats SystemEvent and escapes the description", "[JsonSerializer]")
{
    droneinspector::SystemEvent e{};
    e.type = droneinspector::SystemEventType::Fault;
    e.description = "say \"hi\"\\\n";

    const auto json = droneinspector::viz::JsonSerializer::toJson(e);
    REQUIRE(json == R"({"kind":"event","t":0,"type":2,"desc":"say \"hi\"\\\n"})");
}
