#pragma once
#include <DroneInspector/Messages.hpp>
#include <string>

namespace droneinspector::viz
{
    // Single-line JSON for the telemetry stream. Capture notices carry metadata only.
    struct JsonSerializer
    {
        static std::string toJson(const FlightTelemetry &t);
        static std::string toJson(const CaptureRequest &c);
        static std::string toJson(const SystemEvent &e);
    };
} // namespace droneinspector::viz
