#pragma once

#include <Mission/InspectionPlan.hpp>

#include <filesystem>
#include <stdexcept>
#include <string>

namespace droneinspector::mission
{
    struct TelemetryConfig
    {
        bool enabled = false;
        std::string host = "127.0.0.1";
        int port = 5555;
    };

    struct MissionConfig
    {
        BuildingDimensions building;
        std::string imageDirectory = "inspection_images";
        std::string flightLogPath = "flight_log.txt";
        TelemetryConfig telemetry;
    };

    class ConfigError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /// Parses a JSON mission document. Missing keys keep their defaults.
    /// Throws ConfigError on malformed JSON, wrong types or invalid dimensions.
    MissionConfig parseMissionConfig(const std::string &jsonText);

    /// Loads the mission file, falling back to defaults when it does not exist.
    MissionConfig loadMissionConfig(const std::filesystem::path &path);

} // namespace droneinspector::mission
