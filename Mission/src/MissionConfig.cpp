#include <Mission/MissionConfig.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace droneinspector::mission
{
    namespace
    {
        template <typename T>
        void readOptional(const nlohmann::json &doc, const char *key, T &out)
        {
            const auto it = doc.find(key);
            if (it == doc.end() || it->is_null())
                return;

            try
            {
                out = it->get<T>();
            }
            catch (const nlohmann::json::exception &e)
            {
                throw ConfigError(std::string("config key '") + key + "': " + e.what());
            }
        }
    } // namespace

    MissionConfig parseMissionConfig(const std::string &jsonText)
    {
        nlohmann::json doc;
        try
        {
            doc = nlohmann::json::parse(jsonText);
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw ConfigError(std::string("malformed mission config: ") + e.what());
        }

        if (!doc.is_object())
            throw ConfigError("mission config must be a JSON object");

        MissionConfig cfg;
        readOptional(doc, "building_length", cfg.building.length);
        readOptional(doc, "building_breadth", cfg.building.breadth);
        readOptional(doc, "building_height", cfg.building.height);
        readOptional(doc, "image_directory", cfg.imageDirectory);
        readOptional(doc, "flight_log", cfg.flightLogPath);

        const auto telemetry = doc.find("telemetry");
        if (telemetry != doc.end() && !telemetry->is_null())
        {
            if (!telemetry->is_object())
                throw ConfigError("config key 'telemetry' must be an object");

            readOptional(*telemetry, "enabled", cfg.telemetry.enabled);
            readOptional(*telemetry, "host", cfg.telemetry.host);
            readOptional(*telemetry, "port", cfg.telemetry.port);

            if (cfg.telemetry.port <= 0 || cfg.telemetry.port > 65535)
                throw ConfigError("config key 'telemetry.port' out of range: " + std::to_string(cfg.telemetry.port));
        }

        // Surface invalid dimensions as a configuration problem, not a plan problem.
        try
        {
            [[maybe_unused]] const InspectionPlan plan(cfg.building);
        }
        catch (const std::invalid_argument &e)
        {
            throw ConfigError(e.what());
        }

        return cfg;
    }

    MissionConfig loadMissionConfig(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            std::cout << "[CONFIG] " << path.string() << " not found - using defaults (20 x 10 x 8)\n";
            return MissionConfig{};
        }

        std::ostringstream contents;
        contents << in.rdbuf();

        MissionConfig cfg = parseMissionConfig(contents.str());
        std::cout << "[CONFIG] Building dimensions: L=" << cfg.building.length
                  << "m  W=" << cfg.building.breadth
                  << "m  H=" << cfg.building.height << "m\n";
        return cfg;
    }

} // namespace droneinspector::mission
