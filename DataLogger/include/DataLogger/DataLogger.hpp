#pragma once

#include <CommunicationBus/CommunicationBus.hpp>

#include <fstream>
#include <mutex>
#include <string>

namespace droneinspector::logging
{
    struct LoggerConfig
    {
        std::string outputPath;
        bool logTelemetry = true;
        bool logCaptures = true;
        bool logSystemEvents = true;
    };

    // Writes one line per bus message to the flight log file.
    class DataLogger
    {
    public:
        DataLogger(const LoggerConfig &config,
                   bus::CommunicationBus &bus);
        ~DataLogger();

        /// Opens the log file and subscribes. Returns false if the file cannot be opened.
        bool start();
        void stop();

    private:
        void handleTelemetry(const droneinspector::FlightTelemetry &t);
        void handleCaptureRequest(const droneinspector::CaptureRequest &c);
        void handleSystemEvent(const droneinspector::SystemEvent &e);

    private:
        LoggerConfig m_config;
        bus::CommunicationBus &m_bus;

        std::ofstream m_file;
        std::mutex m_mutex;

        bool m_running = false;
        bool m_subscribed = false;
    };
} // namespace droneinspector::logging
