#include <DataLogger/DataLogger.hpp>

#include <chrono>
#include <iomanip>
#include <iostream>

namespace droneinspector::logging
{
    namespace
    {
        double secondsOf(std::chrono::steady_clock::time_point t)
        {
            return std::chrono::duration<double>(t.time_since_epoch()).count();
        }

        const char *eventTypeName(SystemEventType type)
        {
            switch (type)
            {
            case SystemEventType::PhaseTransition:
                return "PhaseTransition";
            case SystemEventType::CaptureEmitted:
                return "CaptureEmitted";
            case SystemEventType::Fault:
                return "Fault";
            }
            return "Unknown";
        }
    } // namespace

    DataLogger::DataLogger(const LoggerConfig &config, bus::CommunicationBus &bus) : m_config(config), m_bus(bus) {}

    DataLogger::~DataLogger()
    {
        stop();
    }

    bool DataLogger::start()
    {
        if (m_running)
            return true;

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_file.open(m_config.outputPath, std::ios::out | std::ios::trunc);
            if (!m_file.is_open())
            {
                std::cerr << "[DataLogger] Cannot open flight log " << m_config.outputPath << "\n";
                return false;
            }
            m_file << std::fixed << std::setprecision(3);
        }

        m_running = true;

        // Handlers stay registered for the bus lifetime; they ignore messages once stopped.
        if (m_subscribed)
            return true;
        m_subscribed = true;

        if (m_config.logTelemetry)
            m_bus.subscribe([this](const droneinspector::FlightTelemetry &t)
                            { this->handleTelemetry(t); });

        if (m_config.logCaptures)
            m_bus.subscribe([this](const droneinspector::CaptureRequest &c)
                            { this->handleCaptureRequest(c); });

        if (m_config.logSystemEvents)
            m_bus.subscribe([this](const droneinspector::SystemEvent &e)
                            { this->handleSystemEvent(e); });

        return true;
    }

    void DataLogger::stop()
    {
        if (!m_running)
            return;
        m_running = false;

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_file.is_open())
            m_file.close();
    }

    void DataLogger::handleTelemetry(const droneinspector::FlightTelemetry &t)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_file.is_open())
            return;
        m_file << "[Telemetry] t=" << secondsOf(t.timestamp)
               << " phase=" << phaseName(t.phase)
               << " pos=" << t.position.transpose()
               << " att=" << t.attitude.transpose()
               << " target_alt=" << t.target_altitude
               << " progress=" << t.side_progress
               << "\n";
    }

    void DataLogger::handleCaptureRequest(const droneinspector::CaptureRequest &c)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_file.is_open())
            return;
        m_file << "[Capture] t=" << secondsOf(c.timestamp)
               << " seq=" << c.sequence
               << " phase=" << phaseName(c.phase)
               << " photo=" << c.photo_index
               << " distance=" << c.distance
               << " frame=" << c.frame.width << "x" << c.frame.height
               << "\n";
    }

    void DataLogger::handleSystemEvent(const droneinspector::SystemEvent &e)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_file.is_open())
            return;
        m_file << "[SystemEvent] t=" << secondsOf(e.timestamp)
               << " type=" << eventTypeName(e.type)
               << " desc=" << e.description
               << "\n";
    }

} // namespace droneinspector::logging
