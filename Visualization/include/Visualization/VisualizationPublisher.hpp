#pragma once

#include <CommunicationBus/CommunicationBus.hpp>
#include <Visualization/TelemetryClient.hpp>
#include <Visualization/JsonSerializer.hpp>
#include <atomic>

namespace droneinspector::viz
{
    // Bridges bus messages to the telemetry stream as JSON lines.
    class VisualizationPublisher
    {
    public:
        VisualizationPublisher(bus::CommunicationBus &bus, TelemetryClient &client);

        void start();
        void stop();

    private:
        void handleTelemetry(const droneinspector::FlightTelemetry &t);
        void handleCaptureRequest(const droneinspector::CaptureRequest &c);
        void handleSystemEvent(const droneinspector::SystemEvent &e);

        bus::CommunicationBus &m_bus;
        TelemetryClient &m_client;

        std::atomic<bool> m_running{false};
        bool m_subscribed{false};
    };
} // namespace droneinspector::viz
