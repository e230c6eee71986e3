#include <Visualization/VisualizationPublisher.hpp>

namespace droneinspector::viz
{
    VisualizationPublisher::VisualizationPublisher(bus::CommunicationBus &bus, TelemetryClient &client) : m_bus(bus), m_client(client) {}

    void VisualizationPublisher::start()
    {
        bool expected = false;
        if (!m_running.compare_exchange_strong(expected, true))
            return;

        if (m_subscribed)
            return;
        m_subscribed = true;

        m_bus.subscribe([this](const droneinspector::FlightTelemetry &t)
                        { this->handleTelemetry(t); });
        m_bus.subscribe([this](const droneinspector::CaptureRequest &c)
                        { this->handleCaptureRequest(c); });
        m_bus.subscribe([this](const droneinspector::SystemEvent &e)
                        { this->handleSystemEvent(e); });
    }

    void VisualizationPublisher::stop()
    {
        bool wasRunning = m_running.exchange(false);
        if (!wasRunning)
            return;

        m_client.stop();
    }

    void VisualizationPublisher::handleTelemetry(const droneinspector::FlightTelemetry &t)
    {
        if (m_running)
            m_client.send(JsonSerializer::toJson(t));
    }

    void VisualizationPublisher::handleCaptureRequest(const droneinspector::CaptureRequest &c)
    {
        // Pixels stay in the image store; the stream only announces the capture.
        if (m_running)
            m_client.send(JsonSerializer::toJson(c));
    }

    void VisualizationPublisher::handleSystemEvent(const droneinspector::SystemEvent &e)
    {
        if (m_running)
            m_client.send(JsonSerializer::toJson(e));
    }

} // namespace droneinspector::viz
