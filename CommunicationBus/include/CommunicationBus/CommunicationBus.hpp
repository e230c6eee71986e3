#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <vector>

#include <DroneInspector/Messages.hpp>

namespace droneinspector::bus
{
    struct BusConfig
    {
        bool dropOnOverflow = false;
        std::size_t maxQueueSizePerType = 1024;
    };

    // Side channel between the single-threaded flight core and its collaborators
    // (image store, flight log, telemetry). The core only publishes.
    class CommunicationBus
    {
    public:
        using TelemetryHandler = std::function<void(const droneinspector::FlightTelemetry &)>;
        using CaptureRequestHandler = std::function<void(const droneinspector::CaptureRequest &)>;
        using SystemEventHandler = std::function<void(const droneinspector::SystemEvent &)>;

        explicit CommunicationBus(const BusConfig &config = {});
        ~CommunicationBus();

        void start();

        /// Stops the worker after delivering everything already queued.
        void stop();

        // Publish API - thread-safe
        void publish(const droneinspector::FlightTelemetry &telemetry);
        void publish(const droneinspector::CaptureRequest &request);
        void publish(const droneinspector::SystemEvent &event);

        // Subscription API - call before start()
        void subscribe(TelemetryHandler handler);
        void subscribe(CaptureRequestHandler handler);
        void subscribe(SystemEventHandler handler);

        [[nodiscard]] std::size_t droppedCount() const noexcept;

    private:
        template <typename T>
        void enqueue(std::queue<T> &queue, const T &message);

        void workerLoop(std::stop_token st);
        void dispatchPending();

        BusConfig m_config{};

        std::queue<droneinspector::FlightTelemetry> m_telemetryQueue;
        std::queue<droneinspector::CaptureRequest> m_captureQueue;
        std::queue<droneinspector::SystemEvent> m_eventQueue;

        std::vector<TelemetryHandler> m_telemetryHandlers;
        std::vector<CaptureRequestHandler> m_captureHandlers;
        std::vector<SystemEventHandler> m_eventHandlers;

        std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_hasWork{false};

        std::atomic<std::size_t> m_dropped{0};
        std::atomic<bool> m_running{false};
        std::jthread m_worker;
    }; // class CommunicationBus
} // namespace droneinspector::bus
