#include <CommunicationBus/CommunicationBus.hpp>

#include <utility>

namespace droneinspector::bus
{
    namespace
    {
        template <typename T, typename Handler>
        void fanOut(std::queue<T> &messages, const std::vector<Handler> &handlers)
        {
            while (!messages.empty())
            {
                const auto &msg = messages.front();
                for (const auto &h : handlers)
                {
                    if (h)
                    {
                        h(msg);
                    }
                }
                messages.pop();
            }
        }
    } // namespace

    CommunicationBus::CommunicationBus(const BusConfig &config) : m_config(config) {}

    CommunicationBus::~CommunicationBus()
    {
        stop();
    }

    void CommunicationBus::start()
    {
        bool expected = false;

        // Only the first caller flips m_running and spawns the worker.
        if (!m_running.compare_exchange_strong(expected, true))
        {
            return;
        }

        m_worker = std::jthread([this](std::stop_token st)
                                { workerLoop(st); });
    }

    void CommunicationBus::stop()
    {
        if (!m_running.exchange(false))
            return;

        if (!m_worker.joinable())
            return;

        m_worker.request_stop();

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_hasWork = true; // wake up worker to exit
        }
        m_cv.notify_one();
        m_worker.join();
    }

    template <typename T>
    void CommunicationBus::enqueue(std::queue<T> &queue, const T &message)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_config.dropOnOverflow && queue.size() >= m_config.maxQueueSizePerType)
            {
                m_dropped.fetch_add(1);
            }
            else
            {
                queue.push(message);
            }

            m_hasWork = true;
        }
        m_cv.notify_one();
    }

    void CommunicationBus::publish(const droneinspector::FlightTelemetry &telemetry)
    {
        enqueue(m_telemetryQueue, telemetry);
    }

    void CommunicationBus::publish(const droneinspector::CaptureRequest &request)
    {
        enqueue(m_captureQueue, request);
    }

    void CommunicationBus::publish(const droneinspector::SystemEvent &event)
    {
        enqueue(m_eventQueue, event);
    }

    void CommunicationBus::subscribe(TelemetryHandler handler)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_telemetryHandlers.emplace_back(std::move(handler));
    }

    void CommunicationBus::subscribe(CaptureRequestHandler handler)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_captureHandlers.emplace_back(std::move(handler));
    }

    void CommunicationBus::subscribe(SystemEventHandler handler)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_eventHandlers.emplace_back(std::move(handler));
    }

    std::size_t CommunicationBus::droppedCount() const noexcept
    {
        return m_dropped.load();
    }

    void CommunicationBus::dispatchPending()
    {
        std::queue<droneinspector::FlightTelemetry> telemetry;
        std::queue<droneinspector::CaptureRequest> captures;
        std::queue<droneinspector::SystemEvent> events;

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            telemetry.swap(m_telemetryQueue);
            captures.swap(m_captureQueue);
            events.swap(m_eventQueue);
            m_hasWork = false;
        }

        fanOut(telemetry, m_telemetryHandlers);
        fanOut(captures, m_captureHandlers);
        fanOut(events, m_eventHandlers);
    }

    void CommunicationBus::workerLoop(std::stop_token st)
    {
        while (!st.stop_requested())
        {
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_cv.wait(lock, [&]
                          { return m_hasWork || st.stop_requested(); });
            }

            dispatchPending();
        }

        // Deliver whatever was published before stop() so no capture is lost.
        dispatchPending();
    }
} // namespace droneinspector::bus
