#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace droneinspector::viz
{
    // Newline-delimited JSON over TCP to the plot/dashboard endpoint.
    // Connects in the background and keeps retrying until stopped.
    class TelemetryClient
    {
    public:
        TelemetryClient(const std::string &host, int port,
                        std::chrono::milliseconds retryInterval = std::chrono::seconds(2));
        ~TelemetryClient();

        void start();
        void stop();

        /// Drops the message silently while disconnected.
        void send(const std::string &jsonMessage);

        [[nodiscard]] bool connected() const;
        [[nodiscard]] std::size_t sentCount() const noexcept;

    private:
        void workerLoop(std::stop_token st);
        void closeSocketLocked();

        std::string m_host;
        int m_port;
        std::chrono::milliseconds m_retryInterval;

        int m_socketFd = -1;
        mutable std::mutex m_writeMutex;

        std::atomic<std::size_t> m_sent{0};
        std::jthread m_worker;
        std::atomic<bool> m_running{false};
    };

} // namespace droneinspector::viz
