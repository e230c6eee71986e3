#include <Visualization/TelemetryClient.hpp>
#include <sys/socket.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <unistd.h>
#include <iostream>

namespace droneinspector::viz
{
    TelemetryClient::TelemetryClient(const std::string &host, int port, std::chrono::milliseconds retryInterval)
        : m_host(host), m_port(port), m_retryInterval(retryInterval) {}

    TelemetryClient::~TelemetryClient()
    {
        stop();
    }

    void TelemetryClient::start()
    {
        bool expected = false;
        if (!m_running.compare_exchange_strong(expected, true))
            return;

        m_worker = std::jthread([this](std::stop_token st)
                                { workerLoop(st); });
    }

    void TelemetryClient::stop()
    {
        if (!m_running.exchange(false))
            return;

        if (m_worker.joinable())
        {
            m_worker.request_stop();
            m_worker.join();
        }

        std::lock_guard<std::mutex> lock(m_writeMutex);
        closeSocketLocked();
    }

    void TelemetryClient::closeSocketLocked()
    {
        if (m_socketFd >= 0)
        {
            close(m_socketFd);
            m_socketFd = -1;
        }
    }

    void TelemetryClient::workerLoop(std::stop_token st)
    {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(m_port));
        if (inet_pton(AF_INET, m_host.c_str(), &addr.sin_addr) != 1)
        {
            std::cerr << "[TelemetryClient] Invalid host address " << m_host << "\n";
            return;
        }

        // Sleeps in short slices so stop() is not held up by the retry interval.
        auto waitRetry = [&]
        {
            const auto deadline = std::chrono::steady_clock::now() + m_retryInterval;
            while (!st.stop_requested() && std::chrono::steady_clock::now() < deadline)
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
        };

        while (!st.stop_requested())
        {
            const int fd = socket(AF_INET, SOCK_STREAM, 0);
            if (fd < 0)
            {
                std::cerr << "[TelemetryClient] Socket creation failed\n";
                waitRetry();
                continue;
            }

            if (connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0)
            {
                std::cerr << "[TelemetryClient] Connection failed, retrying...\n";
                close(fd);
                waitRetry();
                continue;
            }

            {
                std::lock_guard<std::mutex> lock(m_writeMutex);
                m_socketFd = fd;
            }
            std::cout << "[TelemetryClient] Connected to " << m_host << ":" << m_port << "\n";
            break;
        }
    }

    void TelemetryClient::send(const std::string &jsonMessage)
    {
        std::lock_guard<std::mutex> lock(m_writeMutex);
        if (m_socketFd < 0)
            return;

        const std::string payload = jsonMessage + "\n";
        if (::send(m_socketFd, payload.c_str(), payload.size(), MSG_NOSIGNAL) < 0)
        {
            std::cerr << "[TelemetryClient] Send failed, telemetry stream closed\n";
            closeSocketLocked();
            return;
        }
        m_sent.fetch_add(1);
    }

    bool TelemetryClient::connected() const
    {
        std::lock_guard<std::mutex> lock(m_writeMutex);
        return m_socketFd >= 0;
    }

    std::size_t TelemetryClient::sentCount() const noexcept
    {
        return m_sent.load();
    }
} // namespace droneinspector::viz
