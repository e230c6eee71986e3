#pragma once

#include <CommunicationBus/CommunicationBus.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>

namespace droneinspector::storage
{
    struct ImageStoreConfig
    {
        std::string directory = "inspection_images";
    };

    // Persists capture requests to the watched image directory as capture_NNNN.ppm.
    // Encoding is fixed: binary PPM, 8 bits per channel.
    class ImageStore
    {
    public:
        ImageStore(const ImageStoreConfig &config, bus::CommunicationBus &bus);

        /// Creates the directory and subscribes. Returns false if the directory cannot be created.
        bool start();

        /// Writes one frame; failures are logged and counted, never thrown.
        bool store(const droneinspector::CaptureRequest &request);

        [[nodiscard]] std::filesystem::path pathFor(std::uint64_t sequence) const;
        [[nodiscard]] static std::string fileNameFor(std::uint64_t sequence);

        [[nodiscard]] std::size_t storedCount() const noexcept;
        [[nodiscard]] std::size_t failedCount() const noexcept;

    private:
        ImageStoreConfig m_config;
        bus::CommunicationBus &m_bus;

        std::atomic<bool> m_running{false};
        std::atomic<std::size_t> m_stored{0};
        std::atomic<std::size_t> m_failed{0};
    };

} // namespace droneinspector::storage
