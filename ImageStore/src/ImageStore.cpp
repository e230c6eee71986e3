#include <ImageStore/ImageStore.hpp>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <system_error>

namespace droneinspector::storage
{
    namespace
    {
        constexpr int kMaxSampleValue = 255;
    } // namespace

    ImageStore::ImageStore(const ImageStoreConfig &config, bus::CommunicationBus &bus) : m_config(config), m_bus(bus) {}

    bool ImageStore::start()
    {
        bool expected = false;
        if (!m_running.compare_exchange_strong(expected, true))
            return true;

        std::error_code ec;
        std::filesystem::create_directories(m_config.directory, ec);
        if (ec)
        {
            std::cerr << "[ImageStore] Cannot create " << m_config.directory << ": " << ec.message() << "\n";
            m_running = false;
            return false;
        }

        m_bus.subscribe([this](const droneinspector::CaptureRequest &request)
                        { this->store(request); });
        return true;
    }

    std::string ImageStore::fileNameFor(std::uint64_t sequence)
    {
        char name[32];
        std::snprintf(name, sizeof(name), "capture_%04llu.ppm", static_cast<unsigned long long>(sequence));
        return name;
    }

    std::filesystem::path ImageStore::pathFor(std::uint64_t sequence) const
    {
        return std::filesystem::path(m_config.directory) / fileNameFor(sequence);
    }

    bool ImageStore::store(const droneinspector::CaptureRequest &request)
    {
        const auto &frame = request.frame;
        const auto expectedBytes = static_cast<std::size_t>(frame.width) * static_cast<std::size_t>(frame.height) * 3;
        const auto path = pathFor(request.sequence);

        if (frame.width <= 0 || frame.height <= 0 || frame.rgb.size() != expectedBytes)
        {
            std::cerr << "[ImageStore] Capture " << request.sequence << " has an invalid frame, skipped\n";
            m_failed.fetch_add(1);
            return false;
        }

        std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            std::cerr << "[ImageStore] Cannot open " << path.string() << "\n";
            m_failed.fetch_add(1);
            return false;
        }

        out << "P6\n"
            << frame.width << " " << frame.height << "\n"
            << kMaxSampleValue << "\n";
        out.write(reinterpret_cast<const char *>(frame.rgb.data()), static_cast<std::streamsize>(frame.rgb.size()));
        out.close();

        if (!out)
        {
            std::cerr << "[ImageStore] Write failed for " << path.string() << "\n";
            m_failed.fetch_add(1);
            return false;
        }

        m_stored.fetch_add(1);
        return true;
    }

    std::size_t ImageStore::storedCount() const noexcept
    {
        return m_stored.load();
    }

    std::size_t ImageStore::failedCount() const noexcept
    {
        return m_failed.load();
    }

} // namespace droneinspector::storage
