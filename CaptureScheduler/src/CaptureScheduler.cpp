#include <CaptureScheduler/CaptureScheduler.hpp>

namespace droneinspector::capture
{
    void CaptureScheduler::beginSide(float sideLength) noexcept
    {
        for (std::size_t k = 0; k < kCapturesPerSide; ++k)
        {
            m_thresholds[k] = sideLength * static_cast<float>(k + 1) / static_cast<float>(kCapturesPerSide);
        }
        m_nextThreshold = 0;
        m_armed = true;
    }

    std::optional<CaptureTrigger> CaptureScheduler::onProgress(float distanceTraveled) noexcept
    {
        if (!m_armed || m_nextThreshold >= kCapturesPerSide)
            return std::nullopt;

        const float threshold = m_thresholds[m_nextThreshold];
        if (distanceTraveled < threshold)
            return std::nullopt;

        CaptureTrigger trigger;
        trigger.sequence = ++m_sequence;
        trigger.photo_index = ++m_nextThreshold;
        trigger.threshold = threshold;
        trigger.distance = distanceTraveled;
        return trigger;
    }

    const std::array<float, kCapturesPerSide> &CaptureScheduler::thresholds() const noexcept
    {
        return m_thresholds;
    }

    std::size_t CaptureScheduler::capturesThisSide() const noexcept
    {
        return m_nextThreshold;
    }

    std::uint64_t CaptureScheduler::totalCaptures() const noexcept
    {
        return m_sequence;
    }

} // namespace droneinspector::capture
