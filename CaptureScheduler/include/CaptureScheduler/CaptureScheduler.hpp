#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace droneinspector::capture
{
    inline constexpr std::size_t kCapturesPerSide = 4;

    struct CaptureTrigger
    {
        std::uint64_t sequence{0};   // global, never reset during a flight
        std::size_t photo_index{0};  // 1-based within the current side
        float threshold{0.0f};
        float distance{0.0f};
    };

    // Fires one capture per evenly spaced distance threshold along the current side.
    // Thresholds sit at 25/50/75/100% of the side length and fire strictly in order.
    class CaptureScheduler
    {
    public:
        CaptureScheduler() = default;

        /// Re-arms the thresholds for a side of the given length.
        void beginSide(float sideLength) noexcept;

        /// Fires at most one capture per call, for the next uncrossed threshold.
        [[nodiscard]] std::optional<CaptureTrigger> onProgress(float distanceTraveled) noexcept;

        [[nodiscard]] const std::array<float, kCapturesPerSide> &thresholds() const noexcept;
        [[nodiscard]] std::size_t capturesThisSide() const noexcept;
        [[nodiscard]] std::uint64_t totalCaptures() const noexcept;

    private:
        std::array<float, kCapturesPerSide> m_thresholds{};
        std::size_t m_nextThreshold{0};
        bool m_armed{false}; // nothing fires before the first side begins
        std::uint64_t m_sequence{0};
    };

} // namespace droneinspector::capture
