#pragma once

#include <chrono>

namespace droneinspector::time
{
    /// Fixed time-step simulation clock. Every timestamp inside the flight
    /// core comes from here, never from std::chrono::steady_clock::now().
    class VirtualClock
    {
    public:
        using TimePoint = std::chrono::steady_clock::time_point;
        using Duration = std::chrono::steady_clock::duration;

        /// Starts at the zero epoch with the host's basic time step.
        explicit VirtualClock(Duration step = std::chrono::milliseconds(8)) noexcept;

        [[nodiscard]] TimePoint now() const noexcept;
        [[nodiscard]] Duration step() const noexcept;

        /// Seconds elapsed since the epoch.
        [[nodiscard]] double seconds() const noexcept;

        /// Advances by exactly one time step.
        void tick() noexcept;

        /// Advances by an arbitrary duration. Negative deltas are ignored.
        void advance(Duration delta) noexcept;

        void reset() noexcept;

    private:
        TimePoint m_current;
        Duration m_step;
    };
} // namespace droneinspector::time
