#include <VirtualTime/VirtualClock.hpp>

namespace droneinspector::time
{
    VirtualClock::VirtualClock(Duration step) noexcept
        : m_current(TimePoint{}), m_step(step > Duration::zero() ? step : std::chrono::milliseconds(8))
    {
    }

    VirtualClock::TimePoint VirtualClock::now() const noexcept
    {
        return m_current;
    }

    VirtualClock::Duration VirtualClock::step() const noexcept
    {
        return m_step;
    }

    double VirtualClock::seconds() const noexcept
    {
        return std::chrono::duration<double>(m_current.time_since_epoch()).count();
    }

    void VirtualClock::tick() noexcept
    {
        m_current += m_step;
    }

    void VirtualClock::advance(Duration delta) noexcept
    {
        if (delta < Duration::zero())
        {
            return;
        }

        m_current += delta;
    }

    void VirtualClock::reset() noexcept
    {
        m_current = TimePoint{};
    }

} // namespace droneinspector::time
