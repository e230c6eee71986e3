#pragma once

#include <cstddef>
#include <string_view>

namespace droneinspector
{
    // Discrete flight phases of the rectangular inspection flight, in traversal order.
    enum class FlightPhase
    {
        Takeoff,
        Stabilize,
        Side1,
        Turn1,
        Side2,
        Turn2,
        Side3,
        Turn3,
        Side4,
        Land,
        Done
    };

    /// One-directional transition function. Done is terminal and maps to itself.
    constexpr FlightPhase successor(FlightPhase phase) noexcept
    {
        switch (phase)
        {
        case FlightPhase::Takeoff:
            return FlightPhase::Stabilize;
        case FlightPhase::Stabilize:
            return FlightPhase::Side1;
        case FlightPhase::Side1:
            return FlightPhase::Turn1;
        case FlightPhase::Turn1:
            return FlightPhase::Side2;
        case FlightPhase::Side2:
            return FlightPhase::Turn2;
        case FlightPhase::Turn2:
            return FlightPhase::Side3;
        case FlightPhase::Side3:
            return FlightPhase::Turn3;
        case FlightPhase::Turn3:
            return FlightPhase::Side4;
        case FlightPhase::Side4:
            return FlightPhase::Land;
        case FlightPhase::Land:
            return FlightPhase::Done;
        case FlightPhase::Done:
            return FlightPhase::Done;
        }
        return FlightPhase::Done;
    }

    constexpr bool isSidePhase(FlightPhase phase) noexcept
    {
        switch (phase)
        {
        case FlightPhase::Side1:
        case FlightPhase::Side2:
        case FlightPhase::Side3:
        case FlightPhase::Side4:
            return true;
        case FlightPhase::Takeoff:
        case FlightPhase::Stabilize:
        case FlightPhase::Turn1:
        case FlightPhase::Turn2:
        case FlightPhase::Turn3:
        case FlightPhase::Land:
        case FlightPhase::Done:
            return false;
        }
        return false;
    }

    constexpr bool isTurnPhase(FlightPhase phase) noexcept
    {
        switch (phase)
        {
        case FlightPhase::Turn1:
        case FlightPhase::Turn2:
        case FlightPhase::Turn3:
            return true;
        case FlightPhase::Takeoff:
        case FlightPhase::Stabilize:
        case FlightPhase::Side1:
        case FlightPhase::Side2:
        case FlightPhase::Side3:
        case FlightPhase::Side4:
        case FlightPhase::Land:
        case FlightPhase::Done:
            return false;
        }
        return false;
    }

    /// Index into the plan's side lengths. Only meaningful for side phases.
    constexpr std::size_t sideIndexOf(FlightPhase phase) noexcept
    {
        switch (phase)
        {
        case FlightPhase::Side1:
            return 0;
        case FlightPhase::Side2:
            return 1;
        case FlightPhase::Side3:
            return 2;
        case FlightPhase::Side4:
            return 3;
        case FlightPhase::Takeoff:
        case FlightPhase::Stabilize:
        case FlightPhase::Turn1:
        case FlightPhase::Turn2:
        case FlightPhase::Turn3:
        case FlightPhase::Land:
        case FlightPhase::Done:
            return 0;
        }
        return 0;
    }

    constexpr std::string_view phaseName(FlightPhase phase) noexcept
    {
        switch (phase)
        {
        case FlightPhase::Takeoff:
            return "TAKEOFF";
        case FlightPhase::Stabilize:
            return "STABILIZE";
        case FlightPhase::Side1:
            return "SIDE_1";
        case FlightPhase::Turn1:
            return "TURN_1";
        case FlightPhase::Side2:
            return "SIDE_2";
        case FlightPhase::Turn2:
            return "TURN_2";
        case FlightPhase::Side3:
            return "SIDE_3";
        case FlightPhase::Turn3:
            return "TURN_3";
        case FlightPhase::Side4:
            return "SIDE_4";
        case FlightPhase::Land:
            return "LAND";
        case FlightPhase::Done:
            return "DONE";
        }
        return "UNKNOWN";
    }
} // namespace droneinspector
