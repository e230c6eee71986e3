#pragma once

#include <DroneInspector/FlightPhase.hpp>
#include <Mission/InspectionPlan.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <Eigen/Core>

namespace droneinspector::navigation
{
    // Mutable flight state, owned by exactly one FlightStateMachine.
    struct NavigationState
    {
        FlightPhase phase{FlightPhase::Takeoff};

        // Commanded yaw; advanced by pi/2 at each completed side, never wrapped.
        float accumulated_heading{0.0f};

        // Heading a Turn phase converges to, recorded when the preceding side ends.
        float turn_target{0.0f};

        // Set iff phase is a Side phase.
        std::optional<Eigen::Vector3f> side_origin;

        std::size_t side_index{0};
        std::chrono::steady_clock::time_point phase_entry_time{};

        // Altitude handed to the stabilizer; lowered step by step while landing.
        float target_altitude{0.0f};

        /// Starts side `index` of the plan at the current position.
        void beginSide(const mission::InspectionPlan &plan, std::size_t index, const Eigen::Vector3f &position);

        /// Length of the side currently being flown.
        [[nodiscard]] float currentSideLength(const mission::InspectionPlan &plan) const;
    };

} // namespace droneinspector::navigation
