#include <Navigation/NavigationState.hpp>

#include <algorithm>

namespace droneinspector::navigation
{
    void NavigationState::beginSide(const mission::InspectionPlan &plan, std::size_t index, const Eigen::Vector3f &position)
    {
        side_index = std::min(index, plan.sideLengths().size() - 1);
        side_origin = position;
    }

    float NavigationState::currentSideLength(const mission::InspectionPlan &plan) const
    {
        return plan.sideLengths()[side_index];
    }

} // namespace droneinspector::navigation
