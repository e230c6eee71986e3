#pragma once

#include <array>

namespace droneinspector::mission
{
    // Footprint and height of the inspected building, in meters.
    struct BuildingDimensions
    {
        float length = 20.0f;
        float breadth = 10.0f;
        float height = 8.0f;
    };

    // Immutable flight plan derived once from the building dimensions.
    class InspectionPlan
    {
    public:
        /// Throws std::invalid_argument if any dimension is non-positive or not finite.
        explicit InspectionPlan(const BuildingDimensions &dimensions = {});

        [[nodiscard]] const BuildingDimensions &dimensions() const noexcept { return m_dimensions; }

        /// Half the building height.
        [[nodiscard]] float targetAltitude() const noexcept { return m_targetAltitude; }

        /// Edge lengths in traversal order: length, breadth, length, breadth.
        [[nodiscard]] const std::array<float, 4> &sideLengths() const noexcept { return m_sideLengths; }

    private:
        BuildingDimensions m_dimensions;
        float m_targetAltitude;
        std::array<float, 4> m_sideLengths;
    };

} // namespace droneinspector::mission
