#include <Mission/InspectionPlan.hpp>

#include <cmath>
#include <stdexcept>
#include <string>

namespace droneinspector::mission
{
    namespace
    {
        float requirePositive(float value, const char *name)
        {
            if (!std::isfinite(value) || value <= 0.0f)
                throw std::invalid_argument(std::string("building ") + name + " must be a positive finite number, got " + std::to_string(value));
            return value;
        }
    } // namespace

    InspectionPlan::InspectionPlan(const BuildingDimensions &dimensions)
        : m_dimensions{requirePositive(dimensions.length, "length"),
                       requirePositive(dimensions.breadth, "breadth"),
                       requirePositive(dimensions.height, "height")},
          m_targetAltitude(dimensions.height / 2.0f),
          m_sideLengths{dimensions.length, dimensions.breadth, dimensions.length, dimensions.breadth}
    {
    }

} // namespace droneinspector::mission
