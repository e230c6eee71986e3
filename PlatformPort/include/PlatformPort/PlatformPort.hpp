#pragma once

#include <DroneInspector/Messages.hpp>

namespace droneinspector::platform
{
    // Boundary to the vehicle platform. Readings are trusted and writes are
    // fire-and-forget; the controller never validates either direction.
    class PlatformPort
    {
    public:
        virtual ~PlatformPort() = default;

        /// False means the sensors/actuators cannot be reached and no flight may start.
        [[nodiscard]] virtual bool isAvailable() const = 0;

        /// Advances the host by one fixed time step. Returns false once the host stops.
        virtual bool step() = 0;

        [[nodiscard]] virtual SensorReadings read() const = 0;
        virtual void write(const ActuatorCommand &command) = 0;

        virtual void setLeds(bool frontLeft, bool frontRight) = 0;
        [[nodiscard]] virtual CameraFrame captureFrame() const = 0;
    };

} // namespace droneinspector::platform
