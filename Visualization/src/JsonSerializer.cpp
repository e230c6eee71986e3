#include <Visualization/JsonSerializer.hpp>
#include <chrono>
#include <sstream>

namespace droneinspector::viz
{
    namespace
    {
        double secondsOf(std::chrono::steady_clock::time_point t)
        {
            return std::chrono::duration<double>(t.time_since_epoch()).count();
        }

        // Event descriptions are free text; escape what would break the line protocol.
        std::string escape(const std::string &text)
        {
            std::string out;
            out.reserve(text.size());
            for (char ch : text)
            {
                switch (ch)
                {
                case '"':
                    out += "\\\"";
                    break;
                case '\\':
                    out += "\\\\";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                default:
                    out += ch;
                }
            }
            return out;
        }
    } // namespace

    std::string JsonSerializer::toJson(const FlightTelemetry &t)
    {
        std::ostringstream oss;
        oss << "{"
            << "\"kind\":\"telemetry\","
            << "\"t\":" << secondsOf(t.timestamp) << ","
            << "\"phase\":\"" << phaseName(t.phase) << "\","
            << "\"pos\":[" << t.position.x() << "," << t.position.y() << "," << t.position.z() << "],"
            << "\"att\":[" << t.attitude.x() << "," << t.attitude.y() << "," << t.attitude.z() << "],"
            << "\"target_alt\":" << t.target_altitude << ","
            << "\"progress\":" << t.side_progress
            << "}";
        return oss.str();
    }

    std::string JsonSerializer::toJson(const CaptureRequest &c)
    {
        std::ostringstream oss;
        oss << "{"
            << "\"kind\":\"capture\","
            << "\"t\":" << secondsOf(c.timestamp) << ","
            << "\"seq\":" << c.sequence << ","
            << "\"phase\":\"" << phaseName(c.phase) << "\","
            << "\"photo\":" << c.photo_index << ","
            << "\"distance\":" << c.distance
            << "}";
        return oss.str();
    }

    std::string JsonSerializer::toJson(const SystemEvent &e)
    {
        std::ostringstream oss;
        oss << "{"
            << "\"kind\":\"event\","
            << "\"t\":" << secondsOf(e.timestamp) << ","
            << "\"type\":" << static_cast<int>(e.type) << ","
            << "\"desc\":\"" << escape(e.description) << "\""
            << "}";
        return oss.str();
    }
} // namespace droneinspector::viz
