#include <CommunicationBus/CommunicationBus.hpp>
#include <DataLogger/DataLogger.hpp>
#include <FlightController/FlightController.hpp>
#include <ImageStore/ImageStore.hpp>
#include <Mission/MissionConfig.hpp>
#include <PlatformPort/SimulatedQuadrotor.hpp>
#include <VirtualTime/VirtualClock.hpp>
#include <Visualization/TelemetryClient.hpp>
#include <Visualization/VisualizationPublisher.hpp>

#include <csignal>
#include <iostream>
#include <memory>

using namespace droneinspector;

namespace
{
    platform::SimulatedQuadrotor *g_platform = nullptr;

    extern "C" void handleInterrupt(int)
    {
        // The host stops stepping; the loop exits after the current tick.
        if (g_platform)
            g_platform->shutdown();
    }
} // namespace

int main(int argc, char **argv)
{
    const std::string configPath = argc > 1 ? argv[1] : "config.json";

    mission::MissionConfig missionCfg;
    try
    {
        missionCfg = mission::loadMissionConfig(configPath);
    }
    catch (const mission::ConfigError &e)
    {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }

    const mission::InspectionPlan plan(missionCfg.building);

    time::VirtualClock clock(std::chrono::milliseconds(8));
    bus::CommunicationBus bus;

    // Configs
    control::ControllerConfig controllerCfg;
    navigation::NavigationConfig navigationCfg;
    stabilizer::StabilizerGains gains;
    platform::AirframeConfig airframeCfg;

    logging::LoggerConfig loggerCfg;
    loggerCfg.outputPath = missionCfg.flightLogPath;

    storage::ImageStoreConfig storeCfg;
    storeCfg.directory = missionCfg.imageDirectory;

    // Modules
    platform::SimulatedQuadrotor quadrotor(airframeCfg, clock);
    control::FlightController controller(controllerCfg, navigationCfg, gains, plan, quadrotor, bus);
    logging::DataLogger logger(loggerCfg, bus);
    storage::ImageStore imageStore(storeCfg, bus);

    // Telemetry pipeline
    std::unique_ptr<viz::TelemetryClient> client;
    std::unique_ptr<viz::VisualizationPublisher> publisher;
    if (missionCfg.telemetry.enabled)
    {
        client = std::make_unique<viz::TelemetryClient>(missionCfg.telemetry.host, missionCfg.telemetry.port);
        publisher = std::make_unique<viz::VisualizationPublisher>(bus, *client);
        client->start();
        publisher->start();
    }

    if (!logger.start())
        std::cerr << "[DRONE] Continuing without a flight log\n";
    if (!imageStore.start())
        std::cerr << "[DRONE] Continuing without image persistence\n";

    g_platform = &quadrotor;
    std::signal(SIGINT, handleInterrupt);
    std::signal(SIGTERM, handleInterrupt);

    bus.start();

    int exitCode = 0;
    try
    {
        const auto summary = controller.run();
        std::cout << "[DRONE] " << summary.ticks << " ticks, " << summary.elapsedSeconds << " s simulated, "
                  << summary.captures << " captures, final phase " << phaseName(summary.finalPhase) << "\n";
    }
    catch (const control::PlatformUnavailableError &e)
    {
        std::cerr << "[ERROR] " << e.what() << "\n";
        exitCode = 2;
    }

    bus.stop();
    if (publisher)
        publisher->stop();
    logger.stop();

    std::cout << "[DRONE] " << imageStore.storedCount() << " images stored in " << storeCfg.directory
              << " (" << imageStore.failedCount() << " failed)\n";

    g_platform = nullptr;
    return exitCode;
}
