#include "engine/Simulation.hpp"
#include "utils/Logger.hpp"
#include <iostream>
#include <csignal>
#include <string>

using namespace foobar;

static Simulation* g_sim = nullptr;

void signalHandler(int signal) {
    std::cout << "\nReceived signal " << signal << ", shutting down..." << std::endl;

    if (g_sim) {
        g_sim->stop();
    }
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::string configPath;
    std::string logLevel;
    std::string eventLogPath;
    std::string summaryPath;
    long long seed = -1;
    long long maxTicks = -1;
    int tickRateMs = -1;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            }
            else if (arg == "--seed" && i + 1 < argc) {
                seed = std::stoll(argv[++i]);
            }
            else if (arg == "--max-ticks" && i + 1 < argc) {
                maxTicks = std::stoll(argv[++i]);
            }
            else if (arg == "--tick-rate" && i + 1 < argc) {
                tickRateMs = std::stoi(argv[++i]);
            }
            else if (arg == "--log-level" && i + 1 < argc) {
                logLevel = argv[++i];
            }
            else if (arg == "--event-log" && i + 1 < argc) {
                eventLogPath = argv[++i];
            }
            else if (arg == "--summary" && i + 1 < argc) {
                summaryPath = argv[++i];
            }
            else if (arg == "--help") {
                std::cout << "Foobar Factory Simulation\n"
                    << "Usage: foobar_sim [options]\n"
                    << "Options:\n"
                    << "  --config <path>       JSON config file\n"
                    << "  --seed <n>            Random seed (0 = nondeterministic)\n"
                    << "  --max-ticks <n>       Stop after n ticks (0 = unlimited)\n"
                    << "  --tick-rate <ms>      Real-time delay between ticks (default: 0)\n"
                    << "  --log-level <level>   trace, debug, info, warn, error, off\n"
                    << "  --event-log <path>    Export every event as JSON\n"
                    << "  --summary <path>      Write a JSON summary of the run\n"
                    << "  --help                Show this help\n";
                return 0;
            }
            else {
                std::cerr << "Unknown option: " << arg << " (try --help)\n";
                return 1;
            }
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        return 1;
    }

    try {
        Logger::init("foobar_sim.log", "info", true);

        Logger::info("=== Foobar Factory Simulation ===");

        Simulation sim;
        g_sim = &sim;

        if (!configPath.empty()) {
            Logger::info("Config: {}", configPath);
            sim.loadConfig(configPath);
        }

        // Command line wins over the config file
        auto& cfg = sim.getRuntimeConfig();
        if (seed >= 0) cfg.simulation.seed = static_cast<uint32_t>(seed);
        if (maxTicks >= 0) cfg.simulation.maxTicks = static_cast<uint64_t>(maxTicks);
        if (tickRateMs >= 0) cfg.simulation.tickRateMs = tickRateMs;
        if (!eventLogPath.empty()) cfg.report.eventLogPath = eventLogPath;
        if (!summaryPath.empty()) cfg.report.summaryPath = summaryPath;
        if (!logLevel.empty()) Logger::setLevel(logLevel);

        sim.initialize();
        sim.run();

        const auto& world = sim.getWorld();
        Logger::info("Final fleet: {} robots after {} ticks ({} simulated), {} money left",
            world.getFleetSize(), world.getTick(),
            world.getClock().currentElapsedString(), world.getMoney());

        if (!sim.writeReports()) {
            Logger::warn("Some reports could not be written");
        }

        g_sim = nullptr;
    }
    catch (const std::exception& e) {
        Logger::error("Fatal error: {}", e.what());
        return 1;
    }

    Logger::info("Shutdown complete");
    return 0;
}
