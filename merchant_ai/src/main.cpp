#include "engine/Simulation.hpp"
#include "utils/Logger.hpp"
#include <iostream>
#include <string>

using namespace merchant;

int main(int argc, char* argv[]) {
    std::string configPath = "merchant_ai.json";
    int turns = -1;
    long long seed = -1;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            }
            else if (arg == "--turns" && i + 1 < argc) {
                turns = std::stoi(argv[++i]);
            }
            else if (arg == "--seed" && i + 1 < argc) {
                seed = std::stoll(argv[++i]);
            }
            else if (arg == "--help") {
                std::cout << "Merchant AI Simulation\n"
                    << "Usage: merchant_sim [options]\n"
                    << "Options:\n"
                    << "  --config <path>    Path to JSON config (default: merchant_ai.json)\n"
                    << "  --turns <n>        Number of turns to run (overrides config)\n"
                    << "  --seed <n>         Random seed (overrides config)\n"
                    << "  --help             Show this help\n";
                return 0;
            }
            else {
                std::cerr << "Unknown option: " << arg << " (see --help)\n";
                return 1;
            }
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        return 1;
    }

    try {
        Logger::init("merchant_ai.log", "info", true);

        Logger::info("=== Merchant AI Simulation ===");
        Logger::info("Config: {}", configPath);

        Simulation sim;
        sim.loadConfig(configPath);

        if (turns >= 0) sim.getRuntimeConfig().simulation.turns = turns;
        if (seed >= 0) sim.getRuntimeConfig().simulation.seed = static_cast<uint32_t>(seed);

        sim.initialize();
        sim.run();
    }
    catch (const std::exception& e) {
        Logger::error("Fatal error: {}", e.what());
        return 1;
    }

    Logger::info("Shutdown complete");
    return 0;
}
