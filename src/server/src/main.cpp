// SkyClash Arena - Headless Host
// [SIM_AGENT] Runs a bot match without rendering and prints what happens

#include "sim/ArenaSimulation.hpp"
#include "config/ArenaConfig.hpp"
#include "Constants.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

using namespace SkyClash;

namespace {

std::atomic<bool> g_running{true};

void handleSignal(int) {
    g_running = false;
}

void printUsage(const char* programName) {
    std::cout << "SkyClash Arena Host v" << Constants::VERSION << "\n"
              << "Usage: " << programName << " [options]\n"
              << "\nOptions:\n"
              << "  --config <file>       Arena config JSON (default: built-in)\n"
              << "  --bots <num>          Bots to add (default: " << Constants::DEFAULT_BOT_COUNT << ")\n"
              << "  --duration <sec>      Match length in seconds (default: "
              << Constants::DEFAULT_MATCH_DURATION_SECONDS << ")\n"
              << "  --seed <num>          Random seed, overrides the config\n"
              << "  --realtime            Pace ticks to wall-clock time\n"
              << "  --quiet               Only print the final score\n"
              << "  --help, -h            Show this help\n";
}

void printEvent(const ArenaSimulation& arena, const GameEvent& event) {
    // Fire and hit events are too chatty for a console
    if (event.type == GameEventType::PROJECTILE_FIRED || event.type == GameEventType::PROJECTILE_HIT) {
        return;
    }

    const Registry& registry = arena.getRegistry();
    std::string subject = "-";
    if (registry.valid(event.subject)) {
        if (const PlayerInfo* info = registry.try_get<PlayerInfo>(event.subject)) {
            subject = info->displayName;
        }
    }

    std::cout << "[EVENT] t=" << event.timeMs / 1000.0f << "s " << gameEventLabel(event.type)
              << " " << subject;
    if (event.team) {
        std::cout << " team=" << teamLabel(*event.team);
    }
    if (!event.detail.empty()) {
        std::cout << " " << event.detail;
    }
    std::cout << "\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        ArenaConfig config = ArenaConfig::defaults();
        std::string configPath;
        uint32_t botCount = Constants::DEFAULT_BOT_COUNT;
        float duration = Constants::DEFAULT_MATCH_DURATION_SECONDS;
        bool seedOverride = false;
        uint32_t seed = 0;
        bool realtime = false;
        bool quiet = false;

        // Parse command line arguments
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            } else if (arg == "--bots" && i + 1 < argc) {
                botCount = static_cast<uint32_t>(std::atoi(argv[++i]));
            } else if (arg == "--duration" && i + 1 < argc) {
                duration = static_cast<float>(std::atof(argv[++i]));
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
                seedOverride = true;
            } else if (arg == "--realtime") {
                realtime = true;
            } else if (arg == "--quiet") {
                quiet = true;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }

        if (!configPath.empty() && !loadArenaConfig(configPath, config)) {
            std::cerr << "\nFailed to load config. Check logs for details.\n";
            return 1;
        }
        if (seedOverride) {
            config.seed = seed;
        }
        if (!(duration > 0.0f)) {
            std::cerr << "Duration must be positive\n";
            return 1;
        }

        std::cout << "SkyClash Arena Host v" << Constants::VERSION << "\n";
        std::cout << "Seed: " << config.seed << "\n";
        std::cout << "Bots: " << botCount << " (max players " << config.maxPlayers << ")\n";
        std::cout << "Duration: " << duration << " s at " << config.tickRateHz << " Hz\n\n";

        ArenaSimulation arena(config);
        if (!quiet) {
            arena.setOnEvent([&arena](const GameEvent& event) { printEvent(arena, event); });
        }

        for (uint32_t i = 0; i < botCount; ++i) {
            if (arena.addBot() == entt::null) {
                break;
            }
        }

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        const float dt = 1.0f / static_cast<float>(config.tickRateHz);
        const uint64_t totalTicks = static_cast<uint64_t>(duration * static_cast<float>(config.tickRateHz));
        const auto tickInterval = std::chrono::microseconds(1000000 / config.tickRateHz);
        auto nextTick = std::chrono::steady_clock::now();

        for (uint64_t tick = 0; tick < totalTicks && g_running; ++tick) {
            arena.tick(dt);

            if (realtime) {
                nextTick += tickInterval;
                std::this_thread::sleep_until(nextTick);
            }
        }

        std::cout << "\n========================================\n";
        std::cout << "Match over after " << arena.getCurrentTick() << " ticks ("
                  << arena.getCurrentTimeMs() / 1000.0f << " s)\n";
        for (TeamId team : ALL_TEAMS) {
            std::cout << "  " << teamLabel(team) << ": " << arena.getScore(team) << "\n";
        }
        std::cout << "========================================\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\nFatal error: " << e.what() << "\n";
        return 1;
    }
}
