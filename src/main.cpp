#include <cstdint>
#include <cstdlib>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../engine/core/Logger.h"
#include "../rampart/config/ConfigLoader.h"
#include "../rampart/config/GameConfig.h"
#include "../rampart/meta/ScoreHistory.h"
#include "../rampart/observer/ChangeObserver.h"
#include "../rampart/sim/Simulation.h"

namespace {

struct RunOptions {
    std::string configPath{"data/default_config.json"};
    std::string historyPath{"saves/scores.json"};
    std::uint64_t maxTicks{200000};
    double tickSeconds{1.0 / 60.0};
    bool verbose{false};
};

std::optional<RunOptions> parseArgs(int argc, char** argv) {
    RunOptions opts{};
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> const char* { return (i + 1 < argc) ? argv[++i] : nullptr; };
        if (arg == "--history") {
            const char* v = next();
            if (!v) return std::nullopt;
            opts.historyPath = v;
        } else if (arg == "--max-ticks") {
            const char* v = next();
            if (!v) return std::nullopt;
            opts.maxTicks = std::strtoull(v, nullptr, 10);
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return std::nullopt;
        } else {
            opts.configPath = arg;
        }
    }
    return opts;
}

// Cells next to the current route from the first spawn, nearest the goal first.
std::vector<Rampart::Cell> buildCandidates(const Rampart::Simulation& sim) {
    std::vector<Rampart::Cell> out;
    const auto& grid = sim.grid();
    if (grid.spawns().empty()) return out;
    auto route = sim.planner().routeFrom(grid, grid.spawns().front());
    if (!route) return out;
    const auto& cells = route->cells();
    for (auto it = cells.rbegin(); it != cells.rend(); ++it) {
        for (const auto& n : grid.neighbors(*it)) {
            if (!grid.isBuildable(n)) continue;
            bool seen = false;
            for (const auto& c : out) seen = seen || c == n;
            if (!seen) out.push_back(n);
        }
    }
    return out;
}

// Spends what it can: new towers first, then damage upgrades on existing ones.
void autoBuild(Rampart::Simulation& sim) {
    using Rampart::TowerAttribute;
    using Rampart::TowerType;
    for (const auto& cell : buildCandidates(sim)) {
        if (!sim.canAfford(sim.towerCost(TowerType::Basic))) break;
        if (sim.grid().towerAt(cell) != Engine::ECS::kInvalidEntity) continue;
        const auto result = sim.placeTower(cell, TowerType::Basic);
        if (!result && result.error == Rampart::CommandError::InsufficientFunds) break;
    }
    for (const auto& tower : sim.getTowers()) {
        const auto cost = sim.towerUpgradeCost(tower.id, TowerAttribute::Damage);
        if (!cost || !sim.canAfford(*cost)) continue;
        if (!sim.upgradeTower(tower.id, TowerAttribute::Damage)) break;
    }
}

void logEvent(const Rampart::GameEvent& ev) {
    using namespace Rampart;
    std::string line = "[tick " + std::to_string(ev.tick) + "] " + std::string(toString(ev.type()));
    if (const auto* p = ev.as<WaveStarted>()) {
        line += " wave=" + std::to_string(p->wave) + " enemies=" + std::to_string(p->enemyCount);
    } else if (const auto* p = ev.as<WaveCompleted>()) {
        line += " wave=" + std::to_string(p->wave) + " bonus=" + std::to_string(p->bonus);
    } else if (const auto* p = ev.as<EnemyKilled>()) {
        line += " enemy=" + std::to_string(p->enemy) + " killer=" + std::to_string(p->killer) +
                " reward=" + std::to_string(p->reward);
    } else if (const auto* p = ev.as<LivesChanged>()) {
        line += " " + std::to_string(p->before) + " -> " + std::to_string(p->after);
    } else if (const auto* p = ev.as<TowerPlaced>()) {
        line += " tower=" + std::to_string(p->tower) + " type=" + std::string(toString(p->type));
    } else if (const auto* p = ev.as<GameOver>()) {
        line += std::string(p->won ? " won" : " lost") + " score=" + std::to_string(p->score);
    }
    Engine::logInfo(line);
}

}  // namespace

int main(int argc, char** argv) {
    const auto opts = parseArgs(argc, argv);
    if (!opts) {
        Engine::logError("Usage: rampart_headless [config.json] [--history path] [--max-ticks N] [--verbose]");
        return 2;
    }
    Engine::Logger::setMinLevel(opts->verbose ? Engine::LogLevel::Debug : Engine::LogLevel::Info);

    auto config = Rampart::ConfigLoader::loadFromFile(opts->configPath);
    if (!config) {
        Engine::logWarn("Falling back to built-in defaults (could not load " + opts->configPath + ")");
        config = Rampart::defaultConfig();
    }
    const auto problems = Rampart::validateConfig(*config);
    if (!problems.empty()) {
        for (const auto& p : problems) Engine::logError("Config: " + p);
        return 1;
    }

    std::unique_ptr<Rampart::Simulation> simPtr;
    try {
        simPtr = std::make_unique<Rampart::Simulation>(*config);
    } catch (const std::invalid_argument& e) {
        Engine::logError(e.what());
        return 1;
    }
    Rampart::Simulation& sim = *simPtr;
    Rampart::ChangeObserver observer(sim);
    const bool everything = opts->verbose;
    observer.subscribeAll([everything](const Rampart::GameEvent& ev) {
        switch (ev.type()) {
            case Rampart::EventType::EnemySpawned:
            case Rampart::EventType::CurrencyChanged:
            case Rampart::EventType::ScoreChanged:
            case Rampart::EventType::CollectiblePicked:
            case Rampart::EventType::PlayerDamaged:
            case Rampart::EventType::PlayerHealed:
                if (everything) logEvent(ev);
                break;
            default:
                logEvent(ev);
                break;
        }
    });

    if (!sim.start()) return 1;
    autoBuild(sim);
    observer.pump();

    while (sim.tickCount() < opts->maxTicks) {
        const auto waveState = sim.getWaveState();
        if ((waveState == Rampart::WaveState::Idle || waveState == Rampart::WaveState::Complete) &&
            sim.hasMoreWaves()) {
            autoBuild(sim);
            if (!sim.startNextWave()) break;
        }
        try {
            sim.tick(opts->tickSeconds);
        } catch (const Rampart::InvariantViolation& e) {
            observer.pump();
            Engine::logError(std::string("Session aborted: ") + e.what());
            return 3;
        }
        observer.pump();
        if (sim.getState() == Rampart::GameState::GameOver || sim.getState() == Rampart::GameState::Victory) break;
    }

    const bool won = sim.getState() == Rampart::GameState::Victory;
    Engine::logInfo("Session finished: " + std::string(won ? "victory" : "not won") + " wave " +
                    std::to_string(sim.getCurrentWave()) + " score " + std::to_string(sim.getScore()) + " in " +
                    std::to_string(sim.elapsedSeconds()) + "s");

    Rampart::JsonFileScoreHistory history(opts->historyPath);
    Rampart::ScoreEntry entry{};
    entry.score = sim.getScore();
    entry.wave = sim.getCurrentWave();
    entry.won = won;
    entry.seconds = sim.elapsedSeconds();
    if (!history.record(entry)) {
        Engine::logWarn("Score not saved to " + history.path());
    } else {
        Engine::logInfo("Best score so far: " + std::to_string(Rampart::bestScore(history.load())));
    }
    return 0;
}
