#include "WaveScheduler.h"

#include <algorithm>
#include <cmath>
#include <string>

#include "../../engine/core/Logger.h"

namespace Rampart {

EnemyScaling WaveScheduler::scalingFor(const DifficultyConfig& difficulty, int wave) {
    const double steps = static_cast<double>(std::max(0, wave - 1));
    EnemyScaling s{};
    s.health = static_cast<float>(std::pow(difficulty.healthGrowth, steps));
    s.speed = static_cast<float>(std::min(difficulty.speedCap, std::pow(difficulty.speedGrowth, steps)));
    return s;
}

WaveDefinition WaveScheduler::generateEndless(const EndlessConfig& endless, int wave) {
    const int w = std::max(1, wave);
    const double log = std::log10(static_cast<double>(w) + 1.0);
    const int count = std::min(endless.maxEnemyCount, endless.baseEnemyCount + static_cast<int>(std::floor(12.0 * log)));
    const float delay = std::max(endless.minSpawnDelay,
                                 endless.baseSpawnDelay - 0.1f * static_cast<float>(std::log10(static_cast<double>(w))));

    // Mix shifts towards tougher enemies as waves climb.
    const int tanks = std::min(count / 4, w / 4);
    const int fast = std::min(count - tanks, count / 3);
    const int basic = count - tanks - fast;

    WaveDefinition def;
    def.startDelaySeconds = endless.startDelaySeconds;
    if (basic > 0) def.entries.push_back(SpawnEntry{EnemyType::Basic, basic, delay, false, std::nullopt});
    if (fast > 0) def.entries.push_back(SpawnEntry{EnemyType::Fast, fast, delay * 0.8f, false, std::nullopt});
    if (tanks > 0) def.entries.push_back(SpawnEntry{EnemyType::Tank, tanks, delay * 2.0f, false, std::nullopt});
    if (endless.bossInterval > 0 && w % endless.bossInterval == 0) {
        def.entries.push_back(SpawnEntry{endless.bossType, 1, 0.0f, true, std::nullopt});
    }
    return def;
}

std::int64_t WaveScheduler::clearBonus(const GameConfig& config, int wave) {
    std::int64_t bonus = config.economy.waveClearBonus * static_cast<std::int64_t>(std::max(0, wave));
    if (wave > static_cast<int>(config.waves.size())) {
        bonus += static_cast<std::int64_t>(std::floor(10.0 * std::log10(static_cast<double>(wave) + 1.0)));
    }
    return bonus;
}

bool WaveScheduler::hasMoreWaves(const GameConfig& config) const {
    return config.endless.enabled || wave_ < static_cast<int>(config.waves.size());
}

std::optional<WaveDefinition> WaveScheduler::definitionFor(const GameConfig& config, int wave) const {
    if (wave <= 0) return std::nullopt;
    if (wave <= static_cast<int>(config.waves.size())) return config.waves[static_cast<std::size_t>(wave - 1)];
    if (config.endless.enabled) return generateEndless(config.endless, wave);
    return std::nullopt;
}

CommandResult WaveScheduler::startNext(SimContext& ctx) {
    if (state_ != WaveState::Idle && state_ != WaveState::Complete) {
        return CommandResult::fail(CommandError::InvalidState);
    }
    auto def = definitionFor(ctx.config, wave_ + 1);
    if (!def) return CommandResult::fail(CommandError::NoMoreWaves);

    ++wave_;
    elapsed_ = 0.0;
    roundRobin_ = 0;
    alive_.clear();
    cursors_.clear();
    int total = 0;
    for (const SpawnEntry& entry : def->entries) {
        if (entry.count <= 0) continue;
        cursors_.push_back(EntryCursor{entry, 0, static_cast<double>(def->startDelaySeconds)});
        total += entry.count;
    }
    state_ = WaveState::Spawning;

    const bool generated = wave_ > static_cast<int>(ctx.config.waves.size());
    ctx.journal.record(WaveStarted{wave_, total, generated});
    Engine::logInfo("Wave " + std::to_string(wave_) + " started with " + std::to_string(total) + " enemies");
    return CommandResult::ok(wave_);
}

void WaveScheduler::spawnDue(SimContext& ctx) {
    const EnemyScaling scaling = scalingFor(ctx.config.difficulty, wave_);
    const int spawnCount = static_cast<int>(ctx.grid.spawns().size());
    while (true) {
        // Earliest due spawn; ties go to the earlier entry.
        EntryCursor* next = nullptr;
        for (auto& c : cursors_) {
            if (c.spawned >= c.entry.count || c.nextAt > elapsed_) continue;
            if (!next || c.nextAt < next->nextAt) next = &c;
        }
        if (!next) break;

        int spawnIndex = 0;
        if (next->entry.spawnIndex) {
            spawnIndex = *next->entry.spawnIndex;
        } else if (spawnCount > 0) {
            spawnIndex = roundRobin_ % spawnCount;
            ++roundRobin_;
        }
        const auto e = EntityFactory::spawnEnemy(ctx, next->entry.type, spawnIndex, wave_, next->entry.boss, scaling);
        alive_.insert(e);
        ++next->spawned;
        next->nextAt += static_cast<double>(next->entry.delaySeconds);
    }
}

void WaveScheduler::pruneAlive(const SimContext& ctx) {
    for (auto it = alive_.begin(); it != alive_.end();) {
        if (!ctx.registry.valid(*it)) {
            it = alive_.erase(it);
        } else {
            ++it;
        }
    }
}

void WaveScheduler::update(SimContext& ctx) {
    switch (state_) {
        case WaveState::Idle:
        case WaveState::Complete:
            return;
        case WaveState::Spawning: {
            elapsed_ += ctx.step.deltaSeconds;
            spawnDue(ctx);
            const bool done = std::all_of(cursors_.begin(), cursors_.end(),
                                          [](const EntryCursor& c) { return c.spawned >= c.entry.count; });
            if (!done) return;
            state_ = WaveState::Active;
            pruneAlive(ctx);
            break;
        }
        case WaveState::Active:
            pruneAlive(ctx);
            break;
    }

    if (state_ == WaveState::Active && alive_.empty()) {
        state_ = WaveState::Complete;
        const std::int64_t bonus = clearBonus(ctx.config, wave_);
        ctx.outcome.waveBonus += bonus;
        ctx.journal.record(WaveCompleted{wave_, bonus});
        Engine::logInfo("Wave " + std::to_string(wave_) + " complete, bonus " + std::to_string(bonus));
    }
}

bool WaveScheduler::finalWaveCleared(const GameConfig& config) const {
    if (config.endless.enabled) return false;
    return state_ == WaveState::Complete && wave_ >= static_cast<int>(config.waves.size());
}

void WaveScheduler::reset() {
    state_ = WaveState::Idle;
    wave_ = 0;
    elapsed_ = 0.0;
    cursors_.clear();
    alive_.clear();
    roundRobin_ = 0;
}

}  // namespace Rampart
