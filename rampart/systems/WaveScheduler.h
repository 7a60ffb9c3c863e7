// Drives scripted and endless waves: timed spawns, difficulty scaling and completion.
#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <vector>

#include "../../engine/ecs/Entity.h"
#include "../CommandResult.h"
#include "../config/GameConfig.h"
#include "../sim/SimContext.h"
#include "../world/EntityFactory.h"

namespace Rampart {

class WaveScheduler {
public:
    WaveState state() const { return state_; }
    // 1-based; 0 before the first wave.
    int currentWave() const { return wave_; }

    bool hasMoreWaves(const GameConfig& config) const;
    // Scripted definition, or a generated one when endless mode covers `wave`.
    std::optional<WaveDefinition> definitionFor(const GameConfig& config, int wave) const;

    // Allowed from Idle (no wave yet) or Complete. Fails with InvalidState or NoMoreWaves.
    CommandResult startNext(SimContext& ctx);

    void update(SimContext& ctx);

    // True once the last scripted wave is complete and endless mode is off.
    bool finalWaveCleared(const GameConfig& config) const;

    std::size_t aliveCount() const { return alive_.size(); }

    void reset();

    // health = growth^(wave-1); speed = min(cap, growth^(wave-1)).
    static EnemyScaling scalingFor(const DifficultyConfig& difficulty, int wave);
    static WaveDefinition generateEndless(const EndlessConfig& endless, int wave);
    static std::int64_t clearBonus(const GameConfig& config, int wave);

private:
    struct EntryCursor {
        SpawnEntry entry;
        int spawned{0};
        double nextAt{0.0};
    };

    void spawnDue(SimContext& ctx);
    void pruneAlive(const SimContext& ctx);

    WaveState state_{WaveState::Idle};
    int wave_{0};
    double elapsed_{0.0};
    std::vector<EntryCursor> cursors_;
    std::set<Engine::ECS::Entity> alive_;
    int roundRobin_{0};
};

}  // namespace Rampart
