// Outcome of a validated command: success flag, failure reason and optional value.
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace Rampart {

enum class CommandError {
    None,
    InsufficientFunds,
    OccupiedCell,
    OutOfBounds,
    NotBuildable,
    WouldBlockPath,
    MaxLevelReached,
    NoTargetSelected,
    UnknownEntity,
    InvalidState,
    NoMoreWaves
};

inline std::string_view toString(CommandError err) {
    switch (err) {
        case CommandError::None: return "none";
        case CommandError::InsufficientFunds: return "insufficient_funds";
        case CommandError::OccupiedCell: return "occupied_cell";
        case CommandError::OutOfBounds: return "out_of_bounds";
        case CommandError::NotBuildable: return "not_buildable";
        case CommandError::WouldBlockPath: return "would_block_path";
        case CommandError::MaxLevelReached: return "max_level_reached";
        case CommandError::NoTargetSelected: return "no_target_selected";
        case CommandError::UnknownEntity: return "unknown_entity";
        case CommandError::InvalidState: return "invalid_state";
        case CommandError::NoMoreWaves: return "no_more_waves";
    }
    return "unknown";
}

// `value` carries the new entity id for placements, the refund for sells
// and the new level for upgrades. Zero otherwise.
struct CommandResult {
    CommandError error{CommandError::None};
    std::int64_t value{0};

    static CommandResult ok(std::int64_t v = 0) { return CommandResult{CommandError::None, v}; }
    static CommandResult fail(CommandError e) { return CommandResult{e, 0}; }

    bool succeeded() const { return error == CommandError::None; }
    explicit operator bool() const { return succeeded(); }
};

// Thrown out of Simulation::tick when internal state is inconsistent.
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
};

}  // namespace Rampart
