// Top-level session state with explicit, recorded transitions.
#pragma once

#include <cstddef>
#include <functional>

#include "../Types.h"

namespace Rampart {

class GameStateMachine {
public:
    // Called once per actual transition with (before, after).
    using Listener = std::function<void(GameState, GameState)>;

    GameState state() const { return state_; }
    void setListener(Listener listener) { listener_ = std::move(listener); }

    // MENU -> PLAYING
    bool start();
    // PLAYING -> PAUSED
    bool pause();
    // PAUSED -> PLAYING
    bool resume();
    // PLAYING -> GAME_OVER
    bool lose();
    // PLAYING -> VICTORY
    bool win();
    // any -> MENU
    bool reset();

    bool canTransition(GameState to) const;
    // False, with nothing recorded, for disallowed moves and for moves into the current state.
    bool transition(GameState to);

    bool advancesGameplay() const { return state_ == GameState::Playing; }
    bool isTerminal() const { return state_ == GameState::GameOver || state_ == GameState::Victory; }
    std::size_t transitionCount() const { return transitions_; }

private:
    GameState state_{GameState::Menu};
    Listener listener_;
    std::size_t transitions_{0};
};

}  // namespace Rampart
