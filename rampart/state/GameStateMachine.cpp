#include "GameStateMachine.h"

namespace Rampart {

bool GameStateMachine::canTransition(GameState to) const {
    if (to == state_) return false;
    switch (to) {
        case GameState::Menu: return true;
        case GameState::Playing: return state_ == GameState::Menu || state_ == GameState::Paused;
        case GameState::Paused: return state_ == GameState::Playing;
        case GameState::GameOver: return state_ == GameState::Playing;
        case GameState::Victory: return state_ == GameState::Playing;
    }
    return false;
}

bool GameStateMachine::transition(GameState to) {
    if (!canTransition(to)) return false;
    const GameState before = state_;
    state_ = to;
    ++transitions_;
    if (listener_) listener_(before, to);
    return true;
}

bool GameStateMachine::start() {
    if (state_ != GameState::Menu) return false;
    return transition(GameState::Playing);
}

bool GameStateMachine::pause() { return transition(GameState::Paused); }

bool GameStateMachine::resume() {
    if (state_ != GameState::Paused) return false;
    return transition(GameState::Playing);
}

bool GameStateMachine::lose() { return transition(GameState::GameOver); }

bool GameStateMachine::win() { return transition(GameState::Victory); }

bool GameStateMachine::reset() { return transition(GameState::Menu); }

}  // namespace Rampart
