#pragma once
#include <ecs/ecs.hpp>
#include <functional>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// GameStateMachine — two-state latch stored as a World resource.
//
// Playing is the initial state; GameOver is terminal. The only writer is
// DeathCheckSystem. on_enter hooks run synchronously inside the transition,
// once, in registration order. Hooks must not add or remove resources.
// ---------------------------------------------------------------------------

enum class GameState { Playing, GameOver };

inline const char* to_string(GameState s) {
    return s == GameState::Playing ? "Playing" : "GameOver";
}

class DeathCheckSystem;

class GameStateMachine {
public:
    using Hook = std::function<void(ecs::World&)>;

    GameState current() const { return current_; }
    bool is(GameState s) const { return current_ == s; }

    void on_enter(GameState s, Hook fn) { hooks_.emplace_back(s, std::move(fn)); }

private:
    friend class DeathCheckSystem;

    // Only Playing -> GameOver is legal; any other request is ignored.
    // Returns true if the state changed.
    bool transition(ecs::World& world, GameState next) {
        if (current_ != GameState::Playing || next != GameState::GameOver) return false;
        current_ = next;
        for (auto& [state, fn] : hooks_) {
            if (state == next) fn(world);
        }
        return true;
    }

    GameState current_ = GameState::Playing;
    std::vector<std::pair<GameState, Hook>> hooks_;
};
