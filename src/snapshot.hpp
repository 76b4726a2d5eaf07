#pragma once
#include "game_state.hpp"
#include <ecs/ecs.hpp>
#include <cstddef>

// Read-only view handed to presentation code between ticks.
struct GameSnapshot {
    std::size_t score = 0;
    int health_current = 0;
    int health_max = 0;
    GameState state = GameState::Playing;
    std::size_t gems_alive = 0;
};

// Throws std::logic_error if the player or a gameplay resource is missing.
GameSnapshot take_snapshot(ecs::World& world);
