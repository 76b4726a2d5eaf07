#pragma once
#include "config.hpp"
#include <ecs/ecs.hpp>
#include <cstddef>
#include <random>

// ---------------------------------------------------------------------------
// GameSetup — populates an empty World for a new run.
//
// Creates the gameplay resources (GameConfig, Score, MainCamera,
// GameStateMachine, HudText), the single player at the origin, and
// `gems.count` gems laid out along the scroll axis. The random source is
// passed in so a seeded run is reproducible.
// No raylib dependency — compilable in the headless test target.
// ---------------------------------------------------------------------------

class GameSetup {
public:
    static void populate(ecs::World& world, const GameConfig& cfg, std::mt19937& rng);

    // Resources only, no entities.
    static void insert_resources(ecs::World& world, const GameConfig& cfg);

    static ecs::Entity spawn_player(ecs::World& world, const GameConfig& cfg);

    // Places one gem at (x, y). `order` decides pickup order within a tick.
    static ecs::Entity spawn_gem(ecs::World& world, const GameConfig& cfg,
                                 std::size_t order, float x, float y);

    // Track position of gem i: x = i * spacing + offset.
    static float track_x(const GameConfig& cfg, std::size_t i);
};
