#include "setup.hpp"
#include "components.hpp"
#include "game_state.hpp"
#include "hud.hpp"
#include <ecs/modules/transform.hpp>

float GameSetup::track_x(const GameConfig& cfg, std::size_t i) {
    return static_cast<float>(i) * cfg.gems.spacing + cfg.gems.offset;
}

void GameSetup::insert_resources(ecs::World& world, const GameConfig& cfg) {
    world.set_resource(cfg);
    world.set_resource(Score{});
    world.set_resource(MainCamera{});
    world.set_resource(GameStateMachine{});
    world.set_resource(HudText{});
}

ecs::Entity GameSetup::spawn_player(ecs::World& world, const GameConfig& cfg) {
    auto ent = world.create();
    world.add(ent, ecs::LocalTransform{{0.0f, 0.0f, 0.0f}, {0, 0, 0, 1}, {1, 1, 1}});
    world.add(ent, Sprite{SpriteKind::Player, cfg.player.size});
    world.add(ent, Health{cfg.player.max_health});
    world.add(ent, PlayerInput{});
    world.add(ent, PlayerTag{});
    return ent;
}

ecs::Entity GameSetup::spawn_gem(ecs::World& world, const GameConfig& cfg,
                                 std::size_t order, float x, float y) {
    auto ent = world.create();
    world.add(ent, ecs::LocalTransform{{x, y, 0.0f}, {0, 0, 0, 1}, {1, 1, 1}});
    world.add(ent, Sprite{SpriteKind::Gem, cfg.gems.size});
    world.add(ent, Gem{order});
    return ent;
}

void GameSetup::populate(ecs::World& world, const GameConfig& cfg, std::mt19937& rng) {
    insert_resources(world, cfg);
    spawn_player(world, cfg);

    // Half-open scatter band [scatter_min, scatter_max).
    std::uniform_real_distribution<float> scatter(cfg.gems.scatter_min, cfg.gems.scatter_max);
    for (int i = 0; i < cfg.gems.count; ++i) {
        const auto order = static_cast<std::size_t>(i);
        const float y = scatter(rng);
        spawn_gem(world, cfg, order, track_x(cfg, order), y);
    }
}
