#include "snapshot.hpp"
#include "components.hpp"
#include "world_access.hpp"

using namespace gemrun;

GameSnapshot take_snapshot(ecs::World& world) {
    GameSnapshot snap;
    snap.score = require_resource<Score>(world, "Score").value();
    snap.state = require_resource<GameStateMachine>(world, "GameStateMachine").current();

    auto player = require_single<PlayerTag>(world, "player");
    const auto& health = require_component<Health>(world, player, "Health");
    snap.health_current = health.current();
    snap.health_max     = health.max();

    world.each<Gem>([&](ecs::Entity, Gem&) { ++snap.gems_alive; });
    return snap;
}
