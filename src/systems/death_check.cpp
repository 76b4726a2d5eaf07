#include "death_check.hpp"
#include "../components.hpp"
#include "../game_state.hpp"
#include "../world_access.hpp"

using namespace ecs;

bool DeathCheckSystem::Update(World& world) {
    auto& machine = gemrun::require_resource<GameStateMachine>(world, "GameStateMachine");
    if (!machine.is(GameState::Playing)) return false;

    auto player = gemrun::require_single<PlayerTag>(world, "player");
    const auto& health = gemrun::require_component<Health>(world, player, "Health");
    if (!health.depleted()) return false;

    return machine.transition(world, GameState::GameOver);
}
