#include "hud.hpp"
#include "../hud.hpp"
#include "../snapshot.hpp"
#include "../world_access.hpp"

using namespace ecs;

std::string HudSystem::format_health(int current, int max) {
    return std::to_string(current) + "/" + std::to_string(max);
}

void HudSystem::UpdateScoreboard(World& world) {
    auto& hud = gemrun::require_resource<HudText>(world, "HudText");
    hud.score = std::to_string(take_snapshot(world).score);
}

void HudSystem::UpdateHealth(World& world) {
    auto& hud = gemrun::require_resource<HudText>(world, "HudText");
    const auto snap = take_snapshot(world);
    hud.health = format_health(snap.health_current, snap.health_max);
}

void HudSystem::UpdateGameOver(World& world) {
    auto& hud = gemrun::require_resource<HudText>(world, "HudText");
    const auto state = gemrun::require_resource<GameStateMachine>(world, "GameStateMachine").current();
    hud.game_over = (state == GameState::GameOver) ? HudText::kGameOverText : "";
}
