#pragma once
#include "../debug_panel.hpp"
#include "../game_state.hpp"
#include "../hud.hpp"
#include "../pipeline.hpp"
#include "../systems/death_check.hpp"
#include "../systems/hud.hpp"
#include <ecs/ecs.hpp>
#include <string>

// ---------------------------------------------------------------------------
// StateModule
//
// Frame-phase wiring, after the fixed ticks of the frame:
//
//   DeathCheck        (always)        may latch Playing -> GameOver
//   Scoreboard, Health UI (Playing)   frozen once the game is over
//   GameOver UI       (always)        keeps the terminal message rendered
//
// Also hooks on_enter(GameOver): the gated HUD systems will not run again, so
// the hook writes the final score / health once more along with the terminal
// message. No raylib dependency.
// ---------------------------------------------------------------------------

struct StateModule {
    static void install(ecs::World& world, gemrun::Pipeline& pipeline) {
        gemrun::require_resource<GameStateMachine>(world, "GameStateMachine")
            .on_enter(GameState::GameOver, [](ecs::World& w) {
                HudSystem::UpdateScoreboard(w);
                HudSystem::UpdateHealth(w);
                gemrun::require_resource<HudText>(w, "HudText").game_over = HudText::kGameOverText;
            });

        const auto playing = gemrun::in_state(GameState::Playing);
        pipeline.add_frame([](ecs::World& w, float) { DeathCheckSystem::Update(w); });
        pipeline.add_frame(playing, [](ecs::World& w, float) { HudSystem::UpdateScoreboard(w); });
        pipeline.add_frame(playing, [](ecs::World& w, float) { HudSystem::UpdateHealth(w); });
        pipeline.add_frame([](ecs::World& w, float) { HudSystem::UpdateGameOver(w); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Gameplay", "State", [&world]() {
                auto* machine = world.try_resource<GameStateMachine>();
                return machine ? std::string(to_string(machine->current())) : std::string("-");
            });
        }
    }
};
