#pragma once
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../pipeline.hpp"
#include "../systems/camera_follow.hpp"
#include "../systems/motion.hpp"
#include "../systems/hud.hpp"
#include "../systems/pickup.hpp"
#include <ecs/ecs.hpp>
#include <string>

// ---------------------------------------------------------------------------
// GameplayModule
//
// Registers the pickup event queues and wires the fixed-tick chain:
//
//   Motion        (Playing only)  writes the player position
//   CameraFollow  (always)        reads it
//   Pickup        (Playing only)  reads it, writes Score / Health
//
// The order is load-bearing. Requires EventBusModule and GameSetup's
// resources. No raylib dependency; the headless tests install it as is.
// ---------------------------------------------------------------------------

struct GameplayModule {
    static void install(ecs::World& world, gemrun::Pipeline& pipeline) {
        PickupSystem::Register(world);

        const auto playing = gemrun::in_state(GameState::Playing);
        pipeline.add_fixed(playing, [](ecs::World& w, float dt) { MotionSystem::Update(w, dt); });
        pipeline.add_fixed([](ecs::World& w, float dt) { CameraFollowSystem::Update(w, dt); });
        pipeline.add_fixed(playing, [](ecs::World& w, float) { PickupSystem::Update(w); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Gameplay", "Score", [&world]() {
                auto* score = world.try_resource<Score>();
                return score ? std::to_string(score->value()) : std::string("-");
            });
            panel->watch("Gameplay", "Health", [&world]() {
                std::string r = "-";
                world.each<PlayerTag, Health>([&](ecs::Entity, PlayerTag&, Health& h) {
                    r = HudSystem::format_health(h.current(), h.max());
                });
                return r;
            });
            panel->watch("Gameplay", "Gems Left", [&world]() {
                int n = 0;
                world.each<Gem>([&](ecs::Entity, Gem&) { ++n; });
                return std::to_string(n);
            });
            panel->watch("Gameplay", "Player X", [&world]() {
                std::string r = "-";
                world.each<PlayerTag, ecs::LocalTransform>([&](ecs::Entity, PlayerTag&, ecs::LocalTransform& lt) {
                    r = std::to_string(static_cast<int>(lt.position.x));
                });
                return r;
            });
        }
    }
};
