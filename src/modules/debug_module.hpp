#pragma once
#include "../debug_panel.hpp"
#include "../pipeline.hpp"
#include "../systems/debug.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// DebugModule
//
// Creates the DebugPanel world resource, registers Engine-level debug rows
// (FPS, Frame Time, Entity count), and adds DebugSystem to the Render phase.
//
// Must be installed BEFORE GameplayModule / StateModule so their rows land
// on a live panel, and after RenderModule::install so the overlay draws on
// top of the scene.
// ---------------------------------------------------------------------------

struct DebugModule {
    static void install(ecs::World& world, gemrun::Pipeline& pipeline) {
        DebugPanel panel;

        panel.watch("Engine", "FPS", []() {
            return std::to_string(GetFPS());
        });
        panel.watch("Engine", "Frame Time", []() {
            char b[16];
            std::snprintf(b, sizeof(b), "%d ms", (int)(GetFrameTime() * 1000));
            return std::string(b);
        });
        panel.watch("Engine", "Entities", [&world]() {
            return std::to_string(world.count());
        });

        world.set_resource(std::move(panel));
        pipeline.add_render([](ecs::World& w, float dt) { DebugSystem::Update(w, dt); });
    }
};
