#pragma once
#include "../assets.hpp"
#include "../config.hpp"
#include "../pipeline.hpp"
#include "../systems/renderer.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// RenderModule
//
// Loads the AssetResource (sprite textures) and adds RenderSystem to the
// Render phase.
//
// install_present() must be called after every other Render-phase install
// (DebugModule draws between RenderSystem and EndDrawing).
//
// shutdown() must be called before CloseWindow() to unload GPU resources.
// ---------------------------------------------------------------------------

struct RenderModule {
    static void install(ecs::World& world, gemrun::Pipeline& pipeline) {
        AssetResource assets;
        assets.load(world.resource<GameConfig>().assets);
        world.set_resource(assets);
        pipeline.add_render([](ecs::World& w, float) { RenderSystem::Update(w); });
    }

    static void install_present(ecs::World& /*world*/, gemrun::Pipeline& pipeline) {
        pipeline.add_render([](ecs::World& w, float) { RenderSystem::Present(w); });
    }

    static void shutdown(ecs::World& world) {
        world.resource<AssetResource>().unload();
    }
};
