#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// DebugSystem — Render-phase overlay listing every DebugPanel provider.
//
// Anchored to the top-right corner so it never covers the HUD. Runs between
// RenderSystem::Update and RenderSystem::Present. F3 toggles visibility.
// ---------------------------------------------------------------------------

class DebugSystem {
public:
    static void Update(ecs::World& world, float dt);
};
