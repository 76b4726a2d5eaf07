#pragma once
#include <ecs/ecs.hpp>

// Render phase. Update() opens the frame and draws the RenderScene through a
// Camera2D, then the HUD text at its fixed screen anchors. Present() closes
// the frame and must be the last render step, so overlays can draw between.
class RenderSystem {
public:
    static void Update(ecs::World& world);
    static void Present(ecs::World& world);
};
