#pragma once
#include "components.hpp"
#include <ecs/ecs.hpp>
#include <vector>

// ---------------------------------------------------------------------------
// RenderScene — what the renderer draws this frame, built headlessly.
//
// Positions are world space with y up. Items are ordered gems first (by
// creation order), player last, so the player is drawn on top.
// ---------------------------------------------------------------------------

struct RenderItem {
    SpriteKind kind;
    ecs::Vec2  position;
    float      size;
};

struct RenderScene {
    ecs::Vec2 camera = {0.0f, 0.0f};
    std::vector<RenderItem> items;
};

class RenderSceneBuilder {
public:
    static RenderScene build(ecs::World& world);
};
