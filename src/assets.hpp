#pragma once
#include "config.hpp"
#include "components.hpp"
#include <raylib.h>

// ---------------------------------------------------------------------------
// AssetResource — opaque sprite handles for the renderer.
//
// LoadTexture() returns id 0 on a missing file; RenderSystem then draws a
// flat rectangle instead, so the game stays playable without art.
// ---------------------------------------------------------------------------

struct AssetResource {
    Texture2D player_sprite{};
    Texture2D gem_sprite{};

    void load(const GameConfig::Assets& paths) {
        player_sprite = LoadTexture(paths.player_sprite.c_str());
        gem_sprite    = LoadTexture(paths.gem_sprite.c_str());
        if (player_sprite.id == 0) TraceLog(LOG_WARNING, "ASSETS: player sprite '%s' not loaded", paths.player_sprite.c_str());
        if (gem_sprite.id == 0)    TraceLog(LOG_WARNING, "ASSETS: gem sprite '%s' not loaded", paths.gem_sprite.c_str());
    }

    const Texture2D& sprite(SpriteKind kind) const {
        return kind == SpriteKind::Player ? player_sprite : gem_sprite;
    }

    void unload() {
        if (player_sprite.id != 0) UnloadTexture(player_sprite);
        if (gem_sprite.id != 0)    UnloadTexture(gem_sprite);
    }
};
