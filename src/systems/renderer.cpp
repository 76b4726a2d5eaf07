#include "renderer.hpp"
#include "../assets.hpp"
#include "../components.hpp"
#include "../config.hpp"
#include "../hud.hpp"
#include "../render_scene.hpp"
#include <raylib.h>
#include <string>

using namespace ecs;

static constexpr int   FONT_SIZE    = 33;
static constexpr float TEXT_PADDING = 5.0f;

// Convert our engine Color4 to Raylib's Color at draw time.
static inline Color to_raylib(const Color4& c) {
    return Color{
        static_cast<unsigned char>(c.r * 255.0f),
        static_cast<unsigned char>(c.g * 255.0f),
        static_cast<unsigned char>(c.b * 255.0f),
        static_cast<unsigned char>(c.a * 255.0f),
    };
}

// Label in TEXT colour followed by a value span in its own colour.
static void draw_labeled(const char* label, const std::string& value,
                         float x, float y, const Color4& value_color) {
    DrawText(label, (int)x, (int)y, FONT_SIZE, to_raylib(Colors::Text));
    int label_w = MeasureText(label, FONT_SIZE);
    DrawText(value.c_str(), (int)x + label_w, (int)y, FONT_SIZE, to_raylib(value_color));
}

void RenderSystem::Update(World& world) {
    BeginDrawing();
    ClearBackground(to_raylib(Colors::Background));

    auto* assets = world.try_resource<AssetResource>();
    auto* cfg    = world.try_resource<GameConfig>();
    if (!assets || !cfg) return;

    const RenderScene scene = RenderSceneBuilder::build(world);

    // 1. World: y is up in the simulation, down on screen.
    Camera2D camera = {};
    camera.offset   = {cfg->window.width * 0.5f, cfg->window.height * 0.5f};
    camera.target   = {scene.camera.x, -scene.camera.y};
    camera.rotation = 0.0f;
    camera.zoom     = 1.0f;

    BeginMode2D(camera);
    for (const auto& item : scene.items) {
        Rectangle dst = {item.position.x - item.size * 0.5f,
                         -item.position.y - item.size * 0.5f,
                         item.size, item.size};
        const Texture2D& tex = assets->sprite(item.kind);
        if (tex.id != 0) {
            Rectangle src = {0, 0, (float)tex.width, (float)tex.height};
            DrawTexturePro(tex, src, dst, {0, 0}, 0.0f, WHITE);
        } else {
            const Color4& fill = item.kind == SpriteKind::Player ? Colors::Player : Colors::Gem;
            DrawRectangleRec(dst, to_raylib(fill));
        }
    }
    EndMode2D();

    // 2. HUD
    if (const auto* hud = world.try_resource<HudText>()) {
        draw_labeled(HudText::kScoreLabel,  hud->score,  TEXT_PADDING, TEXT_PADDING,         Colors::Score);
        draw_labeled(HudText::kHealthLabel, hud->health, TEXT_PADDING, TEXT_PADDING * 10.0f, Colors::Green);
        if (!hud->game_over.empty()) {
            DrawText(hud->game_over.c_str(), (int)(TEXT_PADDING * 20.0f), (int)(TEXT_PADDING * 20.0f),
                     FONT_SIZE * 4, to_raylib(Colors::Red));
        }
    }
}

void RenderSystem::Present(World& /*world*/) {
    EndDrawing();
}
