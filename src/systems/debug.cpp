#include "debug.hpp"
#include "../config.hpp"
#include "../debug_panel.hpp"
#include <raylib.h>
#include <string>

static constexpr int   PAD     = 8;
static constexpr int   PANEL_W = 220;
static constexpr int   ROW_H   = 16;
static constexpr int   FONT    = 12;
static constexpr int   VALUE_X = 110;  // value column, from content-left
static constexpr Color BG      = {30,  30,  45,  200};
static constexpr Color BORDER  = {90,  90,  120, 220};
static constexpr Color HEADER  = {250, 200, 90,  255};
static constexpr Color LABEL   = {200, 200, 210, 255};
static constexpr Color VALUE   = {255, 255, 255, 255};

void DebugSystem::Update(ecs::World& world, float /*dt*/) {
    auto* panel = world.try_resource<DebugPanel>();
    if (!panel) return;

    if (IsKeyPressed(KEY_F3)) panel->visible = !panel->visible;
    if (!panel->visible) return;

    int screen_w = GetScreenWidth();
    if (const auto* cfg = world.try_resource<GameConfig>()) screen_w = cfg->window.width;

    const auto& sections = panel->sections();
    int lines = 0;
    for (const auto& s : sections) lines += 1 + static_cast<int>(s.rows.size());

    const int ox = screen_w - PANEL_W - PAD;
    const int oy = PAD;
    const int panel_h = PAD * 2 + lines * ROW_H;

    DrawRectangle(ox, oy, PANEL_W, panel_h, BG);
    DrawRectangleLines(ox, oy, PANEL_W, panel_h, BORDER);

    int cy = oy + PAD;
    for (const auto& sec : sections) {
        DrawText(sec.title.c_str(), ox + PAD, cy, FONT, HEADER);
        cy += ROW_H;
        for (const auto& row : sec.rows) {
            const std::string val = row.fn();
            DrawText(row.label.c_str(), ox + PAD * 2, cy, FONT, LABEL);
            DrawText(val.c_str(),       ox + PAD + VALUE_X, cy, FONT, VALUE);
            cy += ROW_H;
        }
    }
}
