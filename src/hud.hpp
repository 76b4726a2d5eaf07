#pragma once
#include <string>

// ---------------------------------------------------------------------------
// HudText — strings for the three fixed HUD anchors, stored as a World
// resource. Written by HudSystem, drawn by RenderSystem.
//
// Zero engine dependencies — safe to include in any target.
// ---------------------------------------------------------------------------

struct HudText {
    static constexpr const char* kScoreLabel    = "Score: ";
    static constexpr const char* kHealthLabel   = "Health: ";
    static constexpr const char* kGameOverText  = "YOU DIED";

    std::string score;      // value span after kScoreLabel
    std::string health;     // "<current>/<max>" after kHealthLabel
    std::string game_over;  // empty while Playing
};
