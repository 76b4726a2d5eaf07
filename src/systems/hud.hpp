#pragma once
#include <ecs/ecs.hpp>
#include <string>

// ---------------------------------------------------------------------------
// HudSystem — Frame-phase UI sync. Reads a GameSnapshot, writes HudText.
//
// UpdateScoreboard / UpdateHealth are gated on Playing, so the last values
// stay frozen after GameOver. UpdateGameOver is not gated; it re-derives the
// terminal message from the current state every frame.
// ---------------------------------------------------------------------------

class HudSystem {
public:
    static void UpdateScoreboard(ecs::World& world);
    static void UpdateHealth(ecs::World& world);
    static void UpdateGameOver(ecs::World& world);

    static std::string format_health(int current, int max);
};
