#include "components.hpp"
#include "config.hpp"
#include "game_state.hpp"
#include "pipeline.hpp"
#include "setup.hpp"
#include "world_access.hpp"
#include "modules/audio_module.hpp"
#include "modules/debug_module.hpp"
#include "modules/event_bus_module.hpp"
#include "modules/gameplay_module.hpp"
#include "modules/input_module.hpp"
#include "modules/render_module.hpp"
#include "modules/state_module.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <cstdint>
#include <random>
#include <string>

static const char* CONFIG_PATH = "resources/config/game.json";

// Ticks allowed per frame before the accumulator is dropped (e.g. after a
// window drag stalls the loop).
static constexpr int MAX_TICKS_PER_FRAME = 8;

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : CONFIG_PATH;

  GameConfig config;
  std::string error;
  if (ConfigLoader::load(config_path, config, &error)) {
    TraceLog(LOG_INFO, "CONFIG: loaded '%s'", config_path.c_str());
  } else {
    TraceLog(LOG_WARNING, "CONFIG: %s; using built-in defaults", error.c_str());
  }

  const std::uint32_t seed = config.simulation.seed ? *config.simulation.seed
                                                    : std::random_device{}();
  TraceLog(LOG_INFO, "GAME: seed %u, %d gems, %d Hz fixed tick",
           seed, config.gems.count, config.simulation.tick_rate);

  InitWindow(config.window.width, config.window.height, config.window.title.c_str());
  SetTargetFPS(60);

  ecs::World world;
  std::mt19937 rng(seed);
  GameSetup::populate(world, config, rng);

  gemrun::require_resource<GameStateMachine>(world, "GameStateMachine")
      .on_enter(GameState::GameOver, [](ecs::World& w) {
          TraceLog(LOG_INFO, "GAME: game over, final score %zu",
                   gemrun::require_resource<Score>(w, "Score").value());
      });

  // --- Pipeline Configuration ---
  // Order matters: the event bus flush must be the first pre-update step,
  // the debug panel must exist before gameplay modules add rows to it, and
  // audio drains after the frame-phase state systems.
  gemrun::Pipeline pipeline;
  EventBusModule::install(world, pipeline);
  RenderModule::install(world, pipeline);
  DebugModule::install(world, pipeline);
  InputModule::install(world, pipeline);
  GameplayModule::install(world, pipeline);
  StateModule::install(world, pipeline);
  AudioModule::install(world, pipeline);
  RenderModule::install_present(world, pipeline);

  // --- Main Loop ---
  float accumulator = 0.0f;
  const float fixed_dt = config.fixed_dt();

  while (!WindowShouldClose()) {
    float dt = GetFrameTime();

    // 1. Input
    pipeline.update(world, dt);

    // 2. Gameplay (Fixed Timestep)
    accumulator += dt;
    int ticks = 0;
    while (accumulator >= fixed_dt && ticks < MAX_TICKS_PER_FRAME) {
        pipeline.step_fixed(world, fixed_dt);
        accumulator -= fixed_dt;
        ++ticks;
    }
    if (accumulator >= fixed_dt) accumulator = 0.0f;

    // 3. Death check, HUD, audio
    pipeline.step_frame(world, dt);

    // 4. Render
    pipeline.render(world);
  }

  AudioModule::shutdown(world);
  RenderModule::shutdown(world);
  CloseWindow();
  return 0;
}
