#pragma once
#include <cstdint>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// GameConfig — tuning constants for one run, stored as a World resource.
//
// Defaults reproduce the reference game; resources/config/game.json may
// override any subset of them.
// ---------------------------------------------------------------------------

struct GameConfig {
    struct Window {
        int width = 1280;
        int height = 720;
        std::string title = "Gem Runner";
    } window;

    struct Simulation {
        int tick_rate = 64;                  // fixed ticks per second
        std::optional<std::uint32_t> seed;   // random device when unset
    } simulation;

    struct Player {
        float horizontal_speed = 300.0f;
        float vertical_speed = 300.0f;
        int max_health = 3;
        float size = 100.0f;
    } player;

    struct Camera {
        float look_ahead = 200.0f;
    } camera;

    struct Gems {
        int count = 100;
        float spacing = 300.0f;
        float offset = 600.0f;
        float scatter_min = -200.0f;
        float scatter_max = 200.0f;
        float collection_radius = 30.0f;
        float size = 25.0f;
    } gems;

    struct Assets {
        std::string player_sprite = "resources/sprites/rug.png";
        std::string gem_sprite = "resources/sprites/gem.png";
        std::string collect_sound = "resources/sounds/gem_collection.ogg";
    } assets;

    float fixed_dt() const { return 1.0f / static_cast<float>(simulation.tick_rate); }
};

// ---------------------------------------------------------------------------
// ConfigLoader — reads a JSON config over the built-in defaults.
//
// No raylib dependency — compilable in the headless test target.
// ---------------------------------------------------------------------------

class ConfigLoader {
public:
    // Returns false if the file cannot be opened, the JSON is malformed or a
    // value fails validation. `out` is only written on success; the reason
    // for a failure goes to `error` when given.
    static bool load(const std::string& path, GameConfig& out, std::string* error = nullptr);

    // Identical to load() but parses from memory. Intended for unit testing.
    static bool load_from_string(const std::string& json, GameConfig& out,
                                 std::string* error = nullptr);

    // Throws std::invalid_argument naming the first offending key.
    static void validate(const GameConfig& cfg);
};
