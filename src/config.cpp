#include "config.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

// Missing sections are fine; a present section must be an object.
static const json* section(const json& root, const char* key) {
    if (!root.contains(key)) return nullptr;
    const json& s = root.at(key);
    if (!s.is_object()) throw std::invalid_argument(std::string("'") + key + "' must be an object");
    return &s;
}

static void apply_window(const json& j, GameConfig::Window& w) {
    w.width  = j.value("width",  w.width);
    w.height = j.value("height", w.height);
    w.title  = j.value("title",  w.title);
}

static void apply_simulation(const json& j, GameConfig::Simulation& s) {
    s.tick_rate = j.value("tick_rate", s.tick_rate);
    if (j.contains("seed") && !j.at("seed").is_null()) {
        const json& seed = j.at("seed");
        if (!seed.is_number_unsigned() || seed.get<std::uint64_t>() > 0xffffffffu)
            throw std::invalid_argument("simulation.seed must be an unsigned 32-bit integer");
        s.seed = seed.get<std::uint32_t>();
    }
}

static void apply_player(const json& j, GameConfig::Player& p) {
    p.horizontal_speed = j.value("horizontal_speed", p.horizontal_speed);
    p.vertical_speed   = j.value("vertical_speed",   p.vertical_speed);
    p.max_health       = j.value("max_health",       p.max_health);
    p.size             = j.value("size",             p.size);
}

static void apply_gems(const json& j, GameConfig::Gems& g) {
    g.count             = j.value("count",             g.count);
    g.spacing           = j.value("spacing",           g.spacing);
    g.offset            = j.value("offset",            g.offset);
    g.scatter_min       = j.value("scatter_min",       g.scatter_min);
    g.scatter_max       = j.value("scatter_max",       g.scatter_max);
    g.collection_radius = j.value("collection_radius", g.collection_radius);
    g.size              = j.value("size",              g.size);
}

static void apply_assets(const json& j, GameConfig::Assets& a) {
    a.player_sprite = j.value("player_sprite", a.player_sprite);
    a.gem_sprite    = j.value("gem_sprite",    a.gem_sprite);
    a.collect_sound = j.value("collect_sound", a.collect_sound);
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

void ConfigLoader::validate(const GameConfig& cfg) {
    auto require = [](bool ok, const char* what) {
        if (!ok) throw std::invalid_argument(what);
    };
    require(cfg.window.width > 0 && cfg.window.height > 0, "window size must be positive");
    require(cfg.simulation.tick_rate > 0,          "simulation.tick_rate must be positive");
    require(cfg.player.max_health > 0,             "player.max_health must be positive");
    require(cfg.player.size > 0.0f,                "player.size must be positive");
    require(cfg.gems.count >= 0,                   "gems.count must not be negative");
    require(cfg.gems.collection_radius > 0.0f,     "gems.collection_radius must be positive");
    require(cfg.gems.scatter_min < cfg.gems.scatter_max, "gems.scatter_min must be below gems.scatter_max");
    require(cfg.gems.size > 0.0f,                  "gems.size must be positive");
}

bool ConfigLoader::load_from_string(const std::string& json_str, GameConfig& out,
                                    std::string* error) {
    try {
        json root = json::parse(json_str);
        if (!root.is_object()) throw std::invalid_argument("top level must be an object");

        GameConfig cfg = out;
        if (const json* j = section(root, "window"))     apply_window(*j, cfg.window);
        if (const json* j = section(root, "simulation")) apply_simulation(*j, cfg.simulation);
        if (const json* j = section(root, "player"))     apply_player(*j, cfg.player);
        if (const json* j = section(root, "camera"))     cfg.camera.look_ahead = j->value("look_ahead", cfg.camera.look_ahead);
        if (const json* j = section(root, "gems"))       apply_gems(*j, cfg.gems);
        if (const json* j = section(root, "assets"))     apply_assets(*j, cfg.assets);

        validate(cfg);
        out = std::move(cfg);
        return true;
    } catch (const std::exception& e) {
        if (error) *error = e.what();
        return false;
    }
}

bool ConfigLoader::load(const std::string& path, GameConfig& out, std::string* error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        if (error) *error = "cannot open '" + path + "'";
        return false;
    }
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    return load_from_string(content, out, error);
}
