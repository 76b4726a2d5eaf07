#pragma once
#include <ecs/ecs.hpp>
#include <ecs/modules/transform.hpp>
#include <algorithm>
#include <cstddef>

// components.hpp is free of engine-library dependencies (no raylib), so every
// gameplay system can be built into the headless test target.

// ---------------------------------------------------------------------------
// Visuals
// ---------------------------------------------------------------------------

enum class SpriteKind { Player, Gem };

struct Color4 {
    float r = 1.0f, g = 1.0f, b = 1.0f, a = 1.0f;
};

namespace Colors {
    inline constexpr Color4 Background = {0.9f, 0.9f, 0.9f, 1.0f};
    inline constexpr Color4 Text       = {0.5f, 0.5f, 1.0f, 1.0f};
    inline constexpr Color4 Green      = {0.5f, 1.0f, 0.5f, 1.0f};
    inline constexpr Color4 Red        = {1.0f, 0.5f, 0.5f, 1.0f};
    inline constexpr Color4 Score      = {1.0f, 0.5f, 0.5f, 1.0f};
    inline constexpr Color4 Player     = {0.55f, 0.35f, 0.2f, 1.0f};
    inline constexpr Color4 Gem        = {0.2f, 0.7f, 0.9f, 1.0f};
}

// Square sprite drawn centred on the entity's LocalTransform position.
struct Sprite {
    SpriteKind kind = SpriteKind::Gem;
    float size = 25.0f;
};

// ---------------------------------------------------------------------------
// Gameplay
// ---------------------------------------------------------------------------

struct PlayerTag {};

// A live gem. Presence of the component is the "alive" flag; collection
// destroys the entity. `order` is the creation index along the track.
struct Gem {
    std::size_t order = 0;
};

// Sampled once per frame by InputGatherSystem, consumed by every fixed tick.
struct PlayerInput {
    bool up = false;
    bool down = false;
};

class PickupSystem;

// 0 <= current <= max at all times. Only PickupSystem may lower it.
class Health {
public:
    explicit Health(int max_health)
        : current_(std::max(max_health, 1)), max_(std::max(max_health, 1)) {}

    Health(int current, int max_health)
        : max_(std::max(max_health, 1)) {
        current_ = std::clamp(current, 0, max_);
    }

    int current() const { return current_; }
    int max() const { return max_; }
    bool depleted() const { return current_ <= 0; }

private:
    friend class PickupSystem;

    void lose_one() { current_ = std::max(current_ - 1, 0); }

    int current_;
    int max_;
};

// Process-wide score counter. Monotonic; only PickupSystem increments it.
class Score {
public:
    std::size_t value() const { return value_; }

private:
    friend class PickupSystem;

    void increment() { ++value_; }

    std::size_t value_ = 0;
};

// Singleton camera record. Only the horizontal look-ahead is modelled; y is
// never written by CameraFollowSystem.
struct MainCamera {
    ecs::Vec2 position = {0.0f, 0.0f};
};
