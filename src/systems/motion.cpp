#include "motion.hpp"
#include "../components.hpp"
#include "../config.hpp"
#include "../math_util.hpp"
#include "../world_access.hpp"

using namespace ecs;

Vec2 MotionSystem::displacement(int vertical_intent, float dt,
                                float horizontal_speed, float vertical_speed) {
    return {horizontal_speed * dt,
            static_cast<float>(vertical_intent) * vertical_speed * dt};
}

void MotionSystem::Update(World& world, float dt) {
    const auto& cfg = gemrun::require_resource<GameConfig>(world, "GameConfig");
    auto player = gemrun::require_single<PlayerTag>(world, "player");

    auto& transform = gemrun::require_component<LocalTransform>(world, player, "LocalTransform");
    const auto* input = world.try_get<PlayerInput>(player);
    const int intent = input ? gemrun::math::vertical_intent(input->up, input->down) : 0;

    const Vec2 step = displacement(intent, dt, cfg.player.horizontal_speed, cfg.player.vertical_speed);
    transform.position.x += step.x;
    transform.position.y += step.y;
}
