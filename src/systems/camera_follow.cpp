#include "camera_follow.hpp"
#include "../components.hpp"
#include "../config.hpp"
#include "../world_access.hpp"

using namespace ecs;

void CameraFollowSystem::Update(World& world, float /*dt*/) {
    const auto& cfg = gemrun::require_resource<GameConfig>(world, "GameConfig");
    auto& cam = gemrun::require_resource<MainCamera>(world, "MainCamera");
    auto player = gemrun::require_single<PlayerTag>(world, "player");
    const auto& transform = gemrun::require_component<LocalTransform>(world, player, "LocalTransform");

    cam.position.x = follow_x(transform.position.x, cfg.camera.look_ahead);
}
