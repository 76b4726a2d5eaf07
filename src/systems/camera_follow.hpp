#pragma once
#include <ecs/ecs.hpp>

// Places MainCamera `look_ahead` units ahead of the player on the scroll
// axis. Fixed phase, after MotionSystem. The camera's y is left untouched.
class CameraFollowSystem {
public:
    static void Update(ecs::World& world, float dt);

    static float follow_x(float player_x, float look_ahead) { return player_x + look_ahead; }
};
