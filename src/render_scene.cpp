#include "render_scene.hpp"
#include "world_access.hpp"
#include <algorithm>
#include <cstddef>
#include <utility>

using namespace ecs;

RenderScene RenderSceneBuilder::build(World& world) {
    RenderScene scene;
    scene.camera = gemrun::require_resource<MainCamera>(world, "MainCamera").position;

    std::vector<std::pair<std::size_t, RenderItem>> gems;
    world.each<Gem, LocalTransform, Sprite>([&](Entity, Gem& gem, LocalTransform& lt, Sprite& sprite) {
        gems.push_back({gem.order, RenderItem{sprite.kind, {lt.position.x, lt.position.y}, sprite.size}});
    });
    std::sort(gems.begin(), gems.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    scene.items.reserve(gems.size() + 1);
    for (auto& g : gems) scene.items.push_back(g.second);

    world.each<PlayerTag, LocalTransform, Sprite>([&](Entity, PlayerTag&, LocalTransform& lt, Sprite& sprite) {
        scene.items.push_back({sprite.kind, {lt.position.x, lt.position.y}, sprite.size});
    });
    return scene;
}
