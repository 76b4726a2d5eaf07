#include "pickup.hpp"
#include "../components.hpp"
#include "../config.hpp"
#include "../events.hpp"
#include "../math_util.hpp"
#include "../world_access.hpp"
#include <algorithm>
#include <vector>

using namespace ecs;

namespace {

struct Hit {
    std::size_t order;
    Entity      gem;
    Vec2        position;
};

} // namespace

void PickupSystem::Register(World& world) {
    auto& registry = gemrun::require_resource<EventRegistry>(world, "EventRegistry");
    registry.register_queue<GemCollectedEvent>(world);
    registry.register_queue<SoundRequest>(world);
}

std::size_t PickupSystem::Update(World& world) {
    const auto& cfg = gemrun::require_resource<GameConfig>(world, "GameConfig");
    auto& score = gemrun::require_resource<Score>(world, "Score");
    auto player = gemrun::require_single<PlayerTag>(world, "player");

    // Copy the position: destroying gems may move transform storage.
    const auto& transform = gemrun::require_component<LocalTransform>(world, player, "LocalTransform");
    const float px = transform.position.x;
    const float py = transform.position.y;

    std::vector<Hit> hits;
    world.each<Gem, LocalTransform>([&](Entity e, Gem& gem, LocalTransform& lt) {
        if (gemrun::math::within_radius(px, py, lt.position.x, lt.position.y,
                                        cfg.gems.collection_radius)) {
            hits.push_back({gem.order, e, {lt.position.x, lt.position.y}});
        }
    });
    if (hits.empty()) return 0;

    std::sort(hits.begin(), hits.end(),
              [](const Hit& a, const Hit& b) { return a.order < b.order; });

    auto& health    = gemrun::require_component<Health>(world, player, "Health");
    auto* collected = world.try_resource<Events<GemCollectedEvent>>();
    auto* sounds    = world.try_resource<Events<SoundRequest>>();

    for (const auto& hit : hits) {
        world.destroy(hit.gem);
        score.increment();
        health.lose_one();
        if (collected) collected->send({hit.order, hit.position, score.value(), health.current()});
        if (sounds)    sounds->send({SoundId::GemCollected});
    }
    world.deferred().flush(world);
    return hits.size();
}
