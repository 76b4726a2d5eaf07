#pragma once
#include <ecs/ecs.hpp>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Checked singleton access.
//
// Every gameplay system assumes exactly one player and one of each gameplay
// resource. A violation is a broken precondition, reported as
// std::logic_error rather than skipped.
// ---------------------------------------------------------------------------

namespace gemrun {

template<typename T>
T& require_resource(ecs::World& world, const char* name) {
    auto* res = world.try_resource<T>();
    if (!res) throw std::logic_error(std::string("missing world resource: ") + name);
    return *res;
}

// Returns the only entity carrying Tag; throws if there are zero or several.
template<typename Tag>
ecs::Entity require_single(ecs::World& world, const char* name) {
    std::vector<ecs::Entity> found;
    world.each<Tag>([&](ecs::Entity e, Tag&) { found.push_back(e); });
    if (found.size() != 1) {
        throw std::logic_error("expected exactly one " + std::string(name) +
                               ", found " + std::to_string(found.size()));
    }
    return found.front();
}

template<typename T>
T& require_component(ecs::World& world, ecs::Entity e, const char* name) {
    auto* c = world.try_get<T>(e);
    if (!c) throw std::logic_error(std::string("entity is missing component: ") + name);
    return *c;
}

} // namespace gemrun
