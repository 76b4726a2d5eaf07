#pragma once
#include "game_state.hpp"
#include "world_access.hpp"
#include <ecs/ecs.hpp>
#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace gemrun {

/**
 * @brief Ordered, state-gated system dispatcher.
 *
 * Each phase is a list of (run condition, system) pairs executed in
 * registration order. The condition is evaluated immediately before its
 * system, so a system sees the state left by the systems before it.
 */
class Pipeline {
public:
    using SystemFunc   = std::function<void(ecs::World&, float)>;
    using RunCondition = std::function<bool(ecs::World&)>;

    void add_pre_update(SystemFunc func) { pre_update_.push_back({nullptr, std::move(func)}); }

    void add_fixed(SystemFunc func) { fixed_.push_back({nullptr, std::move(func)}); }
    void add_fixed(RunCondition when, SystemFunc func) { fixed_.push_back({std::move(when), std::move(func)}); }

    void add_frame(SystemFunc func) { frame_.push_back({nullptr, std::move(func)}); }
    void add_frame(RunCondition when, SystemFunc func) { frame_.push_back({std::move(when), std::move(func)}); }

    void add_render(SystemFunc func) { render_.push_back({nullptr, std::move(func)}); }

    /**
     * @brief Input / pre-processing. Called once per rendered frame.
     */
    void update(ecs::World& world, float dt) {
        run(pre_update_, world, dt);
        world.deferred().flush(world);
    }

    /**
     * @brief One fixed simulation tick (Motion -> Camera Follow -> Pickup).
     */
    void step_fixed(ecs::World& world, float dt) {
        run(fixed_, world, dt);
        world.deferred().flush(world);
    }

    /**
     * @brief Variable-rate gameplay work after the fixed ticks of a frame
     * (death check, HUD sync, audio).
     */
    void step_frame(ecs::World& world, float dt) {
        run(frame_, world, dt);
        world.deferred().flush(world);
    }

    /**
     * @brief Executes rendering systems.
     */
    void render(ecs::World& world) { run(render_, world, 0.0f); }

    std::size_t fixed_count() const { return fixed_.size(); }
    std::size_t frame_count() const { return frame_.size(); }

private:
    struct Entry {
        RunCondition when;
        SystemFunc   run;
    };

    static void run(std::vector<Entry>& entries, ecs::World& world, float dt) {
        for (auto& e : entries) {
            if (e.when && !e.when(world)) continue;
            e.run(world, dt);
        }
    }

    std::vector<Entry> pre_update_;
    std::vector<Entry> fixed_;
    std::vector<Entry> frame_;
    std::vector<Entry> render_;
};

/**
 * @brief Run condition: true while the GameStateMachine resource is in `s`.
 */
inline Pipeline::RunCondition in_state(GameState s) {
    return [s](ecs::World& w) {
        return require_resource<GameStateMachine>(w, "GameStateMachine").is(s);
    };
}

} // namespace gemrun
