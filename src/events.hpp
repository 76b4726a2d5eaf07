#pragma once
#include <ecs/ecs.hpp>
#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Events<T> — typed, frame-scoped event queue
//
// Stored as a World resource. Systems emit via send() and consume via read().
// EventRegistry::flush_all() clears all queues at the start of each frame,
// so events sent during the fixed ticks stay readable until the next frame.
// ---------------------------------------------------------------------------

template<typename T>
struct Events {
    void send(T event)                     { buffer_.push_back(std::move(event)); }
    const std::vector<T>& read()   const  { return buffer_; }
    bool                  empty()  const  { return buffer_.empty(); }
    std::size_t           size()   const  { return buffer_.size(); }
    void                  clear()         { buffer_.clear(); }

private:
    std::vector<T> buffer_;
};

// ---------------------------------------------------------------------------
// EventRegistry — flush coordinator (stored as a World resource)
//
// Call register_queue<T>(world) once per event type during startup.
// Call flush_all() as the first Pre-Update step each frame.
// ---------------------------------------------------------------------------

class EventRegistry {
public:
    template<typename T>
    void register_queue(ecs::World& world) {
        world.set_resource(Events<T>{});
        flush_fns_.push_back([&world]() {
            if (auto* q = world.try_resource<Events<T>>()) q->clear();
        });
    }

    void flush_all() {
        for (auto& fn : flush_fns_) fn();
    }

private:
    std::vector<std::function<void()>> flush_fns_;
};

// ---------------------------------------------------------------------------
// Concrete event types
// ---------------------------------------------------------------------------

enum class SoundId { GemCollected };

// Fire-and-forget playback request. Drained by AudioSystem after the fixed
// ticks of the frame; the simulation never observes the result.
struct SoundRequest {
    SoundId id;
};

// Emitted by PickupSystem once per collected gem, in gem creation order.
// score / health are the values immediately after this pickup was applied.
struct GemCollectedEvent {
    std::size_t order;
    ecs::Vec2   position;
    std::size_t score;
    int         health;
};
