#include "audio.hpp"
#include "../audio_resource.hpp"
#include "../events.hpp"
#include <raylib.h>

void AudioSystem::Update(ecs::World& world, float /*dt*/) {
    auto* audio = world.try_resource<AudioResource>();
    if (!audio) return;

    if (const auto* evts = world.try_resource<Events<SoundRequest>>()) {
        for (const auto& req : evts->read()) {
            PlaySound(audio->sound(req.id));
        }
    }
}
