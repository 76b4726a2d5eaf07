#pragma once
#include "../audio_resource.hpp"
#include "../config.hpp"
#include "../pipeline.hpp"
#include "../systems/audio.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>

// ---------------------------------------------------------------------------
// AudioModule
//
// Initialises Raylib's audio device, loads the AudioResource (Sound handles),
// and adds AudioSystem to the Frame phase.
//
// Pipeline placement: install after StateModule so sounds queued by the fixed
// ticks are drained in the same frame, before the next flush.
//
// shutdown() unloads sounds and closes the audio device. Must be called
// before CloseWindow().
// ---------------------------------------------------------------------------

struct AudioModule {
    static void install(ecs::World& world, gemrun::Pipeline& pipeline) {
        InitAudioDevice();
        if (!IsAudioDeviceReady()) TraceLog(LOG_WARNING, "GAME: audio device unavailable, playing muted");

        AudioResource audio;
        audio.load(world.resource<GameConfig>().assets);
        world.set_resource(std::move(audio));
        pipeline.add_frame([](ecs::World& w, float dt) { AudioSystem::Update(w, dt); });
    }

    static void shutdown(ecs::World& world) {
        world.resource<AudioResource>().unload();
        CloseAudioDevice();
    }
};
