#pragma once
#include "config.hpp"
#include "events.hpp"
#include <raylib.h>

// ---------------------------------------------------------------------------
// AudioResource — owns all audio clip handles.
//
// Stored as a World resource. Loaded once at startup (after InitAudioDevice),
// unloaded at shutdown (before CloseAudioDevice).
//
// LoadSound() returns a zeroed Sound on missing file; PlaySound() on a zeroed
// Sound is a no-op, so a missing clip only silences the pickup.
// ---------------------------------------------------------------------------

struct AudioResource {
    Sound snd_gem_collected{};

    void load(const GameConfig::Assets& paths) {
        snd_gem_collected = LoadSound(paths.collect_sound.c_str());
        if (snd_gem_collected.frameCount == 0)
            TraceLog(LOG_WARNING, "ASSETS: sound '%s' not loaded", paths.collect_sound.c_str());
    }

    Sound& sound(SoundId /*id*/) { return snd_gem_collected; }

    void unload() {
        UnloadSound(snd_gem_collected);
    }
};
