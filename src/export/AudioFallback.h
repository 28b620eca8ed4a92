#pragma once

#include <QString>
#include "FilterGraph.h"

// Which sides of a composite carry audio, decided from probed stream presence
enum class AudioSource {
    BothAudio,
    BaseOnly,
    OverlayOnly,
    Silent
};

// Escalating composite invocations, tried in order after a non-zero exit
enum class CompositeAttempt {
    Primary,
    SilenceFallback,
    VideoOnly
};

struct AudioMixParams {
    AudioSource source = AudioSource::Silent;
    double baseVolume = 1.0;
    double overlayVolume = 1.0;
    int baseInput = 0;
    int overlayInput = 1;
    int silenceInput = 2;
};

namespace AudioFallback {

AudioSource chooseSource(bool baseHasAudio, bool overlayHasAudio);

// False when attempt is the last one
bool nextAttempt(CompositeAttempt attempt, CompositeAttempt& next);

bool needsSilenceInput(CompositeAttempt attempt, AudioSource source);

// True when the composite output carries real (not synthesized) audio
bool producesAudio(AudioSource source, CompositeAttempt attempt);

// Appends the audio part of the composite to graph and returns the
// -map argument selecting the resulting audio stream.
QString buildAudio(FilterGraph& graph, CompositeAttempt attempt, const AudioMixParams& params);

const char* sourceName(AudioSource source);
const char* attemptName(CompositeAttempt attempt);

} // namespace AudioFallback
