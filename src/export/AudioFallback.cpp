#include "AudioFallback.h"
#include <array>

namespace {

QString pad(int input) {
    return QString("%1:a").arg(input);
}

// Mix both sides at their track volumes, normalized, longest duration.
// A single side is passed through at its volume; no side maps silence.
QString buildPrimary(FilterGraph& graph, const AudioMixParams& p) {
    switch (p.source) {
    case AudioSource::BothAudio:
        graph.add(pad(p.baseInput), FilterGraph::volume(p.baseVolume), "a0")
             .add(pad(p.overlayInput), FilterGraph::volume(p.overlayVolume), "a1")
             .add(QStringList{"a0", "a1"}, FilterGraph::mix(2, true), QStringList{"a"});
        break;
    case AudioSource::BaseOnly:
        graph.add(pad(p.baseInput), FilterGraph::volume(p.baseVolume), "a");
        break;
    case AudioSource::OverlayOnly:
        graph.add(pad(p.overlayInput), FilterGraph::volume(p.overlayVolume), "a");
        break;
    case AudioSource::Silent:
        graph.add(pad(p.silenceInput), FilterGraph::passAudio(), "a");
        break;
    }
    return "[a]";
}

// Same sides mixed onto an explicit silence bed of segment length
QString buildSilenceFallback(FilterGraph& graph, const AudioMixParams& p) {
    QStringList mixInputs{pad(p.silenceInput)};
    if (p.source == AudioSource::BothAudio || p.source == AudioSource::BaseOnly) {
        graph.add(pad(p.baseInput), FilterGraph::volume(p.baseVolume), "a0");
        mixInputs << "a0";
    }
    if (p.source == AudioSource::BothAudio || p.source == AudioSource::OverlayOnly) {
        graph.add(pad(p.overlayInput), FilterGraph::volume(p.overlayVolume), "a1");
        mixInputs << "a1";
    }

    if (mixInputs.size() == 1) {
        graph.add(mixInputs.first(), FilterGraph::passAudio(), "a");
    } else {
        graph.add(mixInputs, FilterGraph::mix(mixInputs.size(), false), QStringList{"a"});
    }
    return "[a]";
}

// Video composite only; audio is the silence input as-is
QString buildVideoOnly(FilterGraph&, const AudioMixParams& p) {
    return pad(p.silenceInput);
}

struct AudioStrategy {
    CompositeAttempt attempt;
    QString (*build)(FilterGraph&, const AudioMixParams&);
};

constexpr std::array<AudioStrategy, 3> StrategyTable{{
    {CompositeAttempt::Primary, &buildPrimary},
    {CompositeAttempt::SilenceFallback, &buildSilenceFallback},
    {CompositeAttempt::VideoOnly, &buildVideoOnly},
}};

} // namespace

namespace AudioFallback {

AudioSource chooseSource(bool baseHasAudio, bool overlayHasAudio) {
    if (baseHasAudio && overlayHasAudio) return AudioSource::BothAudio;
    if (baseHasAudio) return AudioSource::BaseOnly;
    if (overlayHasAudio) return AudioSource::OverlayOnly;
    return AudioSource::Silent;
}

bool nextAttempt(CompositeAttempt attempt, CompositeAttempt& next) {
    for (size_t i = 0; i + 1 < StrategyTable.size(); ++i) {
        if (StrategyTable[i].attempt == attempt) {
            next = StrategyTable[i + 1].attempt;
            return true;
        }
    }
    return false;
}

bool needsSilenceInput(CompositeAttempt attempt, AudioSource source) {
    return attempt != CompositeAttempt::Primary || source == AudioSource::Silent;
}

bool producesAudio(AudioSource source, CompositeAttempt attempt) {
    return source != AudioSource::Silent && attempt != CompositeAttempt::VideoOnly;
}

QString buildAudio(FilterGraph& graph, CompositeAttempt attempt, const AudioMixParams& params) {
    for (const auto& strategy : StrategyTable) {
        if (strategy.attempt == attempt)
            return strategy.build(graph, params);
    }
    return pad(params.silenceInput);
}

const char* sourceName(AudioSource source) {
    switch (source) {
    case AudioSource::BothAudio:   return "both";
    case AudioSource::BaseOnly:    return "base-only";
    case AudioSource::OverlayOnly: return "overlay-only";
    case AudioSource::Silent:      return "silent";
    }
    return "unknown";
}

const char* attemptName(CompositeAttempt attempt) {
    switch (attempt) {
    case CompositeAttempt::Primary:         return "primary";
    case CompositeAttempt::SilenceFallback: return "silence-fallback";
    case CompositeAttempt::VideoOnly:       return "video-only";
    }
    return "unknown";
}

} // namespace AudioFallback
