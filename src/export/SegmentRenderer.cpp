#include "SegmentRenderer.h"
#include "AppConstants.h"
#include "Logging.h"
#include "TimelineValidator.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <algorithm>

SegmentRenderer::SegmentRenderer(const RenderContext& context, TranscodeRunner* runner,
                                 ProbeCache* probes, QObject* parent)
    : QObject(parent), m_context(context), m_runner(runner), m_probes(probes) {}

SegmentRenderer::~SegmentRenderer() {
    disconnectRunner();
}

RenderStrategy SegmentRenderer::chooseStrategy(const Segment& segment) {
    const int active = segment.activeTrackCount();
    if (active == 0) return RenderStrategy::GapFill;
    if (active == 1) return RenderStrategy::Direct;
    return RenderStrategy::Composite;
}

const char* SegmentRenderer::strategyName(RenderStrategy strategy) {
    switch (strategy) {
    case RenderStrategy::GapFill:   return "gap-fill";
    case RenderStrategy::Direct:    return "direct";
    case RenderStrategy::Composite: return "composite";
    }
    return "unknown";
}

bool SegmentRenderer::render(const Segment& segment, int index, const QString& outputPath) {
    if (m_busy) return false;

    for (const auto& clip : segment.clips) {
        if (clip && !sourceFor(*clip)) {
            emit finished(false, ExportError::validation(
                QString("Source clip %1 not found").arg(clip->videoClipId)));
            return true;
        }
    }

    m_busy = true;
    m_cancelled = false;
    m_segment = segment;
    m_index = index;
    m_outputPath = outputPath;
    m_strategy = chooseStrategy(segment);
    m_stepsDone = 0;
    m_stepsTotal = 1;
    m_scratch.clear();
    m_overlayTracks.clear();
    m_overlayCursor = 0;

    m_progressConn = connect(m_runner, &TranscodeRunner::progress, this, &SegmentRenderer::onRunnerProgress);
    m_finishedConn = connect(m_runner, &TranscodeRunner::finished, this, &SegmentRenderer::onRunnerFinished);

    qCInfo(lcRender).noquote() << QString("Segment %1 [%2, %3) -> %4")
        .arg(index).arg(segment.startTime).arg(segment.endTime).arg(strategyName(m_strategy));

    switch (m_strategy) {
    case RenderStrategy::GapFill:
        runStep(Step::Single, gapFillRequest(segment.duration(), outputPath));
        break;

    case RenderStrategy::Direct:
        runStep(Step::Single, segmentClipRequest(segment, segment.soleActiveTrack(), outputPath));
        break;

    case RenderStrategy::Composite: {
        for (int t = 1; t < static_cast<int>(segment.clips.size()); ++t) {
            if (segment.clips[t]) m_overlayTracks.push_back(t);
        }
        m_stepsTotal = 1 + 2 * static_cast<int>(m_overlayTracks.size());

        const QString basePath = scratchPath("base");
        m_basePath = basePath;
        m_baseVolume = m_context.tracks.empty() ? 1.0 : m_context.tracks[0].effectiveVolume();

        if (!segment.clips.empty() && segment.clips[0]) {
            const TimelineClip& baseClip = *segment.clips[0];
            m_baseHasAudio = trackContributesAudio(0, baseClip);
            runStep(Step::BasePart, clipPartRequest(segment, baseClip, 0, PartMode::Base, basePath));
        } else {
            // Empty base under overlays: black canvas whose silence is not real audio
            m_baseHasAudio = false;
            runStep(Step::BasePart, gapFillRequest(segment.duration(), basePath));
        }
        break;
    }
    }
    return true;
}

TranscodeRequest SegmentRenderer::gapFillRequest(double duration, const QString& outputPath) const {
    const auto& p = m_context.profile;

    TranscodeRequest req;
    req.label = QString("gap %1s").arg(duration);
    req.inputs.push_back(TranscodeInput::lavfi(
        FilterGraph::colorSource(p.settings.gapColor, p.width, p.height, p.fps, duration)));
    req.inputs.push_back(TranscodeInput::lavfi(FilterGraph::silenceSource(duration)));
    req.maps << "0:v" << "1:a";
    req.outputOptions = outputOptions(duration, outputPath);
    req.outputPath = outputPath;
    req.expectedDuration = duration;
    return req;
}

TranscodeRequest SegmentRenderer::segmentClipRequest(const Segment& segment, int trackIndex,
                                                     const QString& outputPath) {
    return clipPartRequest(segment, *segment.clips[trackIndex], trackIndex, PartMode::Segment, outputPath);
}

TranscodeRequest SegmentRenderer::clipPartRequest(const Segment& segment, const TimelineClip& clip,
                                                  int trackIndex, PartMode mode,
                                                  const QString& outputPath) {
    const auto& p = m_context.profile;
    const VideoClip* source = sourceFor(clip);
    const SourceWindow window = sourceWindow(segment, clip);
    const double duration = segment.duration();

    TranscodeRequest req;
    req.label = QString("clip %1 track %2 [%3, %4)")
        .arg(clip.id).arg(trackIndex).arg(segment.startTime).arg(segment.endTime);
    req.inputs.push_back(TranscodeInput::file(source ? source->filePath : QString(),
                                              window.start, window.duration));

    QString fit;
    if (mode == PartMode::Overlay) {
        const OverlayRect rect = overlayRectFor(trackIndex, clip);
        fit = FilterGraph::scaleTo(rect.width, rect.height);
    } else {
        fit = FilterGraph::scaleToFit(p.width, p.height);
    }
    req.filterGraph.add("0:v",
        fit + ',' + FilterGraph::conform(p.fps) + ',' + FilterGraph::holdLastFrame(duration), "v");
    req.maps << "[v]";

    if (mode == PartMode::Segment) {
        if (trackContributesAudio(trackIndex, clip)) {
            const double volume = m_context.tracks[trackIndex].effectiveVolume();
            req.filterGraph.add("0:a", FilterGraph::volume(volume) + ',' + FilterGraph::padAudio(), "a");
            req.maps << "[a]";
        } else {
            req.inputs.push_back(TranscodeInput::lavfi(FilterGraph::silenceSource(duration)));
            req.maps << "1:a";
        }
    } else if (sourceHasAudio(clip)) {
        // Volume is applied by the composite step
        req.maps << "0:a";
    }

    req.outputOptions = outputOptions(duration, outputPath);
    req.outputPath = outputPath;
    req.expectedDuration = duration;
    return req;
}

TranscodeRequest SegmentRenderer::compositeRequest(const QString& basePath, const QString& overlayPath,
                                                   const OverlayRect& rect, double duration,
                                                   CompositeAttempt attempt, const AudioMixParams& mix,
                                                   const QString& outputPath) const {
    TranscodeRequest req;
    req.label = QString("composite %1 (%2, %3)")
        .arg(QFileInfo(overlayPath).completeBaseName(),
             AudioFallback::sourceName(mix.source),
             AudioFallback::attemptName(attempt));

    req.inputs.push_back(TranscodeInput::file(basePath));
    req.inputs.push_back(TranscodeInput::file(overlayPath));
    if (AudioFallback::needsSilenceInput(attempt, mix.source))
        req.inputs.push_back(TranscodeInput::lavfi(FilterGraph::silenceSource(duration)));

    req.filterGraph
        .add("1:v", FilterGraph::scaleTo(rect.width, rect.height), "ov")
        .add(QStringList{"0:v", "ov"},
             FilterGraph::overlayAt(rect.x, rect.y) + ',' + FilterGraph::conform(m_context.profile.fps),
             QStringList{"v"});

    QString audioMap = AudioFallback::buildAudio(req.filterGraph, attempt, mix);
    if (audioMap.startsWith('[')) {
        req.filterGraph.add(audioMap.mid(1, audioMap.size() - 2), FilterGraph::padAudio(), "aout");
        audioMap = "[aout]";
    }

    req.maps << "[v]" << audioMap;
    req.outputOptions = outputOptions(duration, outputPath);
    req.outputPath = outputPath;
    req.expectedDuration = duration;
    return req;
}

OverlayRect SegmentRenderer::overlayRectFor(int trackIndex, const TimelineClip& clip) {
    const auto& p = m_context.profile;
    int srcW = 0;
    int srcH = 0;

    if (const VideoClip* source = sourceFor(clip)) {
        srcW = source->width;
        srcH = source->height;
        if (srcW <= 0 || srcH <= 0) {
            MediaInfo info;
            if (m_probes && m_probes->lookup(source->filePath, info)) {
                srcW = info.videoWidth;
                srcH = info.videoHeight;
            }
        }
    }

    const OverlayPosition pos = m_context.tracks[trackIndex].overlayPositionOrDefault();
    return OverlayLayout::compute(p.width, p.height, pos, srcW, srcH);
}

SegmentRenderer::SourceWindow SegmentRenderer::sourceWindow(const Segment& segment,
                                                            const TimelineClip& clip) const {
    const double offset = std::max(0.0, segment.startTime - clip.startTime);
    SourceWindow w;
    w.start = clip.trimStart + offset;
    const double end = std::min(clip.trimStart + (segment.endTime - clip.startTime), clip.trimEnd);
    w.duration = end - w.start;

    // Timeline span outlasting the trim window: hold the last frame
    const double frame = 1.0 / (m_context.profile.fps > 0.0 ? m_context.profile.fps : AppConstants::DefaultFps);
    if (w.duration < frame) {
        w.duration = std::min(frame, clip.trimmedDuration());
        w.start = std::max(clip.trimStart, clip.trimEnd - w.duration);
    }
    return w;
}

const VideoClip* SegmentRenderer::sourceFor(const TimelineClip& clip) const {
    return TimelineValidator::findClip(m_context.clips, clip.videoClipId);
}

bool SegmentRenderer::sourceHasAudio(const TimelineClip& clip) {
    const VideoClip* source = sourceFor(clip);
    if (!source || !m_probes) return false;

    MediaInfo info;
    if (!m_probes->lookup(source->filePath, info)) {
        qCWarning(lcRender) << "Treating" << source->filePath << "as silent:" << m_probes->lastError();
        return false;
    }
    return info.hasAudio;
}

bool SegmentRenderer::trackContributesAudio(int trackIndex, const TimelineClip& clip) {
    if (m_context.tracks[trackIndex].effectiveVolume() <= 0.0)
        return false;
    return sourceHasAudio(clip);
}

QStringList SegmentRenderer::outputOptions(double duration, const QString& outputPath) const {
    QStringList opts = EncodeOptions::standard(m_context.profile, duration);
    OutputFormat container = OutputFormat::Mp4;
    ExportSettingsUtil::formatFromString(QFileInfo(outputPath).suffix(), container);
    opts << EncodeOptions::containerFlags(container);
    return opts;
}

QString SegmentRenderer::scratchPath(const QString& tag) const {
    return QDir(m_context.workDir).filePath(QString("seg_%1_%2.mp4").arg(m_index, 4, 10, QChar('0')).arg(tag));
}

void SegmentRenderer::runStep(Step step, const TranscodeRequest& request) {
    m_step = step;
    m_stepDuration = request.expectedDuration;
    if (request.outputPath != m_outputPath && !m_scratch.contains(request.outputPath))
        m_scratch << request.outputPath;

    qCDebug(lcRender).noquote() << "  step:" << request.label;
    m_runner->start(request);
}

void SegmentRenderer::startOverlay() {
    const int t = m_overlayTracks[m_overlayCursor];
    const TimelineClip& clip = *m_segment.clips[t];

    m_overlayRect = overlayRectFor(t, clip);
    m_overlayPath = scratchPath(QString("ov%1").arg(t));
    runStep(Step::OverlayPart, clipPartRequest(m_segment, clip, t, PartMode::Overlay, m_overlayPath));
}

void SegmentRenderer::startComposite(CompositeAttempt attempt) {
    const int t = m_overlayTracks[m_overlayCursor];
    const TimelineClip& clip = *m_segment.clips[t];
    const bool last = m_overlayCursor + 1 == m_overlayTracks.size();

    m_attempt = attempt;
    m_mix = AudioMixParams{};
    m_mix.source = AudioFallback::chooseSource(m_baseHasAudio, trackContributesAudio(t, clip));
    m_mix.baseVolume = m_baseVolume;
    m_mix.overlayVolume = m_context.tracks[t].effectiveVolume();
    m_compositePath = last ? m_outputPath : scratchPath(QString("comp%1").arg(t));

    runStep(Step::Composite, compositeRequest(m_basePath, m_overlayPath, m_overlayRect,
                                              m_segment.duration(), attempt, m_mix, m_compositePath));
}

void SegmentRenderer::advanceAfterComposite() {
    m_baseHasAudio = AudioFallback::producesAudio(m_mix.source, m_attempt);
    // Track volumes are baked into the composite's audio from here on
    m_baseVolume = 1.0;
    m_basePath = m_compositePath;

    ++m_overlayCursor;
    if (m_overlayCursor < m_overlayTracks.size()) {
        startOverlay();
    } else {
        complete();
    }
}

void SegmentRenderer::onRunnerProgress(double elapsedSeconds) {
    if (!m_busy || m_stepsTotal <= 0) return;

    double stepFraction = m_stepDuration > 0.0 ? elapsedSeconds / m_stepDuration : 0.0;
    stepFraction = std::clamp(stepFraction, 0.0, 1.0);
    emit progress(std::min(1.0, (m_stepsDone + stepFraction) / m_stepsTotal));
}

void SegmentRenderer::cancel() {
    if (!m_busy || m_cancelled) return;
    m_cancelled = true;
    if (m_runner->isRunning())
        m_runner->terminate();
}

void SegmentRenderer::onRunnerFinished(const TranscodeResult& result) {
    if (!m_busy) return;

    if (m_cancelled) {
        fail(ExportError::cancelled());
        return;
    }

    if (result.outcome == TranscodeResult::Outcome::SpawnFailed) {
        fail(ExportError::spawn(result.errorText));
        return;
    }

    if (result.outcome == TranscodeResult::Outcome::ExitFailed && m_step == Step::Composite) {
        CompositeAttempt next;
        if (AudioFallback::nextAttempt(m_attempt, next)) {
            qCWarning(lcRender).noquote()
                << QString("Composite %1 attempt failed for segment %2 (exit %3), retrying with %4")
                       .arg(AudioFallback::attemptName(m_attempt)).arg(m_index)
                       .arg(result.exitCode).arg(AudioFallback::attemptName(next));
            startComposite(next);
            return;
        }
    }

    if (!result.ok()) {
        QString message = result.outcome == TranscodeResult::Outcome::Crashed
            ? QString("Encoder terminated while rendering segment %1").arg(m_index)
            : QString("Encoder failed with code %1 while rendering segment %2")
                  .arg(result.exitCode).arg(m_index);
        if (!result.errorText.isEmpty())
            message += ": " + result.errorText.section('\n', -3);
        fail(ExportError::exit(message));
        return;
    }

    ++m_stepsDone;
    switch (m_step) {
    case Step::Single:
        complete();
        break;
    case Step::BasePart:
        startOverlay();
        break;
    case Step::OverlayPart:
        startComposite(CompositeAttempt::Primary);
        break;
    case Step::Composite:
        advanceAfterComposite();
        break;
    }
}

void SegmentRenderer::complete() {
    disconnectRunner();
    removeScratch();
    m_busy = false;
    emit progress(1.0);
    emit finished(true, ExportError{});
}

void SegmentRenderer::fail(const ExportError& error) {
    disconnectRunner();
    removeScratch();
    m_busy = false;
    qCWarning(lcRender).noquote() << "Segment" << m_index << "failed:" << error.message;
    emit finished(false, error);
}

void SegmentRenderer::removeScratch() {
    for (const auto& path : m_scratch) {
        if (QFile::exists(path) && !QFile::remove(path))
            qCWarning(lcRender) << "Could not remove intermediate" << path;
    }
    m_scratch.clear();
}

void SegmentRenderer::disconnectRunner() {
    disconnect(m_progressConn);
    disconnect(m_finishedConn);
}
