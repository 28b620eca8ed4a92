#include "ExportJob.h"
#include "AppConstants.h"
#include "Logging.h"
#include "SegmentPlanner.h"
#include "SegmentRenderer.h"
#include "SequenceAssembler.h"
#include "TimelineValidator.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <algorithm>

ExportJob::ExportJob(const Timeline& timeline, const std::vector<VideoClip>& clips,
                     const ExportSettings& settings, const QString& outputPath,
                     const ExportConfig& config, std::unique_ptr<TranscodeRunner> runner,
                     std::unique_ptr<MediaProbe> probe, QObject* parent)
    : QObject(parent)
    , m_timeline(timeline)
    , m_clips(clips)
    , m_settings(settings)
    , m_outputPath(outputPath)
    , m_config(config)
    , m_runner(std::move(runner))
    , m_probe(std::move(probe))
{
    m_probes = std::make_unique<ProbeCache>(m_probe.get());
}

ExportJob::~ExportJob() {
    if (!isFinished() && m_runner && m_runner->isRunning())
        m_runner->terminate();
    m_renderer.reset();
    cleanup();
}

QString ExportJob::workDir() const {
    return m_workDir ? m_workDir->path() : QString();
}

const char* ExportJob::stateName(ExportState state) {
    switch (state) {
    case ExportState::Idle:             return "idle";
    case ExportState::Validating:       return "validating";
    case ExportState::Planning:         return "planning";
    case ExportState::RenderingSegment: return "rendering";
    case ExportState::Assembling:       return "assembling";
    case ExportState::Done:             return "done";
    case ExportState::Failed:           return "failed";
    }
    return "unknown";
}

OutputProfile ExportJob::resolveProfile(const ExportSettings& settings, const std::vector<Track>& videoTracks,
                                        const std::vector<VideoClip>& clips, ProbeCache* probes) {
    OutputProfile profile;
    profile.settings = settings;

    int width = settings.width;
    int height = settings.height;
    double fps = settings.fps;

    const VideoClip* first = nullptr;
    if (!videoTracks.empty()) {
        const auto sorted = videoTracks[0].sortedClips();
        if (!sorted.empty())
            first = TimelineValidator::findClip(clips, sorted.front().videoClipId);
    }

    if (first && (settings.useSourceResolution() || fps <= 0.0)) {
        int srcW = first->width;
        int srcH = first->height;
        double srcFps = first->fps;

        if ((srcW <= 0 || srcH <= 0 || srcFps <= 0.0) && probes) {
            MediaInfo info;
            if (probes->lookup(first->filePath, info)) {
                if (srcW <= 0 || srcH <= 0) {
                    srcW = info.videoWidth;
                    srcH = info.videoHeight;
                }
                if (srcFps <= 0.0) srcFps = info.videoFps;
            } else {
                qCWarning(lcExport) << "Cannot probe" << first->filePath << "for output defaults:" << probes->lastError();
            }
        }

        if (settings.useSourceResolution() && srcW > 0 && srcH > 0) {
            width = srcW;
            height = srcH;
        }
        if (fps <= 0.0 && srcFps > 0.0) fps = srcFps;
    }

    if (width <= 0 || height <= 0) {
        width = AppConstants::DefaultCanvasWidth;
        height = AppConstants::DefaultCanvasHeight;
    }

    profile.width = ExportSettingsUtil::evenDimension(width);
    profile.height = ExportSettingsUtil::evenDimension(height);
    profile.fps = fps > 0.0 ? fps : AppConstants::DefaultFps;
    return profile;
}

bool ExportJob::isFastPath(const std::vector<Track>& videoTracks) {
    if (videoTracks.empty() || videoTracks[0].clipCount() == 0) return false;
    for (size_t i = 1; i < videoTracks.size(); ++i) {
        if (videoTracks[i].clipCount() > 0) return false;
    }
    return SegmentPlanner::isContiguousFromZero(videoTracks[0]);
}

void ExportJob::start() {
    if (m_started) return;
    m_started = true;
    QMetaObject::invokeMethod(this, [this]() { begin(); }, Qt::QueuedConnection);
}

void ExportJob::cancel() {
    if (isFinished() || m_cancelled) return;
    m_cancelled = true;
    qCInfo(lcExport) << "Cancelling export to" << m_outputPath;

    if (!m_started) {
        fail(ExportError::cancelled());
        return;
    }

    if (m_state == ExportState::RenderingSegment && m_renderer && m_renderer->isBusy()) {
        m_renderer->cancel();
    } else if (m_state == ExportState::Assembling && m_runner->isRunning()) {
        m_runner->terminate();
    }
    // Otherwise the next scheduled step sees the flag
}

void ExportJob::begin() {
    if (m_cancelled) {
        fail(ExportError::cancelled());
        return;
    }

    setState(ExportState::Validating);
    report(0.0, "Validating timeline");

    TimelineValidator validator;
    if (!validator.validate(m_timeline, m_clips)) {
        fail(validator.error());
        return;
    }

    m_videoTracks = m_timeline.videoTracks();
    if (!prepareWorkDir()) return;

    m_profile = resolveProfile(m_settings, m_videoTracks, m_clips, m_probes.get());
    qCInfo(lcExport).noquote() << QString("Exporting to %1: %2x%3 @ %4 fps, %5 quality, %6")
        .arg(m_outputPath).arg(m_profile.width).arg(m_profile.height).arg(m_profile.fps)
        .arg(ExportSettingsUtil::qualityName(m_settings.quality),
             ExportSettingsUtil::formatName(m_settings.format));

    m_fastPath = isFastPath(m_videoTracks);
    if (m_fastPath) {
        m_segments = SegmentPlanner::planClipSequence(m_videoTracks[0]);
        m_duration = 0.0;
        for (const auto& seg : m_segments) m_duration += seg.duration();
        qCInfo(lcExport) << "Single base track, rendering" << m_segments.size() << "clip(s) without compositing";
    } else {
        planSegments();
    }

    if (m_segments.empty()) {
        fail(ExportError::validation("Timeline has nothing to render"));
        return;
    }

    RenderContext context;
    context.profile = m_profile;
    context.tracks = m_videoTracks;
    context.clips = m_clips;
    context.workDir = m_workDir->path();

    m_renderer = std::make_unique<SegmentRenderer>(context, m_runner.get(), m_probes.get());
    connect(m_renderer.get(), &SegmentRenderer::progress, this, &ExportJob::onSegmentProgress);
    connect(m_renderer.get(), &SegmentRenderer::finished, this, &ExportJob::onSegmentFinished);

    m_current = -1;
    renderNext();
}

bool ExportJob::prepareWorkDir() {
    const QString root = m_config.effectiveTempRoot();
    if (!QDir().mkpath(root)) {
        fail(ExportError::assembly(QString("Cannot create temporary root %1").arg(root)));
        return false;
    }

    m_workDir = std::make_unique<QTemporaryDir>(QDir(root).filePath("reelforge-XXXXXX"));
    if (!m_workDir->isValid()) {
        const QString message = QString("Cannot create temporary directory in %1: %2")
            .arg(root, m_workDir->errorString());
        m_workDir.reset();
        fail(ExportError::assembly(message));
        return false;
    }

    qCDebug(lcExport) << "Working directory" << m_workDir->path();
    return true;
}

void ExportJob::planSegments() {
    setState(ExportState::Planning);
    report(AppConstants::ProgressPlanning, "Planning segments");

    m_duration = m_timeline.compositionDuration();
    m_segments = SegmentPlanner::plan(m_videoTracks, m_duration);

    qCInfo(lcExport) << "Planned" << m_segments.size() << "segment(s) over" << m_duration << "s";
    for (size_t i = 0; i < m_segments.size(); ++i) {
        const auto& seg = m_segments[i];
        qCDebug(lcExport).noquote() << QString("  #%1 [%2, %3) %4 active")
            .arg(i).arg(seg.startTime).arg(seg.endTime).arg(seg.activeTrackCount());
    }
}

void ExportJob::renderNext() {
    if (isFinished()) return;
    if (m_cancelled) {
        fail(ExportError::cancelled());
        return;
    }

    ++m_current;
    const int total = segmentCount();
    if (m_current >= total) {
        assemble();
        return;
    }

    setState(ExportState::RenderingSegment);
    const double span = AppConstants::ProgressSegmentsEnd - AppConstants::ProgressSegmentsBegin;
    report(AppConstants::ProgressSegmentsBegin + span * m_current / total,
           QString("Rendering segment %1 of %2").arg(m_current + 1).arg(total));

    // A single segment is encoded straight into the final container
    const QString out = total == 1 ? finalTempPath() : segmentPath(m_current);
    m_segmentFiles << out;
    m_renderer->render(m_segments[m_current], m_current, out);
}

void ExportJob::onSegmentProgress(double fraction) {
    if (m_state != ExportState::RenderingSegment) return;

    const int total = segmentCount();
    const double span = AppConstants::ProgressSegmentsEnd - AppConstants::ProgressSegmentsBegin;
    const double f = std::clamp(fraction, 0.0, 1.0);
    report(AppConstants::ProgressSegmentsBegin + span * (m_current + f) / total,
           QString("Rendering segment %1 of %2").arg(m_current + 1).arg(total));
}

void ExportJob::onSegmentFinished(bool success, const ExportError& error) {
    if (isFinished()) return;

    if (!success) {
        fail(m_cancelled ? ExportError::cancelled() : error);
        return;
    }

    QMetaObject::invokeMethod(this, [this]() { renderNext(); }, Qt::QueuedConnection);
}

void ExportJob::assemble() {
    if (segmentCount() == 1) {
        finalize(finalTempPath());
        return;
    }

    setState(ExportState::Assembling);
    report(AppConstants::ProgressSegmentsEnd, QString("Joining %1 segments").arg(segmentCount()));

    m_assembler = std::make_unique<SequenceAssembler>(m_workDir->path());
    TranscodeRequest request;
    if (!m_assembler->prepare(m_segmentFiles, finalTempPath(), m_settings.format, request)) {
        fail(m_assembler->error());
        return;
    }
    request.expectedDuration = m_duration;

    m_assemblyProgressConn = connect(m_runner.get(), &TranscodeRunner::progress,
                                     this, &ExportJob::onAssemblyProgress);
    m_assemblyFinishedConn = connect(m_runner.get(), &TranscodeRunner::finished,
                                     this, &ExportJob::onAssemblyFinished);
    m_runner->start(request);
}

void ExportJob::onAssemblyProgress(double elapsedSeconds) {
    if (m_duration <= 0.0) return;
    const double f = std::clamp(elapsedSeconds / m_duration, 0.0, 1.0);
    report(AppConstants::ProgressSegmentsEnd + (99.0 - AppConstants::ProgressSegmentsEnd) * f,
           QString("Joining %1 segments").arg(segmentCount()));
}

void ExportJob::onAssemblyFinished(const TranscodeResult& result) {
    disconnect(m_assemblyProgressConn);
    disconnect(m_assemblyFinishedConn);
    if (isFinished()) return;

    if (m_cancelled) {
        fail(ExportError::cancelled());
        return;
    }

    if (result.outcome == TranscodeResult::Outcome::SpawnFailed) {
        fail(ExportError::spawn(result.errorText));
        return;
    }
    if (!result.ok()) {
        QString message = QString("Concatenation failed with code %1").arg(result.exitCode);
        if (!result.errorText.isEmpty())
            message += ": " + result.errorText.section('\n', -3);
        fail(ExportError::assembly(message));
        return;
    }

    const QFileInfo produced(finalTempPath());
    if (!produced.exists() || produced.size() == 0) {
        fail(ExportError::assembly("Concatenation produced no output"));
        return;
    }

    finalize(finalTempPath());
}

void ExportJob::finalize(const QString& producedPath) {
    if (m_cancelled) {
        fail(ExportError::cancelled());
        return;
    }

    report(99.0, "Finalizing");

    const QFileInfo dest(m_outputPath);
    if (!QDir().mkpath(dest.absolutePath())) {
        fail(ExportError::assembly(QString("Cannot create output directory %1").arg(dest.absolutePath())));
        return;
    }
    if (dest.exists() && !QFile::remove(m_outputPath)) {
        fail(ExportError::assembly(QString("Cannot replace existing file %1").arg(m_outputPath)));
        return;
    }

    // Rename fails across filesystems; fall back to a copy
    m_wroteDestination = true;
    if (!QFile::rename(producedPath, m_outputPath) && !QFile::copy(producedPath, m_outputPath)) {
        fail(ExportError::assembly(QString("Cannot move result to %1").arg(m_outputPath)));
        return;
    }

    m_result.success = true;
    m_result.outputPath = m_outputPath;
    m_result.segmentCount = segmentCount();
    m_result.duration = m_duration;
    m_result.error = ExportError{};

    cleanup();
    setState(ExportState::Done);
    report(100.0, "Export complete");
    qCInfo(lcExport).noquote() << QString("Export finished: %1 (%2 segment(s), %3 s)")
        .arg(m_outputPath).arg(segmentCount()).arg(m_duration);
    emit finished(m_result);
}

QString ExportJob::segmentPath(int index) const {
    return QDir(m_workDir->path()).filePath(QString("segment_%1.mp4").arg(index, 4, 10, QChar('0')));
}

QString ExportJob::finalTempPath() const {
    return QDir(m_workDir->path()).filePath("output." + ExportSettingsUtil::formatExtension(m_settings.format));
}

void ExportJob::setState(ExportState state) {
    if (m_state == state && state != ExportState::RenderingSegment) return;
    m_state = state;
    qCDebug(lcExport) << "State:" << stateName(state) << (state == ExportState::RenderingSegment ? m_current : -1);
    emit stateChanged(state);
}

void ExportJob::report(double percent, const QString& message) {
    // Never report going backwards
    m_lastPercent = std::clamp(percent, m_lastPercent, 100.0);
    emit progress(m_lastPercent, message);
}

void ExportJob::fail(const ExportError& error) {
    if (isFinished()) return;

    disconnect(m_assemblyProgressConn);
    disconnect(m_assemblyFinishedConn);
    if (m_runner && m_runner->isRunning())
        m_runner->terminate();

    cleanup();
    if (m_wroteDestination && QFile::exists(m_outputPath) && !QFile::remove(m_outputPath))
        qCCritical(lcExport) << "Cannot remove incomplete output" << m_outputPath;

    m_result.success = false;
    m_result.outputPath.clear();
    m_result.segmentCount = segmentCount();
    m_result.duration = m_duration;
    m_result.error = error;

    if (error.kind == ExportErrorKind::Cancelled) {
        qCInfo(lcExport) << "Export cancelled:" << m_outputPath;
    } else {
        qCWarning(lcExport).noquote() << QString("Export failed (%1): %2")
            .arg(exportErrorKindName(error.kind), error.message);
    }

    setState(ExportState::Failed);
    emit finished(m_result);
}

void ExportJob::cleanup() {
    if (!m_workDir) return;
    const QString path = m_workDir->path();
    if (!m_workDir->remove())
        qCWarning(lcExport) << "Could not fully remove working directory" << path;
    m_workDir.reset();
}
