#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <vector>
#include "AudioFallback.h"
#include "Clip.h"
#include "ExportError.h"
#include "MediaProbe.h"
#include "OverlayLayout.h"
#include "Segment.h"
#include "Track.h"
#include "TranscodeRequest.h"
#include "TranscodeRunner.h"

enum class RenderStrategy {
    GapFill,     // no active clip: solid colour + silence
    Direct,      // exactly one active clip
    Composite    // clips on two or more tracks
};

// Everything the renderer needs that stays fixed for one export
struct RenderContext {
    OutputProfile profile;
    std::vector<Track> tracks;       // video tracks, index 0 is the base
    std::vector<VideoClip> clips;
    QString workDir;                 // per-export temporary directory
};

// Renders one Segment to one intermediate file. Runs its encoder steps one
// at a time on the shared TranscodeRunner and reports through finished().
class SegmentRenderer : public QObject {
    Q_OBJECT
public:
    SegmentRenderer(const RenderContext& context, TranscodeRunner* runner,
                    ProbeCache* probes, QObject* parent = nullptr);
    ~SegmentRenderer() override;

    // Starts rendering; false if a render is already in progress
    bool render(const Segment& segment, int index, const QString& outputPath);
    bool isBusy() const { return m_busy; }
    // Terminates the in-flight step; the render then fails as Cancelled
    void cancel();

    static RenderStrategy chooseStrategy(const Segment& segment);
    static const char* strategyName(RenderStrategy strategy);

    // Request builders, exposed for inspection
    TranscodeRequest gapFillRequest(double duration, const QString& outputPath) const;
    TranscodeRequest segmentClipRequest(const Segment& segment, int trackIndex,
                                        const QString& outputPath);
    TranscodeRequest compositeRequest(const QString& basePath, const QString& overlayPath,
                                      const OverlayRect& rect, double duration,
                                      CompositeAttempt attempt, const AudioMixParams& mix,
                                      const QString& outputPath) const;

    OverlayRect overlayRectFor(int trackIndex, const TimelineClip& clip);

signals:
    void progress(double fraction);
    void finished(bool success, const ExportError& error);

private slots:
    void onRunnerProgress(double elapsedSeconds);
    void onRunnerFinished(const TranscodeResult& result);

private:
    enum class Step {
        Single,        // gap fill or direct render straight to the output
        BasePart,
        OverlayPart,
        Composite
    };

    enum class PartMode {
        Segment,       // final segment file: fitted to canvas, audio guaranteed
        Base,          // composite base: fitted to canvas, source audio only
        Overlay        // composite overlay: sized to its overlay rect
    };

    struct SourceWindow {
        double start = 0.0;
        double duration = 0.0;
    };

    TranscodeRequest clipPartRequest(const Segment& segment, const TimelineClip& clip, int trackIndex,
                                     PartMode mode, const QString& outputPath);
    SourceWindow sourceWindow(const Segment& segment, const TimelineClip& clip) const;
    const VideoClip* sourceFor(const TimelineClip& clip) const;
    bool sourceHasAudio(const TimelineClip& clip);
    bool trackContributesAudio(int trackIndex, const TimelineClip& clip);
    QStringList outputOptions(double duration, const QString& outputPath) const;
    QString scratchPath(const QString& tag) const;

    void runStep(Step step, const TranscodeRequest& request);
    void startOverlay();
    void startComposite(CompositeAttempt attempt);
    void advanceAfterComposite();
    void complete();
    void fail(const ExportError& error);
    void removeScratch();
    void disconnectRunner();

    RenderContext m_context;
    TranscodeRunner* m_runner;
    ProbeCache* m_probes;

    // Current render
    bool m_busy = false;
    bool m_cancelled = false;
    Segment m_segment;
    int m_index = 0;
    QString m_outputPath;
    RenderStrategy m_strategy = RenderStrategy::GapFill;
    Step m_step = Step::Single;
    double m_stepDuration = 0.0;
    int m_stepsDone = 0;
    int m_stepsTotal = 1;

    // Composite chain state
    std::vector<int> m_overlayTracks;   // active overlay track indices, in order
    size_t m_overlayCursor = 0;
    QString m_basePath;
    bool m_baseHasAudio = false;
    double m_baseVolume = 1.0;
    QString m_overlayPath;
    QString m_compositePath;
    OverlayRect m_overlayRect;
    AudioMixParams m_mix;
    CompositeAttempt m_attempt = CompositeAttempt::Primary;
    QStringList m_scratch;

    QMetaObject::Connection m_progressConn;
    QMetaObject::Connection m_finishedConn;
};
