#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <memory>
#include <vector>
#include "Clip.h"
#include "ExportConfig.h"
#include "ExportError.h"
#include "ExportSettings.h"
#include "MediaProbe.h"
#include "Segment.h"
#include "Timeline.h"
#include "TranscodeRequest.h"
#include "TranscodeRunner.h"

class QTemporaryDir;
class SegmentRenderer;
class SequenceAssembler;

enum class ExportState {
    Idle,
    Validating,
    Planning,
    RenderingSegment,
    Assembling,
    Done,
    Failed
};

struct ExportResult {
    bool success = false;
    QString outputPath;
    int segmentCount = 0;
    double duration = 0.0;   // seconds of output
    ExportError error;
};

// One export of one timeline to one destination file. Owns its encoder
// runner, its prober and a private temporary directory; nothing is shared
// with other jobs. Driven entirely by runner completion signals.
class ExportJob : public QObject {
    Q_OBJECT
public:
    ExportJob(const Timeline& timeline, const std::vector<VideoClip>& clips,
              const ExportSettings& settings, const QString& outputPath,
              const ExportConfig& config, std::unique_ptr<TranscodeRunner> runner,
              std::unique_ptr<MediaProbe> probe, QObject* parent = nullptr);
    ~ExportJob() override;

    // Begins on the next event-loop turn so callers can connect first
    void start();
    void cancel();

    ExportState state() const { return m_state; }
    bool isFinished() const { return m_state == ExportState::Done || m_state == ExportState::Failed; }
    bool isCancelled() const { return m_cancelled; }
    int currentSegment() const { return m_current; }
    int segmentCount() const { return static_cast<int>(m_segments.size()); }
    const std::vector<Segment>& segments() const { return m_segments; }
    const ExportResult& result() const { return m_result; }
    QString outputPath() const { return m_outputPath; }
    QString workDir() const;

    // Canvas and frame rate every intermediate is encoded to: explicit
    // settings, else the first base clip (probed when unknown), else defaults.
    static OutputProfile resolveProfile(const ExportSettings& settings, const std::vector<Track>& videoTracks,
                                        const std::vector<VideoClip>& clips, ProbeCache* probes);

    // True when only the base track holds clips and they run back to back from 0
    static bool isFastPath(const std::vector<Track>& videoTracks);

    static const char* stateName(ExportState state);

signals:
    void stateChanged(ExportState state);
    void progress(double percent, const QString& message);
    void finished(const ExportResult& result);

private slots:
    void onSegmentProgress(double fraction);
    void onSegmentFinished(bool success, const ExportError& error);
    void onAssemblyProgress(double elapsedSeconds);
    void onAssemblyFinished(const TranscodeResult& result);

private:
    void begin();
    bool prepareWorkDir();
    void planSegments();
    void renderNext();
    void assemble();
    void finalize(const QString& producedPath);

    QString segmentPath(int index) const;
    QString finalTempPath() const;
    void setState(ExportState state);
    void report(double percent, const QString& message);
    void fail(const ExportError& error);
    void cleanup();

    Timeline m_timeline;
    std::vector<VideoClip> m_clips;
    std::vector<Track> m_videoTracks;
    ExportSettings m_settings;
    QString m_outputPath;
    ExportConfig m_config;

    std::unique_ptr<TranscodeRunner> m_runner;
    std::unique_ptr<MediaProbe> m_probe;
    std::unique_ptr<ProbeCache> m_probes;
    std::unique_ptr<QTemporaryDir> m_workDir;
    std::unique_ptr<SegmentRenderer> m_renderer;
    std::unique_ptr<SequenceAssembler> m_assembler;

    ExportState m_state = ExportState::Idle;
    OutputProfile m_profile;
    std::vector<Segment> m_segments;
    QStringList m_segmentFiles;
    bool m_fastPath = false;
    int m_current = -1;
    double m_duration = 0.0;
    double m_lastPercent = 0.0;
    bool m_started = false;
    bool m_cancelled = false;
    bool m_wroteDestination = false;
    ExportResult m_result;

    QMetaObject::Connection m_assemblyProgressConn;
    QMetaObject::Connection m_assemblyFinishedConn;
};
