#pragma once

#include <QObject>
#include <QString>
#include <functional>
#include <memory>
#include <vector>
#include "ExportConfig.h"
#include "ExportJob.h"

// Caller-held reference to a running export; pass it to cancel()
using ExportHandle = std::shared_ptr<ExportJob>;

// Entry point of the export engine. Each startExport() creates an
// independent ExportJob with its own runner, prober and temporary
// directory, so several exports may run side by side.
class MediaExporter : public QObject {
    Q_OBJECT
public:
    using RunnerFactory = std::function<std::unique_ptr<TranscodeRunner>(const ExportConfig&)>;
    using ProbeFactory = std::function<std::unique_ptr<MediaProbe>()>;

    explicit MediaExporter(const ExportConfig& config = ExportConfig(), QObject* parent = nullptr);
    ~MediaExporter();

    // Returns immediately; the job begins on the next event-loop turn and
    // reports through its progress() and finished() signals.
    ExportHandle startExport(const Timeline& timeline, const std::vector<VideoClip>& clips,
                             const ExportSettings& settings, const QString& outputPath);
    void cancel(const ExportHandle& handle);
    void cancelAll();

    int activeExports() const { return static_cast<int>(m_jobs.size()); }
    const ExportConfig& config() const { return m_config; }

    // Substitute how encoders and probers are created (tests, alternative encoders)
    void setRunnerFactory(RunnerFactory factory) { m_runnerFactory = std::move(factory); }
    void setProbeFactory(ProbeFactory factory) { m_probeFactory = std::move(factory); }

signals:
    void exportFinished(const ExportResult& result);

private:
    void release(ExportJob* job);

    ExportConfig m_config;
    RunnerFactory m_runnerFactory;
    ProbeFactory m_probeFactory;
    std::vector<ExportHandle> m_jobs;
};
