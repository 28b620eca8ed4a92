#include "MediaExporter.h"
#include "FFmpegProcess.h"
#include "Logging.h"
#include <algorithm>

MediaExporter::MediaExporter(const ExportConfig& config, QObject* parent)
    : QObject(parent), m_config(config)
{
    m_runnerFactory = [](const ExportConfig& cfg) -> std::unique_ptr<TranscodeRunner> {
        return std::make_unique<FFmpegProcess>(cfg.ffmpegPath);
    };
    m_probeFactory = []() { return std::make_unique<MediaProbe>(); };
}

MediaExporter::~MediaExporter() {
    cancelAll();
}

ExportHandle MediaExporter::startExport(const Timeline& timeline, const std::vector<VideoClip>& clips,
                                        const ExportSettings& settings, const QString& outputPath) {
    auto job = std::make_shared<ExportJob>(timeline, clips, settings, outputPath, m_config,
                                           m_runnerFactory(m_config), m_probeFactory());
    ExportJob* raw = job.get();

    connect(raw, &ExportJob::finished, this, [this, raw](const ExportResult& result) {
        emit exportFinished(result);
        // Drop our reference once the job's own signal emission has unwound
        QMetaObject::invokeMethod(this, [this, raw]() { release(raw); }, Qt::QueuedConnection);
    });

    m_jobs.push_back(job);
    qCDebug(lcExport) << "Queued export" << outputPath << "active:" << m_jobs.size();
    job->start();
    return job;
}

void MediaExporter::cancel(const ExportHandle& handle) {
    if (handle) handle->cancel();
}

void MediaExporter::cancelAll() {
    // cancel() may finish a job synchronously; iterate over a snapshot
    const auto jobs = m_jobs;
    for (const auto& job : jobs) job->cancel();
}

void MediaExporter::release(ExportJob* job) {
    m_jobs.erase(std::remove_if(m_jobs.begin(), m_jobs.end(),
                                [job](const ExportHandle& h) { return h.get() == job; }),
                 m_jobs.end());
}
