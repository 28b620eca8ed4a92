#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QSize>
#include <QTimer>
#include <atomic>
#include <csignal>
#include <cstdio>
#include "AppConstants.h"
#include "ExportConfig.h"
#include "MediaExporter.h"
#include "TimelineJson.h"
#include "TimeUtil.h"

namespace {

std::atomic<bool> g_cancelRequested{false};

void onSignal(int) {
    g_cancelRequested = true;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName(AppConstants::AppName);
    app.setApplicationVersion(AppConstants::AppVersion);
    app.setOrganizationName(AppConstants::OrgName);

    QCommandLineParser parser;
    parser.setApplicationDescription("Render a multi-track timeline project to a single video file.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("project", "Project document (JSON).");

    QCommandLineOption outputOpt({"o", "output"}, "Destination file.", "file");
    QCommandLineOption configOpt("config", "Engine configuration (JSON).", "file");
    QCommandLineOption resolutionOpt("resolution", "720p, 1080p, source or WxH.", "res");
    QCommandLineOption qualityOpt("quality", "low, medium or high.", "quality");
    QCommandLineOption fpsOpt("fps", "Output frame rate.", "fps");
    QCommandLineOption verboseOpt({"v", "verbose"}, "Log every encoder invocation.");
    parser.addOptions({outputOpt, configOpt, resolutionOpt, qualityOpt, fpsOpt, verboseOpt});
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1 || !parser.isSet(outputOpt)) {
        std::fprintf(stderr, "%s\n", qPrintable(parser.helpText()));
        return 1;
    }

    if (parser.isSet(verboseOpt))
        QLoggingCategory::setFilterRules("reelforge.*.debug=true");

    ExportConfig config;
    ExportConfigLoader configLoader;
    if (!configLoader.load(parser.value(configOpt), config)) {
        std::fprintf(stderr, "Config error: %s\n", qPrintable(configLoader.errorString()));
        return 1;
    }

    Project project;
    TimelineJson reader;
    if (!reader.load(args.first(), project)) {
        std::fprintf(stderr, "Project error: %s\n", qPrintable(reader.errorString()));
        return 1;
    }

    // Command line overrides the document's export settings
    ExportSettings settings = project.exportSettings;
    if (parser.isSet(resolutionOpt)) {
        QSize size;
        if (!ExportSettingsUtil::resolutionFromString(parser.value(resolutionOpt), size)) {
            std::fprintf(stderr, "Unknown resolution: %s\n", qPrintable(parser.value(resolutionOpt)));
            return 1;
        }
        settings.width = size.isValid() ? size.width() : 0;
        settings.height = size.isValid() ? size.height() : 0;
    }
    if (parser.isSet(qualityOpt) &&
        !ExportSettingsUtil::qualityFromString(parser.value(qualityOpt), settings.quality)) {
        std::fprintf(stderr, "Unknown quality: %s\n", qPrintable(parser.value(qualityOpt)));
        return 1;
    }
    if (parser.isSet(fpsOpt)) {
        bool ok = false;
        settings.fps = parser.value(fpsOpt).toDouble(&ok);
        if (!ok || settings.fps <= 0.0) {
            std::fprintf(stderr, "Invalid frame rate: %s\n", qPrintable(parser.value(fpsOpt)));
            return 1;
        }
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    MediaExporter exporter(config);
    ExportHandle job = exporter.startExport(project.timeline, project.clips, settings,
                                            parser.value(outputOpt));

    int exitCode = 1;
    int lastShown = -1;
    QObject::connect(job.get(), &ExportJob::progress, &app, [&lastShown](double percent, const QString& message) {
        const int whole = static_cast<int>(percent);
        if (whole == lastShown) return;
        lastShown = whole;
        std::fprintf(stderr, "\r[%3d%%] %-48s", whole, qPrintable(message));
        std::fflush(stderr);
    });
    QObject::connect(job.get(), &ExportJob::finished, &app, [&app, &exitCode](const ExportResult& result) {
        std::fprintf(stderr, "\n");
        if (result.success) {
            std::printf("%s (%s, %d segment(s))\n", qPrintable(result.outputPath),
                        qPrintable(TimeUtil::secondsToHMS(result.duration)), result.segmentCount);
            exitCode = 0;
        } else {
            std::fprintf(stderr, "Export failed [%s]: %s\n",
                         exportErrorKindName(result.error.kind), qPrintable(result.error.message));
        }
        app.quit();
    });

    QTimer signalPoll;
    QObject::connect(&signalPoll, &QTimer::timeout, &app, [&exporter, &job]() {
        if (g_cancelRequested.exchange(false))
            exporter.cancel(job);
    });
    signalPoll.start(100);

    app.exec();
    return exitCode;
}
