#include "SequenceAssembler.h"
#include "Logging.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>

SequenceAssembler::SequenceAssembler(const QString& workDir, QObject* parent)
    : QObject(parent), m_workDir(workDir) {}

SequenceAssembler::~SequenceAssembler() = default;

QString SequenceAssembler::escapePath(const QString& path) {
    QString escaped = QFileInfo(path).absoluteFilePath();
    escaped.replace("'", "'\\''");
    return escaped;
}

QString SequenceAssembler::manifestText(const QStringList& segmentPaths) {
    QString text;
    for (const auto& path : segmentPaths) {
        text += QString("file '%1'\n").arg(escapePath(path));
    }
    return text;
}

bool SequenceAssembler::prepare(const QStringList& segmentPaths, const QString& outputPath,
                                OutputFormat format, TranscodeRequest& request) {
    m_error = ExportError{};
    m_manifestPath.clear();

    if (segmentPaths.isEmpty())
        return fail("No segments to assemble");

    for (int i = 0; i < segmentPaths.size(); ++i) {
        const QFileInfo fi(segmentPaths[i]);
        if (!fi.exists() || fi.size() == 0)
            return fail(QString("Segment %1 is missing: %2").arg(i).arg(segmentPaths[i]));
    }

    const QString manifest = QDir(m_workDir).filePath("concat.txt");
    QFile file(manifest);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text))
        return fail(QString("Cannot write concat list %1: %2").arg(manifest, file.errorString()));

    QTextStream out(&file);
    out << manifestText(segmentPaths);
    out.flush();
    file.close();
    if (file.error() != QFileDevice::NoError)
        return fail(QString("Cannot write concat list %1: %2").arg(manifest, file.errorString()));

    m_manifestPath = manifest;

    request = TranscodeRequest{};
    request.label = QString("concat %1 segments").arg(segmentPaths.size());
    TranscodeInput list;
    list.source = manifest;
    list.options << "-f" << "concat" << "-safe" << "0";
    request.inputs.push_back(list);
    request.maps << "0:v" << "0:a?";
    request.outputOptions << "-c" << "copy" << EncodeOptions::containerFlags(format);
    request.outputPath = outputPath;

    qCDebug(lcExport) << "Concat list written to" << manifest << "with" << segmentPaths.size() << "entries";
    return true;
}

bool SequenceAssembler::fail(const QString& message) {
    m_error = ExportError::assembly(message);
    qCWarning(lcExport).noquote() << "Assembly:" << message;
    return false;
}
