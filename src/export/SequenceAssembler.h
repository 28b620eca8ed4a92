#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include "ExportError.h"
#include "ExportSettings.h"
#include "TranscodeRequest.h"

// Joins rendered segment files, in order, into one file by stream copy.
// Segments must share codec parameters, which EncodeOptions::standard
// guarantees.
class SequenceAssembler : public QObject {
    Q_OBJECT
public:
    explicit SequenceAssembler(const QString& workDir, QObject* parent = nullptr);
    ~SequenceAssembler();

    // Verifies the inputs, writes the concat manifest and fills request.
    // On false, error() holds an Assembly error.
    bool prepare(const QStringList& segmentPaths, const QString& outputPath,
                 OutputFormat format, TranscodeRequest& request);

    QString manifestPath() const { return m_manifestPath; }
    const ExportError& error() const { return m_error; }
    QString errorString() const { return m_error.message; }

    // One "file '<path>'" line per segment, single quotes escaped
    static QString manifestText(const QStringList& segmentPaths);
    static QString escapePath(const QString& path);

private:
    bool fail(const QString& message);

    QString m_workDir;
    QString m_manifestPath;
    ExportError m_error;
};
