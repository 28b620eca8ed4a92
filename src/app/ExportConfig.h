#pragma once

#include <QObject>
#include <QString>
#include <QJsonObject>

struct ExportConfig {
    QString ffmpegPath = "ffmpeg";   // resolved through PATH when not absolute
    QString tempRoot;                // empty = QDir::tempPath()

    QString effectiveTempRoot() const;
};

// Loads ExportConfig from an optional JSON file, then applies environment
// overrides (REELFORGE_FFMPEG, REELFORGE_TEMP).
class ExportConfigLoader : public QObject {
    Q_OBJECT
public:
    explicit ExportConfigLoader(QObject* parent = nullptr);
    ~ExportConfigLoader();

    bool load(const QString& filePath, ExportConfig& config);
    static void applyEnvironment(ExportConfig& config);

    static ExportConfig fromJson(const QJsonObject& obj);

    QString errorString() const { return m_error; }

private:
    QString m_error;
};
