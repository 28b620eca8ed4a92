#pragma once

#include <QObject>
#include <QString>
#include <QJsonObject>
#include <vector>
#include "Clip.h"
#include "ExportSettings.h"
#include "Timeline.h"

// Everything one export needs, as stored in a project document
struct Project {
    QString name;
    std::vector<VideoClip> clips;
    Timeline timeline;
    ExportSettings exportSettings;
};

// Reads and writes project documents:
//   { "version": 1, "name": ..., "clips": [...],
//     "timeline": { "duration": ..., "tracks": [...] },
//     "exportSettings": { "resolution": "1080p", "quality": "high", ... } }
// Relative clip paths are resolved against the document's directory.
class TimelineJson : public QObject {
    Q_OBJECT
public:
    explicit TimelineJson(QObject* parent = nullptr);
    ~TimelineJson();

    bool load(const QString& filePath, Project& project);
    bool save(const QString& filePath, const Project& project);

    bool fromJson(const QJsonObject& root, Project& project, const QString& baseDir = QString());
    static QJsonObject toJson(const Project& project);

    static QJsonObject clipToJson(const VideoClip& clip);
    static VideoClip clipFromJson(const QJsonObject& obj, const QString& baseDir);

    static QJsonObject trackToJson(const Track& track);
    static Track trackFromJson(const QJsonObject& obj);

    static QJsonObject settingsToJson(const ExportSettings& settings);
    bool settingsFromJson(const QJsonObject& obj, ExportSettings& settings);

    // Named colours and #RRGGBB / 0xRRGGBB only; anything else could inject
    // into the encoder's filter syntax
    static bool isValidColor(const QString& color);

    QString errorString() const { return m_error; }

private:
    QString m_error;
};
