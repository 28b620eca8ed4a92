#include "TimelineJson.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QRegularExpression>
#include <QSize>

TimelineJson::TimelineJson(QObject* parent) : QObject(parent) {}
TimelineJson::~TimelineJson() = default;

bool TimelineJson::load(const QString& filePath, Project& project) {
    QFileInfo fileInfo(filePath);
    if (!fileInfo.exists()) {
        m_error = QString("File not found: %1").arg(filePath);
        return false;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_error = QString("Cannot read: %1").arg(filePath);
        return false;
    }

    QJsonParseError parseError;
    auto doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (!doc.isObject()) {
        m_error = QString("Invalid project file format: %1").arg(parseError.errorString());
        return false;
    }

    return fromJson(doc.object(), project, fileInfo.absolutePath());
}

bool TimelineJson::save(const QString& filePath, const Project& project) {
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_error = QString("Cannot write to: %1").arg(filePath);
        return false;
    }

    const QByteArray bytes = QJsonDocument(toJson(project)).toJson(QJsonDocument::Indented);
    if (file.write(bytes) != bytes.size()) {
        m_error = QString("Cannot write to: %1: %2").arg(filePath, file.errorString());
        return false;
    }
    file.close();
    if (file.error() != QFileDevice::NoError) {
        m_error = QString("Cannot write to: %1: %2").arg(filePath, file.errorString());
        return false;
    }
    return true;
}

bool TimelineJson::fromJson(const QJsonObject& root, Project& project, const QString& baseDir) {
    int version = root["version"].toInt(0);
    if (version < 1) {
        m_error = "Unsupported project file version";
        return false;
    }

    Project result;
    result.name = root["name"].toString();

    for (const auto& val : root["clips"].toArray()) {
        VideoClip clip = clipFromJson(val.toObject(), baseDir);
        if (clip.id.isEmpty()) {
            m_error = "Clip without id in project";
            return false;
        }
        result.clips.push_back(clip);
    }

    auto timelineObj = root["timeline"].toObject();
    result.timeline.duration = timelineObj["duration"].toDouble(0.0);

    for (const auto& val : timelineObj["tracks"].toArray()) {
        auto trackObj = val.toObject();
        QString type = trackObj["type"].toString("video");
        if (type != "video" && type != "audio") {
            m_error = QString("Unknown track type '%1'").arg(type);
            return false;
        }
        result.timeline.tracks.push_back(trackFromJson(trackObj));
    }

    if (!settingsFromJson(root["exportSettings"].toObject(), result.exportSettings))
        return false;

    project = std::move(result);
    return true;
}

QJsonObject TimelineJson::toJson(const Project& project) {
    QJsonObject root;
    root["version"] = 1;
    root["name"] = project.name;

    QJsonArray clipsArray;
    for (const auto& clip : project.clips) {
        clipsArray.append(clipToJson(clip));
    }
    root["clips"] = clipsArray;

    QJsonArray tracksArray;
    for (const auto& track : project.timeline.tracks) {
        tracksArray.append(trackToJson(track));
    }
    QJsonObject timelineObj;
    timelineObj["duration"] = project.timeline.duration;
    timelineObj["tracks"] = tracksArray;
    root["timeline"] = timelineObj;

    root["exportSettings"] = settingsToJson(project.exportSettings);
    return root;
}

QJsonObject TimelineJson::clipToJson(const VideoClip& clip) {
    QJsonObject obj;
    obj["id"] = clip.id;
    obj["filePath"] = clip.filePath;
    obj["name"] = clip.name;
    obj["duration"] = clip.duration;
    obj["width"] = clip.width;
    obj["height"] = clip.height;
    obj["fps"] = clip.fps;
    return obj;
}

VideoClip TimelineJson::clipFromJson(const QJsonObject& obj, const QString& baseDir) {
    VideoClip clip;
    clip.id = obj["id"].toString();
    clip.filePath = obj["filePath"].toString();
    clip.name = obj["name"].toString(QFileInfo(clip.filePath).fileName());
    clip.duration = obj["duration"].toDouble(0.0);
    clip.width = obj["width"].toInt(0);
    clip.height = obj["height"].toInt(0);
    clip.fps = obj["fps"].toDouble(0.0);

    if (!clip.filePath.isEmpty() && !baseDir.isEmpty() && QDir::isRelativePath(clip.filePath))
        clip.filePath = QDir::cleanPath(QDir(baseDir).filePath(clip.filePath));
    return clip;
}

QJsonObject TimelineJson::trackToJson(const Track& track) {
    QJsonObject obj;
    obj["id"] = track.id();
    obj["name"] = track.name();
    obj["type"] = track.isVideo() ? "video" : "audio";
    obj["muted"] = track.isMuted();
    obj["volume"] = track.volume();

    if (track.overlayPosition()) {
        const auto& pos = *track.overlayPosition();
        QJsonObject posObj;
        posObj["x"] = pos.x;
        posObj["y"] = pos.y;
        posObj["scale"] = pos.scale;
        obj["overlayPosition"] = posObj;
    }

    QJsonArray clipsArray;
    for (const auto& clip : track.clips()) {
        QJsonObject c;
        c["id"] = clip.id;
        c["videoClipId"] = clip.videoClipId;
        c["startTime"] = clip.startTime;
        c["endTime"] = clip.endTime;
        c["trimStart"] = clip.trimStart;
        c["trimEnd"] = clip.trimEnd;
        c["originalDuration"] = clip.originalDuration;
        clipsArray.append(c);
    }
    obj["clips"] = clipsArray;
    return obj;
}

Track TimelineJson::trackFromJson(const QJsonObject& obj) {
    TrackKind kind = obj["type"].toString("video") == "audio" ? TrackKind::Audio : TrackKind::Video;
    Track track(obj["id"].toString(), kind, obj["name"].toString());
    track.setMuted(obj["muted"].toBool(false));
    track.setVolume(obj["volume"].toDouble(1.0));

    if (obj.contains("overlayPosition")) {
        auto posObj = obj["overlayPosition"].toObject();
        OverlayPosition pos;
        pos.x = posObj["x"].toDouble(pos.x);
        pos.y = posObj["y"].toDouble(pos.y);
        pos.scale = posObj["scale"].toDouble(pos.scale);
        track.setOverlayPosition(pos);
    }

    for (const auto& val : obj["clips"].toArray()) {
        auto c = val.toObject();
        TimelineClip clip;
        clip.id = c["id"].toString();
        clip.videoClipId = c["videoClipId"].toString();
        clip.startTime = c["startTime"].toDouble(0.0);
        clip.endTime = c["endTime"].toDouble(0.0);
        clip.trimStart = c["trimStart"].toDouble(0.0);
        clip.trimEnd = c["trimEnd"].toDouble(0.0);
        clip.originalDuration = c["originalDuration"].toDouble(0.0);
        track.addClip(clip);
    }
    return track;
}

QJsonObject TimelineJson::settingsToJson(const ExportSettings& settings) {
    QJsonObject obj;
    if (settings.useSourceResolution()) {
        obj["resolution"] = "source";
    } else {
        obj["width"] = settings.width;
        obj["height"] = settings.height;
    }
    obj["quality"] = ExportSettingsUtil::qualityName(settings.quality);
    obj["format"] = ExportSettingsUtil::formatExtension(settings.format);
    obj["fps"] = settings.fps;
    obj["bitrate"] = settings.videoBitrate;
    obj["audioBitrate"] = settings.audioBitrate;
    obj["gapColor"] = settings.gapColor;
    return obj;
}

bool TimelineJson::settingsFromJson(const QJsonObject& obj, ExportSettings& settings) {
    ExportSettings s;

    if (obj.contains("resolution")) {
        QSize size;
        if (!ExportSettingsUtil::resolutionFromString(obj["resolution"].toString(), size)) {
            m_error = QString("Unknown resolution '%1'").arg(obj["resolution"].toString());
            return false;
        }
        if (size.isValid()) {
            s.width = size.width();
            s.height = size.height();
        }
    } else {
        s.width = obj["width"].toInt(0);
        s.height = obj["height"].toInt(0);
    }

    if (obj.contains("quality") && !ExportSettingsUtil::qualityFromString(obj["quality"].toString(), s.quality)) {
        m_error = QString("Unknown quality '%1'").arg(obj["quality"].toString());
        return false;
    }
    if (obj.contains("format") && !ExportSettingsUtil::formatFromString(obj["format"].toString(), s.format)) {
        m_error = QString("Unsupported format '%1'").arg(obj["format"].toString());
        return false;
    }

    s.fps = obj["fps"].toDouble(0.0);
    s.videoBitrate = obj["bitrate"].toInt(0);
    s.audioBitrate = obj["audioBitrate"].toInt(s.audioBitrate);
    s.gapColor = obj["gapColor"].toString(s.gapColor);

    if (s.fps < 0.0 || s.videoBitrate < 0 || s.audioBitrate <= 0) {
        m_error = "Export settings must not be negative";
        return false;
    }
    if (!isValidColor(s.gapColor)) {
        m_error = QString("Invalid gap colour '%1'").arg(s.gapColor);
        return false;
    }

    settings = s;
    return true;
}

bool TimelineJson::isValidColor(const QString& color) {
    static const QRegularExpression re("^([A-Za-z]+|#[0-9A-Fa-f]{6}|0x[0-9A-Fa-f]{6})$");
    return re.match(color).hasMatch();
}
