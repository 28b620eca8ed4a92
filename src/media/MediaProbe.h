#pragma once

#include <QObject>
#include <QString>
#include <QHash>

struct MediaInfo {
    QString filePath;
    QString containerFormat;
    double duration = 0.0;
    int videoWidth = 0;
    int videoHeight = 0;
    double videoFps = 0.0;
    QString videoCodec;
    QString videoPixelFormat;
    int audioSampleRate = 0;
    int audioChannels = 0;
    QString audioCodec;
    bool hasVideo = false;
    bool hasAudio = false;
};

// Queries a media file for duration, geometry, frame rate, codec and
// audio-stream presence. probe() is virtual so callers can substitute a
// scripted prober.
class MediaProbe : public QObject {
    Q_OBJECT
public:
    explicit MediaProbe(QObject* parent = nullptr);
    ~MediaProbe() override;

    virtual bool probe(const QString& filePath);
    const MediaInfo& info() const { return m_info; }
    QString errorString() const { return m_error; }

protected:
    MediaInfo m_info;
    QString m_error;
};

// Per-export memo of probe results; each file is opened at most once.
class ProbeCache {
public:
    explicit ProbeCache(MediaProbe* probe) : m_probe(probe) {}

    // False when the file cannot be probed; lastError() says why
    bool lookup(const QString& filePath, MediaInfo& info);
    QString lastError() const { return m_lastError; }

private:
    MediaProbe* m_probe;
    QHash<QString, MediaInfo> m_results;
    QHash<QString, QString> m_failures;
    QString m_lastError;
};
