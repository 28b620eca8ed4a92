#pragma once

#include <QString>
#include <optional>
#include <vector>
#include "Clip.h"
#include "OverlayPosition.h"

enum class TrackKind {
    Video,
    Audio
};

class Track {
public:
    Track() = default;
    Track(const QString& id, TrackKind kind, const QString& name = QString());

    const QString& id() const { return m_id; }
    TrackKind kind() const { return m_kind; }
    bool isVideo() const { return m_kind == TrackKind::Video; }
    QString name() const { return m_name; }

    void addClip(const TimelineClip& clip);
    int clipCount() const { return static_cast<int>(m_clips.size()); }
    const TimelineClip& clip(int index) const { return m_clips[index]; }
    const std::vector<TimelineClip>& clips() const { return m_clips; }

    // Clips ordered by startTime (stable for equal starts)
    std::vector<TimelineClip> sortedClips() const;

    double endTime() const;   // max endTime over clips, 0 when empty

    bool isMuted() const { return m_muted; }
    void setMuted(bool muted) { m_muted = muted; }
    double volume() const { return m_volume; }
    void setVolume(double volume);
    double effectiveVolume() const { return m_muted ? 0.0 : m_volume; }

    const std::optional<OverlayPosition>& overlayPosition() const { return m_overlay; }
    void setOverlayPosition(const OverlayPosition& pos) { m_overlay = pos; }
    OverlayPosition overlayPositionOrDefault() const { return m_overlay.value_or(OverlayPosition{}); }

private:
    QString m_id;
    TrackKind m_kind = TrackKind::Video;
    QString m_name;
    std::vector<TimelineClip> m_clips;
    bool m_muted = false;
    double m_volume = 1.0;
    std::optional<OverlayPosition> m_overlay;
};
