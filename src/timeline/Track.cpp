#include "Track.h"
#include <algorithm>

Track::Track(const QString& id, TrackKind kind, const QString& name)
    : m_id(id), m_kind(kind), m_name(name.isEmpty() ? id : name) {}

void Track::addClip(const TimelineClip& clip) {
    m_clips.push_back(clip);
    if (m_clips.back().trackId.isEmpty())
        m_clips.back().trackId = m_id;
}

std::vector<TimelineClip> Track::sortedClips() const {
    std::vector<TimelineClip> sorted = m_clips;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const TimelineClip& a, const TimelineClip& b) {
                         return a.startTime < b.startTime;
                     });
    return sorted;
}

double Track::endTime() const {
    double maxEnd = 0.0;
    for (const auto& c : m_clips) {
        if (c.endTime > maxEnd) maxEnd = c.endTime;
    }
    return maxEnd;
}

void Track::setVolume(double volume) {
    m_volume = std::clamp(volume, 0.0, 1.0);
}
