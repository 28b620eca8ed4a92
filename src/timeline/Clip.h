#pragma once

#include <QString>
#include <algorithm>

// Imported source media. Owned by the media library; read-only here.
struct VideoClip {
    QString id;
    QString filePath;
    QString name;
    double duration = 0.0;   // seconds
    int width = 0;
    int height = 0;
    double fps = 0.0;
};

// Placement of a VideoClip on a track.
// Timeline span is [startTime, endTime); source window is [trimStart, trimEnd).
struct TimelineClip {
    QString id;
    QString videoClipId;
    QString trackId;
    double startTime = 0.0;
    double endTime = 0.0;
    double trimStart = 0.0;
    double trimEnd = 0.0;
    double originalDuration = 0.0;   // source length before any trimming

    double trimmedDuration() const { return trimEnd - trimStart; }
    double timelineDuration() const { return endTime - startTime; }

    // End time with overlay clips capped to the composition duration
    double effectiveEnd(double cap) const { return std::min(endTime, cap); }

    bool isActiveIn(double segStart, double segEnd, double cap) const {
        return startTime < segEnd && effectiveEnd(cap) > segStart;
    }
};
