#pragma once

#include <vector>
#include "Clip.h"
#include "ExportError.h"
#include "Timeline.h"

// Checks that a timeline can be exported before any subprocess or temp file
// is created. Stops at the first violation.
class TimelineValidator {
public:
    bool validate(const Timeline& timeline, const std::vector<VideoClip>& clips);

    const ExportError& error() const { return m_error; }
    QString errorString() const { return m_error.message; }

    static const VideoClip* findClip(const std::vector<VideoClip>& clips, const QString& id);

private:
    bool fail(const QString& message);
    bool validateClip(const Track& track, const TimelineClip& clip, const std::vector<VideoClip>& clips);
    bool validateTrackLayout(const Track& track);

    ExportError m_error;
};
