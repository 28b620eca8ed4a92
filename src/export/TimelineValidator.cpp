#include "TimelineValidator.h"
#include "AppConstants.h"
#include "Logging.h"
#include <QFileInfo>

bool TimelineValidator::validate(const Timeline& timeline, const std::vector<VideoClip>& clips) {
    m_error = ExportError{};

    const auto videoTracks = timeline.videoTracks();
    if (videoTracks.empty())
        return fail("No video tracks found on timeline");

    if (!timeline.hasClips())
        return fail("No video clips found on timeline");

    for (const auto& track : videoTracks) {
        for (const auto& clip : track.clips()) {
            if (!validateClip(track, clip, clips))
                return false;
        }
    }

    for (const auto& track : videoTracks) {
        if (!validateTrackLayout(track))
            return false;
    }
    return true;
}

const VideoClip* TimelineValidator::findClip(const std::vector<VideoClip>& clips, const QString& id) {
    for (const auto& c : clips) {
        if (c.id == id) return &c;
    }
    return nullptr;
}

bool TimelineValidator::fail(const QString& message) {
    m_error = ExportError::validation(message);
    qCWarning(lcExport).noquote() << "Validation failed:" << message;
    return false;
}

bool TimelineValidator::validateClip(const Track& track, const TimelineClip& clip,
                                     const std::vector<VideoClip>& clips) {
    const VideoClip* source = findClip(clips, clip.videoClipId);
    if (!source) {
        return fail(QString("Source clip %1 not found (clip %2 on track %3)")
                        .arg(clip.videoClipId, clip.id, track.id()));
    }

    QFileInfo fi(source->filePath);
    if (!fi.exists() || !fi.isFile()) {
        return fail(QString("Source file not found: %1 (clip %2 on track %3)")
                        .arg(source->filePath, clip.id, track.id()));
    }
    if (!fi.isReadable()) {
        return fail(QString("Source file not readable: %1 (clip %2 on track %3)")
                        .arg(source->filePath, clip.id, track.id()));
    }

    if (clip.trimStart < 0.0) {
        return fail(QString("Invalid trimStart (%1) for clip %2 on track %3")
                        .arg(clip.trimStart).arg(clip.id, track.id()));
    }
    if (clip.trimEnd <= clip.trimStart) {
        return fail(QString("Invalid trimEnd (%1 <= trimStart %2) for clip %3 on track %4")
                        .arg(clip.trimEnd).arg(clip.trimStart).arg(clip.id, track.id()));
    }
    if (clip.trimEnd > source->duration + AppConstants::TrimTolerance) {
        return fail(QString("trimEnd (%1) exceeds clip duration (%2) for clip %3 on track %4")
                        .arg(clip.trimEnd).arg(source->duration).arg(clip.id, track.id()));
    }
    if (clip.timelineDuration() <= 0.0) {
        return fail(QString("Clip %1 on track %2 has an empty timeline span [%3, %4)")
                        .arg(clip.id, track.id()).arg(clip.startTime).arg(clip.endTime));
    }
    return true;
}

bool TimelineValidator::validateTrackLayout(const Track& track) {
    const auto sorted = track.sortedClips();
    for (size_t i = 1; i < sorted.size(); ++i) {
        const auto& prev = sorted[i - 1];
        const auto& cur = sorted[i];
        if (cur.startTime < prev.endTime - AppConstants::TimeEpsilon) {
            return fail(QString("Clips %1 and %2 overlap on track %3")
                            .arg(prev.id, cur.id, track.id()));
        }
    }
    return true;
}
