#include "SegmentPlanner.h"
#include "AppConstants.h"
#include <algorithm>
#include <cmath>

std::vector<double> SegmentPlanner::boundaries(const std::vector<Track>& tracks, double compositionDuration) {
    std::vector<double> points{0.0, compositionDuration};

    for (const auto& track : tracks) {
        for (const auto& clip : track.clips()) {
            const double start = clip.startTime;
            const double end = clip.effectiveEnd(compositionDuration);
            if (start > 0.0 && start < compositionDuration) points.push_back(start);
            if (end > 0.0 && end < compositionDuration) points.push_back(end);
        }
    }

    std::sort(points.begin(), points.end());
    auto last = std::unique(points.begin(), points.end(), [](double a, double b) {
        return std::fabs(a - b) < AppConstants::TimeEpsilon;
    });
    points.erase(last, points.end());
    return points;
}

std::vector<Segment> SegmentPlanner::plan(const std::vector<Track>& tracks, double compositionDuration) {
    std::vector<Segment> segments;
    if (compositionDuration <= 0.0) return segments;

    const auto points = boundaries(tracks, compositionDuration);
    for (size_t i = 0; i + 1 < points.size(); ++i) {
        Segment seg;
        seg.startTime = points[i];
        seg.endTime = points[i + 1];
        if (seg.duration() < AppConstants::TimeEpsilon) continue;

        seg.clips.resize(tracks.size());
        for (size_t t = 0; t < tracks.size(); ++t) {
            for (const auto& clip : tracks[t].clips()) {
                if (clip.isActiveIn(seg.startTime, seg.endTime, compositionDuration)) {
                    seg.clips[t] = clip;
                    break;
                }
            }
        }
        segments.push_back(std::move(seg));
    }

    // Boundaries come from a sorted set, so the last end is the duration
    if (!segments.empty())
        segments.back().endTime = compositionDuration;
    return segments;
}

bool SegmentPlanner::isContiguousFromZero(const Track& track) {
    const auto sorted = track.sortedClips();
    if (sorted.empty()) return false;

    double cursor = 0.0;
    for (const auto& clip : sorted) {
        if (std::fabs(clip.startTime - cursor) > AppConstants::TimeEpsilon)
            return false;
        cursor = clip.endTime;
    }
    return true;
}

std::vector<Segment> SegmentPlanner::planClipSequence(const Track& track) {
    std::vector<Segment> segments;
    for (const auto& clip : track.sortedClips()) {
        Segment seg;
        // The timeline span decides the length; the renderer pads or cuts the trim window
        seg.startTime = clip.startTime;
        seg.endTime = clip.endTime;
        seg.clips.push_back(clip);
        segments.push_back(std::move(seg));
    }
    return segments;
}
