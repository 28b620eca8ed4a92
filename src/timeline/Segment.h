#pragma once

#include <optional>
#include <vector>
#include "Clip.h"

// A maximal interval during which the active clip of every track is constant.
// clips[i] is the clip active on video track i, if any.
struct Segment {
    double startTime = 0.0;
    double endTime = 0.0;
    std::vector<std::optional<TimelineClip>> clips;

    double duration() const { return endTime - startTime; }

    int activeTrackCount() const {
        int n = 0;
        for (const auto& c : clips) {
            if (c) ++n;
        }
        return n;
    }

    // Index of the only active track, -1 unless exactly one is active
    int soleActiveTrack() const {
        int found = -1;
        for (int i = 0; i < static_cast<int>(clips.size()); ++i) {
            if (!clips[i]) continue;
            if (found >= 0) return -1;
            found = i;
        }
        return found;
    }
};
