#pragma once

#include <vector>
#include "Track.h"

// Editor timeline as handed to the export engine. Passed by value for the
// duration of one export.
struct Timeline {
    double duration = 0.0;
    std::vector<Track> tracks;

    // Video tracks in timeline order; index 0 is the base track
    std::vector<Track> videoTracks() const;
    bool hasClips() const;

    // Max endTime across base-track clips only. Falls back to `duration`
    // when the base track is empty.
    double compositionDuration() const;
};
