#pragma once

#include <vector>
#include "Segment.h"
#include "Track.h"

// Splits a multi-track arrangement into contiguous, non-overlapping segments
// covering [0, compositionDuration). Each segment records the clip active on
// every track. Output is deterministic for identical input.
class SegmentPlanner {
public:
    static std::vector<Segment> plan(const std::vector<Track>& tracks, double compositionDuration);

    // Sorted, de-duplicated boundaries: {0, duration} plus every clip's start
    // and (capped) end that falls inside [0, duration]
    static std::vector<double> boundaries(const std::vector<Track>& tracks, double compositionDuration);

    // One segment per clip of a single gap-free track, in start order.
    // Each spans the clip's timeline placement.
    static std::vector<Segment> planClipSequence(const Track& track);

    // True when the track's clips run back to back from 0 without gaps
    static bool isContiguousFromZero(const Track& track);
};
