#include "Timeline.h"

std::vector<Track> Timeline::videoTracks() const {
    std::vector<Track> result;
    for (const auto& t : tracks) {
        if (t.isVideo()) result.push_back(t);
    }
    return result;
}

bool Timeline::hasClips() const {
    for (const auto& t : tracks) {
        if (t.isVideo() && t.clipCount() > 0) return true;
    }
    return false;
}

double Timeline::compositionDuration() const {
    for (const auto& t : tracks) {
        if (!t.isVideo()) continue;
        double baseEnd = t.endTime();
        return baseEnd > 0.0 ? baseEnd : duration;
    }
    return 0.0;
}
