#include <cassert>
#include <cstdio>
#include <cmath>
#include "export/SegmentPlanner.h"
#include "timeline/Timeline.h"

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

static TimelineClip clipAt(const QString& id, double start, double end, double trimStart = 0.0) {
    TimelineClip c;
    c.id = id;
    c.videoClipId = "src-" + id;
    c.startTime = start;
    c.endTime = end;
    c.trimStart = trimStart;
    c.trimEnd = trimStart + (end - start);
    return c;
}

static Track trackWith(const QString& id, const std::vector<TimelineClip>& clips) {
    Track t(id, TrackKind::Video);
    for (const auto& c : clips) t.addClip(c);
    return t;
}

// Segments are sorted, back to back, start at 0 and end at the duration
static void assertPartition(const std::vector<Segment>& segs, double duration) {
    assert(!segs.empty());
    assert(near(segs.front().startTime, 0.0));
    for (size_t i = 0; i < segs.size(); ++i) {
        assert(segs[i].endTime > segs[i].startTime);
        if (i > 0) assert(near(segs[i].startTime, segs[i - 1].endTime));
    }
    assert(segs.back().endTime == duration);
}

void test_single_clip() {
    std::vector<Track> tracks{trackWith("base", {clipAt("a", 0.0, 10.0)})};
    auto segs = SegmentPlanner::plan(tracks, 10.0);

    assert(segs.size() == 1);
    assertPartition(segs, 10.0);
    assert(segs[0].clips.size() == 1);
    assert(segs[0].clips[0] && segs[0].clips[0]->id == "a");
    printf("PASS: test_single_clip\n");
}

void test_base_with_gap() {
    // Clip occupies [5, 15); [0, 5) is a gap
    std::vector<Track> tracks{trackWith("base", {clipAt("a", 5.0, 15.0)})};
    Timeline tl;
    tl.tracks = tracks;
    double duration = tl.compositionDuration();
    assert(near(duration, 15.0));

    auto segs = SegmentPlanner::plan(tracks, duration);
    assert(segs.size() == 2);
    assertPartition(segs, duration);
    assert(segs[0].isEmpty());
    assert(near(segs[0].duration(), 5.0));
    assert(segs[1].clips[0]->id == "a");
    printf("PASS: test_base_with_gap\n");
}

void test_overlay_splits_base() {
    // Base [0, 20), overlay [5, 12)
    std::vector<Track> tracks{
        trackWith("base", {clipAt("b", 0.0, 20.0)}),
        trackWith("cam", {clipAt("o", 5.0, 12.0)})
    };
    auto segs = SegmentPlanner::plan(tracks, 20.0);

    assert(segs.size() == 3);
    assertPartition(segs, 20.0);
    assert(segs[0].activeTrackCount() == 1);
    assert(segs[1].activeTrackCount() == 2);
    assert(near(segs[1].startTime, 5.0) && near(segs[1].endTime, 12.0));
    assert(segs[1].clips[1]->id == "o");
    assert(segs[2].activeTrackCount() == 1);
    assert(!segs[2].clips[1]);
    printf("PASS: test_overlay_splits_base\n");
}

void test_overlay_capped_to_base() {
    // Overlay runs past the base; the plan stops at the base end
    std::vector<Track> tracks{
        trackWith("base", {clipAt("b", 0.0, 10.0)}),
        trackWith("cam", {clipAt("o", 6.0, 30.0)})
    };
    Timeline tl;
    tl.tracks = tracks;
    double duration = tl.compositionDuration();
    assert(near(duration, 10.0));

    auto boundaries = SegmentPlanner::boundaries(tracks, duration);
    assert(boundaries.size() == 3);
    assert(near(boundaries[1], 6.0));

    auto segs = SegmentPlanner::plan(tracks, duration);
    assert(segs.size() == 2);
    assertPartition(segs, duration);
    assert(segs[1].clips[1]->id == "o");
    printf("PASS: test_overlay_capped_to_base\n");
}

void test_overlay_only_region() {
    // Overlay active over a base gap: the segment keeps the overlay alone
    std::vector<Track> tracks{
        trackWith("base", {clipAt("b1", 0.0, 4.0), clipAt("b2", 8.0, 12.0)}),
        trackWith("cam", {clipAt("o", 3.0, 9.0)})
    };
    auto segs = SegmentPlanner::plan(tracks, 12.0);

    assertPartition(segs, 12.0);
    assert(segs.size() == 5);
    const Segment& middle = segs[2];
    assert(near(middle.startTime, 4.0) && near(middle.endTime, 8.0));
    assert(!middle.clips[0]);
    assert(middle.soleActiveTrack() == 1);
    printf("PASS: test_overlay_only_region\n");
}

void test_boundaries_deduplicated() {
    // Shared boundaries (adjacent clips, overlay edges on base edges)
    std::vector<Track> tracks{
        trackWith("base", {clipAt("b1", 0.0, 5.0), clipAt("b2", 5.0, 10.0)}),
        trackWith("cam", {clipAt("o", 5.0, 10.0)})
    };
    auto points = SegmentPlanner::boundaries(tracks, 10.0);
    assert(points.size() == 3);
    assert(near(points[0], 0.0) && near(points[1], 5.0) && near(points[2], 10.0));
    printf("PASS: test_boundaries_deduplicated\n");
}

void test_deterministic() {
    std::vector<Track> tracks{
        trackWith("base", {clipAt("b1", 0.0, 7.5), clipAt("b2", 7.5, 14.0)}),
        trackWith("cam", {clipAt("o1", 2.0, 4.0), clipAt("o2", 10.0, 13.0)}),
        trackWith("pip", {clipAt("p", 3.0, 11.0)})
    };
    auto first = SegmentPlanner::plan(tracks, 14.0);
    auto second = SegmentPlanner::plan(tracks, 14.0);

    assert(first.size() == second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        assert(first[i].startTime == second[i].startTime);
        assert(first[i].endTime == second[i].endTime);
        for (size_t t = 0; t < tracks.size(); ++t) {
            assert(first[i].clips[t].has_value() == second[i].clips[t].has_value());
            if (first[i].clips[t]) assert(first[i].clips[t]->id == second[i].clips[t]->id);
        }
    }
    assertPartition(first, 14.0);
    printf("PASS: test_deterministic\n");
}

void test_zero_duration() {
    std::vector<Track> tracks{trackWith("base", {})};
    assert(SegmentPlanner::plan(tracks, 0.0).empty());
    printf("PASS: test_zero_duration\n");
}

void test_contiguous_and_clip_sequence() {
    Track contiguous = trackWith("base", {clipAt("b", 4.0, 9.0, 1.0), clipAt("a", 0.0, 4.0, 2.0)});
    assert(SegmentPlanner::isContiguousFromZero(contiguous));

    auto segs = SegmentPlanner::planClipSequence(contiguous);
    assert(segs.size() == 2);
    assert(segs[0].clips[0]->id == "a");
    assert(near(segs[0].duration(), 4.0));
    assert(near(segs[1].startTime, 4.0) && near(segs[1].duration(), 5.0));

    assert(!SegmentPlanner::isContiguousFromZero(trackWith("base", {clipAt("a", 1.0, 4.0)})));
    assert(!SegmentPlanner::isContiguousFromZero(trackWith("base", {clipAt("a", 0.0, 4.0), clipAt("b", 5.0, 6.0)})));
    assert(!SegmentPlanner::isContiguousFromZero(trackWith("base", {})));
    printf("PASS: test_contiguous_and_clip_sequence\n");
}

void test_clip_sequence_follows_timeline_span() {
    // Trim window shorter than the placement: the segment keeps the placement
    TimelineClip held = clipAt("a", 0.0, 10.0);
    held.trimEnd = 5.0;
    Track track = trackWith("base", {held, clipAt("b", 10.0, 15.0)});
    assert(SegmentPlanner::isContiguousFromZero(track));

    auto segs = SegmentPlanner::planClipSequence(track);
    assert(segs.size() == 2);
    assert(near(segs[0].endTime, 10.0));
    assert(near(segs[1].startTime, 10.0) && near(segs[1].endTime, 15.0));
    assertPartition(segs, 15.0);

    // Trim window longer than the placement is cut to the placement
    TimelineClip cut = clipAt("c", 0.0, 5.0);
    cut.trimEnd = 10.0;
    segs = SegmentPlanner::planClipSequence(trackWith("base", {cut}));
    assert(segs.size() == 1);
    assert(near(segs[0].duration(), 5.0));
    printf("PASS: test_clip_sequence_follows_timeline_span\n");
}

int main() {
    test_single_clip();
    test_base_with_gap();
    test_overlay_splits_base();
    test_overlay_capped_to_base();
    test_overlay_only_region();
    test_boundaries_deduplicated();
    test_deterministic();
    test_zero_duration();
    test_contiguous_and_clip_sequence();
    test_clip_sequence_follows_timeline_span();
    printf("All segment planner tests passed.\n");
    return 0;
}
