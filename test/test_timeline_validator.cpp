#include <cassert>
#include <cstdio>
#include <QFile>
#include <QTemporaryDir>
#include "export/TimelineValidator.h"

static QTemporaryDir* g_dir = nullptr;

static QString makeSource(const QString& name) {
    QString path = g_dir->filePath(name);
    QFile f(path);
    bool ok = f.open(QIODevice::WriteOnly);
    assert(ok);
    f.write("not really video");
    return path;
}

static VideoClip source(const QString& id, double duration) {
    VideoClip c;
    c.id = id;
    c.filePath = makeSource(id + ".mp4");
    c.duration = duration;
    c.width = 1280;
    c.height = 720;
    c.fps = 30.0;
    return c;
}

static TimelineClip placed(const QString& id, const QString& videoId, double start, double trimStart, double trimEnd) {
    TimelineClip c;
    c.id = id;
    c.videoClipId = videoId;
    c.startTime = start;
    c.endTime = start + (trimEnd - trimStart);
    c.trimStart = trimStart;
    c.trimEnd = trimEnd;
    c.originalDuration = trimEnd;
    return c;
}

static Timeline singleTrack(const std::vector<TimelineClip>& clips) {
    Timeline tl;
    Track track("base", TrackKind::Video, "Video 1");
    for (const auto& c : clips) track.addClip(c);
    tl.tracks.push_back(track);
    return tl;
}

void test_valid_timeline() {
    std::vector<VideoClip> clips{source("a", 10.0), source("b", 5.0)};
    Timeline tl = singleTrack({placed("c1", "a", 0.0, 1.0, 9.0), placed("c2", "b", 8.0, 0.0, 5.0)});

    TimelineValidator v;
    assert(v.validate(tl, clips));
    assert(!v.error().isError());
    printf("PASS: test_valid_timeline\n");
}

void test_no_video_tracks() {
    Timeline tl;
    tl.tracks.push_back(Track("music", TrackKind::Audio));

    TimelineValidator v;
    assert(!v.validate(tl, {}));
    assert(v.error().kind == ExportErrorKind::Validation);
    assert(v.errorString().contains("No video tracks"));
    printf("PASS: test_no_video_tracks\n");
}

void test_no_clips() {
    Timeline tl = singleTrack({});
    TimelineValidator v;
    assert(!v.validate(tl, {}));
    assert(v.errorString().contains("No video clips"));
    printf("PASS: test_no_clips\n");
}

void test_unknown_source() {
    std::vector<VideoClip> clips{source("a", 10.0)};
    Timeline tl = singleTrack({placed("c1", "missing", 0.0, 0.0, 5.0)});

    TimelineValidator v;
    assert(!v.validate(tl, clips));
    assert(v.errorString().contains("missing"));
    assert(v.errorString().contains("c1"));
    assert(v.errorString().contains("base"));
    printf("PASS: test_unknown_source\n");
}

void test_unreadable_source() {
    VideoClip gone;
    gone.id = "gone";
    gone.filePath = g_dir->filePath("does-not-exist.mp4");
    gone.duration = 10.0;
    Timeline tl = singleTrack({placed("c1", "gone", 0.0, 0.0, 5.0)});

    TimelineValidator v;
    assert(!v.validate(tl, {gone}));
    assert(v.errorString().contains("not found"));
    printf("PASS: test_unreadable_source\n");
}

void test_trim_bounds() {
    std::vector<VideoClip> clips{source("a", 10.0)};
    TimelineValidator v;

    TimelineClip negative = placed("neg", "a", 0.0, 0.0, 5.0);
    negative.trimStart = -0.5;
    assert(!v.validate(singleTrack({negative}), clips));
    assert(v.errorString().contains("trimStart"));

    TimelineClip inverted = placed("inv", "a", 0.0, 0.0, 5.0);
    inverted.trimStart = 5.0;
    inverted.trimEnd = 5.0;
    assert(!v.validate(singleTrack({inverted}), clips));
    assert(v.errorString().contains("trimEnd"));

    TimelineClip tooLong = placed("long", "a", 0.0, 0.0, 12.0);
    assert(!v.validate(singleTrack({tooLong}), clips));
    assert(v.errorString().contains("exceeds"));

    // Within the float tolerance of the source duration
    TimelineClip edge = placed("edge", "a", 0.0, 0.0, 10.0005);
    assert(v.validate(singleTrack({edge}), clips));
    printf("PASS: test_trim_bounds\n");
}

void test_check_order() {
    // Unknown source is reported before the bad trim on the same clip
    std::vector<VideoClip> clips{source("a", 10.0)};
    TimelineClip clip = placed("c1", "nope", 0.0, 0.0, 5.0);
    clip.trimStart = -1.0;

    TimelineValidator v;
    assert(!v.validate(singleTrack({clip}), clips));
    assert(v.errorString().contains("not found"));
    printf("PASS: test_check_order\n");
}

void test_overlapping_clips() {
    std::vector<VideoClip> clips{source("a", 10.0)};
    Timeline tl = singleTrack({placed("c1", "a", 0.0, 0.0, 5.0), placed("c2", "a", 4.0, 0.0, 5.0)});

    TimelineValidator v;
    assert(!v.validate(tl, clips));
    assert(v.errorString().contains("overlap"));
    printf("PASS: test_overlapping_clips\n");
}

void test_empty_timeline_span() {
    std::vector<VideoClip> clips{source("a", 10.0)};
    TimelineClip flat = placed("c1", "a", 3.0, 0.0, 5.0);
    flat.endTime = 3.0;
    Timeline tl = singleTrack({flat});

    TimelineValidator v;
    assert(!v.validate(tl, clips));
    assert(v.errorString().contains("empty timeline span"));
    assert(v.errorString().contains("c1"));
    printf("PASS: test_empty_timeline_span\n");
}

void test_overlay_track_checked() {
    std::vector<VideoClip> clips{source("a", 10.0)};
    Timeline tl = singleTrack({placed("c1", "a", 0.0, 0.0, 5.0)});
    Track overlay("cam", TrackKind::Video, "Webcam");
    overlay.addClip(placed("o1", "a", 1.0, 0.0, 20.0));
    tl.tracks.push_back(overlay);

    TimelineValidator v;
    assert(!v.validate(tl, clips));
    assert(v.errorString().contains("o1"));
    assert(v.errorString().contains("cam"));
    printf("PASS: test_overlay_track_checked\n");
}

int main() {
    QTemporaryDir dir;
    assert(dir.isValid());
    g_dir = &dir;

    test_valid_timeline();
    test_no_video_tracks();
    test_no_clips();
    test_unknown_source();
    test_unreadable_source();
    test_trim_bounds();
    test_check_order();
    test_overlapping_clips();
    test_empty_timeline_span();
    test_overlay_track_checked();
    printf("All validator tests passed.\n");
    return 0;
}
