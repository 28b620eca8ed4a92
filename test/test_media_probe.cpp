#include <cassert>
#include <cstdio>
#include <QTemporaryDir>
#include <QFile>
#include "media/MediaProbe.h"

// Probe with canned answers; counts how often the file system would be hit
class CountingProbe : public MediaProbe {
public:
    int calls = 0;

    bool probe(const QString& filePath) override {
        ++calls;
        m_info = MediaInfo{};
        m_info.filePath = filePath;
        if (filePath.endsWith("broken.mp4")) {
            m_error = "Cannot open file";
            return false;
        }
        m_info.hasVideo = true;
        m_info.hasAudio = filePath.contains("cam");
        m_info.videoWidth = 1280;
        m_info.videoHeight = 720;
        m_info.duration = 10.0;
        return true;
    }
};

void test_media_probe() {
    printf("=== test_media_probe ===\n");

    QByteArray media = qgetenv("REELFORGE_TEST_MEDIA");
    if (media.isEmpty()) {
        printf("SKIP: test_media_probe (set REELFORGE_TEST_MEDIA to a video file)\n\n");
        return;
    }

#ifdef HAS_FFMPEG
    MediaProbe probe;
    bool ok = probe.probe(QString::fromLocal8Bit(media));

    if (!ok) {
        printf("FAIL: probe failed - %s\n", probe.errorString().toUtf8().constData());
        assert(false);
    }

    const MediaInfo& info = probe.info();

    printf("  Container: %s\n", info.containerFormat.toUtf8().constData());
    printf("  Duration: %.3f s\n", info.duration);
    printf("  Has Audio: %s\n", info.hasAudio ? "yes" : "no");
    printf("  Video: %dx%d @ %.2f fps\n", info.videoWidth, info.videoHeight, info.videoFps);
    printf("  Video Codec: %s\n", info.videoCodec.toUtf8().constData());

    if (info.hasAudio) {
        printf("  Audio: %d Hz, %d ch\n", info.audioSampleRate, info.audioChannels);
        printf("  Audio Codec: %s\n", info.audioCodec.toUtf8().constData());
    }

    assert(info.hasVideo);
    assert(info.videoWidth > 0);
    assert(info.videoHeight > 0);
    assert(info.videoFps > 0);
    assert(info.duration > 0);

    printf("PASS: test_media_probe\n\n");
#else
    printf("SKIP: test_media_probe (no FFmpeg)\n\n");
#endif
}

void test_probe_rejects_non_media() {
    printf("=== test_probe_rejects_non_media ===\n");

    QTemporaryDir dir;
    QString path = dir.filePath("notes.txt");
    QFile f(path);
    bool opened = f.open(QIODevice::WriteOnly);
    assert(opened);
    f.write("plain text, no streams here");
    f.close();

    MediaProbe probe;
    assert(!probe.probe(path));
    assert(!probe.errorString().isEmpty());
    assert(!probe.probe(dir.filePath("absent.mp4")));
    printf("PASS: test_probe_rejects_non_media\n\n");
}

void test_probe_cache() {
    printf("=== test_probe_cache ===\n");

    CountingProbe probe;
    ProbeCache cache(&probe);
    MediaInfo info;

    assert(cache.lookup("/media/cam.mp4", info));
    assert(info.hasAudio);
    assert(cache.lookup("/media/cam.mp4", info));
    assert(cache.lookup("/media/screen.mp4", info));
    assert(!info.hasAudio);
    assert(probe.calls == 2);

    // Failures are remembered too
    assert(!cache.lookup("/media/broken.mp4", info));
    assert(!cache.lookup("/media/broken.mp4", info));
    assert(cache.lastError() == "Cannot open file");
    assert(probe.calls == 3);

    ProbeCache empty(nullptr);
    assert(!empty.lookup("/media/cam.mp4", info));
    printf("PASS: test_probe_cache\n\n");
}

int main() {
    test_media_probe();
    test_probe_rejects_non_media();
    test_probe_cache();
    printf("All media probe tests passed.\n");
    return 0;
}
