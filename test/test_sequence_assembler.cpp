#include <cassert>
#include <cstdio>
#include <QFile>
#include <QTemporaryDir>
#include "export/SequenceAssembler.h"

static QString writeFile(const QTemporaryDir& dir, const QString& name, const QByteArray& data = "segment") {
    QString path = dir.filePath(name);
    QFile f(path);
    bool ok = f.open(QIODevice::WriteOnly);
    assert(ok);
    f.write(data);
    return path;
}

void test_manifest_escaping() {
    QString text = SequenceAssembler::manifestText({"/tmp/a.mp4", "/tmp/it's.mp4"});
    assert(text == "file '/tmp/a.mp4'\nfile '/tmp/it'\\''s.mp4'\n");
    printf("PASS: test_manifest_escaping\n");
}

void test_prepare_request() {
    QTemporaryDir dir;
    assert(dir.isValid());
    QStringList segments{writeFile(dir, "segment_0000.mp4"), writeFile(dir, "segment_0001.mp4")};

    SequenceAssembler assembler(dir.path());
    TranscodeRequest req;
    assert(assembler.prepare(segments, dir.filePath("output.mp4"), OutputFormat::Mp4, req));

    // Manifest lists the segments in order
    QFile manifest(assembler.manifestPath());
    bool opened = manifest.open(QIODevice::ReadOnly);
    assert(opened);
    QString text = QString::fromUtf8(manifest.readAll());
    assert(text.indexOf("segment_0000.mp4") < text.indexOf("segment_0001.mp4"));

    QStringList args = req.arguments();
    int f = args.indexOf("-f");
    assert(f >= 0 && args[f + 1] == "concat");
    assert(args.contains("-safe"));
    assert(args[args.indexOf("-i") + 1] == assembler.manifestPath());
    int c = args.indexOf("-c");
    assert(c >= 0 && args[c + 1] == "copy");
    assert(args.contains("+faststart"));
    assert(!args.contains("libx264"));
    assert(args.last() == dir.filePath("output.mp4"));
    printf("PASS: test_prepare_request\n");
}

void test_missing_segment() {
    QTemporaryDir dir;
    QStringList segments{writeFile(dir, "segment_0000.mp4"), dir.filePath("segment_0001.mp4")};

    SequenceAssembler assembler(dir.path());
    TranscodeRequest req;
    assert(!assembler.prepare(segments, dir.filePath("output.mp4"), OutputFormat::Mp4, req));
    assert(assembler.error().kind == ExportErrorKind::Assembly);
    assert(assembler.errorString().contains("Segment 1"));
    assert(!QFile::exists(dir.filePath("concat.txt")));
    printf("PASS: test_missing_segment\n");
}

void test_empty_segment_rejected() {
    QTemporaryDir dir;
    QStringList segments{writeFile(dir, "segment_0000.mp4", QByteArray())};

    SequenceAssembler assembler(dir.path());
    TranscodeRequest req;
    assert(!assembler.prepare(segments, dir.filePath("output.mkv"), OutputFormat::Mkv, req));
    assert(!assembler.prepare({}, dir.filePath("output.mkv"), OutputFormat::Mkv, req));
    assert(assembler.error().kind == ExportErrorKind::Assembly);
    printf("PASS: test_empty_segment_rejected\n");
}

int main() {
    test_manifest_escaping();
    test_prepare_request();
    test_missing_segment();
    test_empty_segment_rejected();
    printf("All sequence assembler tests passed.\n");
    return 0;
}
