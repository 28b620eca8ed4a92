#pragma once

#include <QString>
#include <QStringList>
#include <vector>
#include "ExportSettings.h"
#include "FilterGraph.h"

struct TranscodeInput {
    QString source;        // file path or lavfi description
    QStringList options;   // placed before -i

    static TranscodeInput file(const QString& path, double seek = -1.0, double duration = -1.0);
    static TranscodeInput lavfi(const QString& description);
};

// Resolved target every intermediate is encoded to. Identical profiles are
// what make the final stream-copy concatenation possible.
struct OutputProfile {
    int width = 0;
    int height = 0;
    double fps = 0.0;
    ExportSettings settings;
};

// One external encoder invocation: inputs, filter graph, stream maps and
// output specification.
struct TranscodeRequest {
    QString label;                  // human readable, for logs
    std::vector<TranscodeInput> inputs;
    FilterGraph filterGraph;
    QStringList maps;
    QStringList outputOptions;
    QString outputPath;
    double expectedDuration = 0.0;  // seconds, drives progress

    QStringList arguments() const;
};

namespace EncodeOptions {

// libx264/AAC at the profile's frame rate, constant frame rate,
// periodic keyframes every 2 s, metadata stripped, exact duration.
QStringList standard(const OutputProfile& profile, double duration);

// Container flags for the final artifact
QStringList containerFlags(OutputFormat format);

} // namespace EncodeOptions
