#pragma once

#include <QString>
#include <QSize>

enum class Quality {
    Low,
    Medium,
    High
};

enum class OutputFormat {
    Mp4,
    Mov,
    Mkv
};

struct EncoderQuality {
    int crf = 23;
    QString preset = "medium";
};

struct ExportSettings {
    int width = 0;          // 0 = same as source
    int height = 0;
    Quality quality = Quality::Medium;
    double fps = 0.0;       // 0 = same as source
    int videoBitrate = 0;   // kbps, 0 = constant quality only
    int audioBitrate = 128; // kbps
    OutputFormat format = OutputFormat::Mp4;
    QString gapColor = "black";

    bool useSourceResolution() const { return width <= 0 || height <= 0; }
};

namespace ExportSettingsUtil {

EncoderQuality encoderQuality(Quality quality);

QString formatExtension(OutputFormat format);
QString formatName(OutputFormat format);
bool formatFromString(const QString& text, OutputFormat& format);

QString qualityName(Quality quality);
bool qualityFromString(const QString& text, Quality& quality);

// Accepts "720p", "1080p", "source" or "WxH". "source" yields an invalid size.
bool resolutionFromString(const QString& text, QSize& size);

// Rounds down to an even value (yuv420p needs even dimensions), minimum 2
int evenDimension(int value);

} // namespace ExportSettingsUtil
