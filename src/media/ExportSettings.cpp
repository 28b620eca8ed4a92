#include "ExportSettings.h"
#include <QRegularExpression>

namespace ExportSettingsUtil {

EncoderQuality encoderQuality(Quality quality) {
    switch (quality) {
    case Quality::Low:    return {28, "veryfast"};
    case Quality::Medium: return {23, "medium"};
    case Quality::High:   return {18, "slow"};
    }
    return {};
}

QString formatExtension(OutputFormat format) {
    switch (format) {
    case OutputFormat::Mp4: return "mp4";
    case OutputFormat::Mov: return "mov";
    case OutputFormat::Mkv: return "mkv";
    }
    return "mp4";
}

QString formatName(OutputFormat format) {
    switch (format) {
    case OutputFormat::Mp4: return "mp4";
    case OutputFormat::Mov: return "mov";
    case OutputFormat::Mkv: return "matroska";
    }
    return "mp4";
}

bool formatFromString(const QString& text, OutputFormat& format) {
    const QString t = text.trimmed().toLower();
    if (t == "mp4") format = OutputFormat::Mp4;
    else if (t == "mov") format = OutputFormat::Mov;
    else if (t == "mkv" || t == "matroska") format = OutputFormat::Mkv;
    else return false;
    return true;
}

QString qualityName(Quality quality) {
    switch (quality) {
    case Quality::Low:    return "low";
    case Quality::Medium: return "medium";
    case Quality::High:   return "high";
    }
    return "medium";
}

bool qualityFromString(const QString& text, Quality& quality) {
    const QString t = text.trimmed().toLower();
    if (t == "low") quality = Quality::Low;
    else if (t == "medium") quality = Quality::Medium;
    else if (t == "high") quality = Quality::High;
    else return false;
    return true;
}

bool resolutionFromString(const QString& text, QSize& size) {
    const QString t = text.trimmed().toLower();
    if (t == "source") {
        size = QSize();
        return true;
    }
    if (t == "720p") {
        size = QSize(1280, 720);
        return true;
    }
    if (t == "1080p") {
        size = QSize(1920, 1080);
        return true;
    }

    static QRegularExpression re(R"(^(\d+)x(\d+)$)");
    auto match = re.match(t);
    if (!match.hasMatch()) return false;
    size = QSize(match.captured(1).toInt(), match.captured(2).toInt());
    return size.width() > 0 && size.height() > 0;
}

int evenDimension(int value) {
    return value < 2 ? 2 : value - (value % 2);
}

} // namespace ExportSettingsUtil
