#pragma once

#include <QByteArray>
#include <QString>
#include <QRegularExpression>
#include <algorithm>

namespace TimeUtil {

inline QString secondsToHMS(double totalSeconds) {
    int hours = static_cast<int>(totalSeconds) / 3600;
    int minutes = (static_cast<int>(totalSeconds) % 3600) / 60;
    int seconds = static_cast<int>(totalSeconds) % 60;
    int millis = static_cast<int>((totalSeconds - static_cast<int>(totalSeconds)) * 1000);

    if (hours > 0) {
        return QString("%1:%2:%3.%4")
            .arg(hours)
            .arg(minutes, 2, 10, QChar('0'))
            .arg(seconds, 2, 10, QChar('0'))
            .arg(millis, 3, 10, QChar('0'));
    }
    return QString("%1:%2.%3")
        .arg(minutes)
        .arg(seconds, 2, 10, QChar('0'))
        .arg(millis, 3, 10, QChar('0'));
}

// Seconds as a fixed-point string for encoder arguments ("12.500000")
inline QString formatSeconds(double seconds) {
    return QString::number(seconds < 0.0 ? 0.0 : seconds, 'f', 6);
}

// Plain decimal without exponent, trailing zeros trimmed ("0.5", "30")
inline QString formatNumber(double value) {
    QString s = QString::number(value, 'f', 6);
    while (s.contains('.') && (s.endsWith('0') || s.endsWith('.')))
        s.chop(1);
    return s;
}

// Parse the last "time=HH:MM:SS.ss" field of an encoder status line.
// Returns -1 when none is present.
inline double parseEncoderTime(const QString& text) {
    static QRegularExpression re(R"(time=(\d+):(\d+):(\d+(?:\.\d+)?))");
    double result = -1.0;
    auto it = re.globalMatch(text);
    while (it.hasNext()) {
        auto match = it.next();
        result = match.captured(1).toInt() * 3600.0 +
                 match.captured(2).toInt() * 60.0 +
                 match.captured(3).toDouble();
    }
    return result;
}

// Latest time= over the complete status lines of a buffered stderr stream.
// Text after the last '\r' or '\n' may be a field cut mid-read and is ignored.
inline double parseLatestEncoderTime(const QByteArray& buffer) {
    const int end = std::max(buffer.lastIndexOf('\r'), buffer.lastIndexOf('\n'));
    if (end < 0) return -1.0;
    return parseEncoderTime(QString::fromUtf8(buffer.left(end)));
}

} // namespace TimeUtil
