#include "TranscodeRequest.h"
#include "AppConstants.h"
#include "TimeUtil.h"
#include <cmath>

TranscodeInput TranscodeInput::file(const QString& path, double seek, double duration) {
    TranscodeInput in;
    in.source = path;
    if (seek > 0.0) in.options << "-ss" << TimeUtil::formatSeconds(seek);
    if (duration > 0.0) in.options << "-t" << TimeUtil::formatSeconds(duration);
    return in;
}

TranscodeInput TranscodeInput::lavfi(const QString& description) {
    TranscodeInput in;
    in.source = description;
    in.options << "-f" << "lavfi";
    return in;
}

QStringList TranscodeRequest::arguments() const {
    QStringList args{"-hide_banner", "-nostdin", "-y"};
    for (const auto& in : inputs) {
        args << in.options << "-i" << in.source;
    }
    if (!filterGraph.isEmpty()) {
        args << "-filter_complex" << filterGraph.toString();
    }
    for (const auto& m : maps) {
        args << "-map" << m;
    }
    args << outputOptions << outputPath;
    return args;
}

namespace EncodeOptions {

QStringList standard(const OutputProfile& profile, double duration) {
    const auto quality = ExportSettingsUtil::encoderQuality(profile.settings.quality);
    const int fpsInt = std::max(1, static_cast<int>(std::lround(profile.fps)));
    const int gop = static_cast<int>(std::lround(profile.fps * AppConstants::KeyframeIntervalSec));

    QStringList opts;
    opts << "-c:v" << "libx264"
         << "-preset" << quality.preset
         << "-crf" << QString::number(quality.crf);

    if (profile.settings.videoBitrate > 0) {
        opts << "-maxrate" << QString("%1k").arg(profile.settings.videoBitrate)
             << "-bufsize" << QString("%1k").arg(profile.settings.videoBitrate * 2);
    }

    opts << "-pix_fmt" << "yuv420p"
         << "-r" << TimeUtil::formatNumber(profile.fps)
         << "-fps_mode" << "cfr"
         << "-g" << QString::number(std::max(1, gop))
         << "-keyint_min" << QString::number(fpsInt)
         << "-sc_threshold" << "0"
         << "-force_key_frames"
         << QString("expr:gte(t,n_forced*%1)").arg(TimeUtil::formatNumber(AppConstants::KeyframeIntervalSec))
         << "-c:a" << "aac"
         << "-b:a" << QString("%1k").arg(profile.settings.audioBitrate)
         << "-ar" << QString::number(AppConstants::AudioSampleRate)
         << "-ac" << "2"
         << "-avoid_negative_ts" << "make_zero"
         << "-map_metadata" << "-1"
         << "-t" << TimeUtil::formatSeconds(duration);
    return opts;
}

QStringList containerFlags(OutputFormat format) {
    if (format == OutputFormat::Mkv)
        return {};
    return {"-movflags", "+faststart"};
}

} // namespace EncodeOptions
