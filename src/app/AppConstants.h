#pragma once

namespace AppConstants {
    inline constexpr const char* AppName = "ReelForge";
    inline constexpr const char* AppVersion = "0.1.0";
    inline constexpr const char* OrgName = "ReelForge";

    // Every rendered segment carries stereo AAC at this rate so that
    // stream-copy concatenation never has to resample.
    inline constexpr int AudioSampleRate = 48000;
    inline constexpr const char* AudioChannelLayout = "stereo";

    inline constexpr int DefaultCanvasWidth = 1920;
    inline constexpr int DefaultCanvasHeight = 1080;
    inline constexpr double DefaultFps = 30.0;

    // Overlay placement used when an overlay track carries no position
    inline constexpr double DefaultOverlayX = 0.5;
    inline constexpr double DefaultOverlayY = 0.5;
    inline constexpr double DefaultOverlayScale = 0.25;

    // Keyframe spacing in seconds (GOP = 2 x fps)
    inline constexpr double KeyframeIntervalSec = 2.0;

    // Progress bands (percent)
    inline constexpr double ProgressPlanning = 5.0;
    inline constexpr double ProgressSegmentsBegin = 10.0;
    inline constexpr double ProgressSegmentsEnd = 90.0;

    // Time comparisons on the timeline
    inline constexpr double TimeEpsilon = 1e-6;
    inline constexpr double TrimTolerance = 1e-3;
}
