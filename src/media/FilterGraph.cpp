#include "FilterGraph.h"
#include "AppConstants.h"
#include "TimeUtil.h"

FilterGraph& FilterGraph::add(const QStringList& inputs, const QString& filter, const QStringList& outputs) {
    m_nodes.push_back(Node{inputs, filter, outputs});
    return *this;
}

FilterGraph& FilterGraph::add(const QString& input, const QString& filter, const QString& output) {
    return add(QStringList{input}, filter, QStringList{output});
}

QString FilterGraph::toString() const {
    QStringList chains;
    for (const auto& node : m_nodes) {
        QString chain;
        for (const auto& pad : node.inputs) chain += '[' + pad + ']';
        chain += node.filter;
        for (const auto& pad : node.outputs) chain += '[' + pad + ']';
        chains << chain;
    }
    return chains.join(';');
}

QString FilterGraph::scaleToFit(int width, int height) {
    return QString("scale=%1:%2:force_original_aspect_ratio=decrease,"
                   "pad=%1:%2:(ow-iw)/2:(oh-ih)/2,setsar=1")
        .arg(width).arg(height);
}

QString FilterGraph::scaleTo(int width, int height) {
    return QString("scale=%1:%2,setsar=1").arg(width).arg(height);
}

QString FilterGraph::conform(double fps) {
    return QString("fps=%1,format=yuv420p").arg(TimeUtil::formatNumber(fps));
}

QString FilterGraph::holdLastFrame(double seconds) {
    return QString("tpad=stop_mode=clone:stop_duration=%1").arg(TimeUtil::formatSeconds(seconds));
}

QString FilterGraph::overlayAt(int x, int y) {
    return QString("overlay=%1:%2:eof_action=pass").arg(x).arg(y);
}

QString FilterGraph::volume(double level) {
    return QString("volume=%1").arg(TimeUtil::formatNumber(level));
}

QString FilterGraph::mix(int inputs, bool normalize) {
    return QString("amix=inputs=%1:duration=longest:dropout_transition=2:normalize=%2")
        .arg(inputs).arg(normalize ? 1 : 0);
}

QString FilterGraph::silenceSource(double duration) {
    return QString("anullsrc=channel_layout=%1:sample_rate=%2:duration=%3")
        .arg(AppConstants::AudioChannelLayout)
        .arg(AppConstants::AudioSampleRate)
        .arg(TimeUtil::formatSeconds(duration));
}

QString FilterGraph::colorSource(const QString& color, int width, int height, double fps, double duration) {
    return QString("color=c=%1:s=%2x%3:r=%4:d=%5")
        .arg(color)
        .arg(width).arg(height)
        .arg(TimeUtil::formatNumber(fps))
        .arg(TimeUtil::formatSeconds(duration));
}
