#pragma once

#include <QString>
#include <QStringList>
#include <vector>

// Filter graph expressed as named filters over labelled pads, rendered to
// the encoder's -filter_complex syntax:
//   [0:v]scale=...[v0];[v0][1:v]overlay=...[v]
class FilterGraph {
public:
    FilterGraph& add(const QStringList& inputs, const QString& filter, const QStringList& outputs);
    FilterGraph& add(const QString& input, const QString& filter, const QString& output);

    bool isEmpty() const { return m_nodes.empty(); }
    int size() const { return static_cast<int>(m_nodes.size()); }
    QString toString() const;

    // Fit inside width x height preserving aspect ratio, centred on padding
    static QString scaleToFit(int width, int height);
    static QString scaleTo(int width, int height);
    // Constant frame rate and pixel format shared by every segment
    static QString conform(double fps);
    // Hold the last frame so a short source still fills the segment
    static QString holdLastFrame(double seconds);
    static QString overlayAt(int x, int y);
    static QString volume(double level);
    static QString mix(int inputs, bool normalize);
    static QString passAudio() { return "anull"; }
    static QString padAudio() { return "apad"; }

    // lavfi source descriptions (used as inputs, not graph nodes)
    static QString silenceSource(double duration);
    static QString colorSource(const QString& color, int width, int height, double fps, double duration);

private:
    struct Node {
        QStringList inputs;
        QString filter;
        QStringList outputs;
    };
    std::vector<Node> m_nodes;
};
