#include "ExportConfig.h"
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QProcessEnvironment>

QString ExportConfig::effectiveTempRoot() const {
    return tempRoot.isEmpty() ? QDir::tempPath() : tempRoot;
}

ExportConfigLoader::ExportConfigLoader(QObject* parent) : QObject(parent) {}
ExportConfigLoader::~ExportConfigLoader() = default;

bool ExportConfigLoader::load(const QString& filePath, ExportConfig& config) {
    if (!filePath.isEmpty()) {
        QFile file(filePath);
        if (!file.open(QIODevice::ReadOnly)) {
            m_error = QString("Cannot read: %1").arg(filePath);
            return false;
        }

        auto doc = QJsonDocument::fromJson(file.readAll());
        if (!doc.isObject()) {
            m_error = QString("Invalid config format: %1").arg(filePath);
            return false;
        }
        config = fromJson(doc.object());
    }

    applyEnvironment(config);
    return true;
}

void ExportConfigLoader::applyEnvironment(ExportConfig& config) {
    const auto env = QProcessEnvironment::systemEnvironment();
    if (env.contains("REELFORGE_FFMPEG"))
        config.ffmpegPath = env.value("REELFORGE_FFMPEG");
    if (env.contains("REELFORGE_TEMP"))
        config.tempRoot = env.value("REELFORGE_TEMP");
}

ExportConfig ExportConfigLoader::fromJson(const QJsonObject& obj) {
    ExportConfig cfg;
    cfg.ffmpegPath = obj["ffmpegPath"].toString(cfg.ffmpegPath);
    cfg.tempRoot = obj["tempRoot"].toString();
    return cfg;
}
