#pragma once

#include <QProcess>
#include <QByteArray>
#include "TranscodeRunner.h"

// TranscodeRunner backed by the ffmpeg command-line binary.
class FFmpegProcess : public TranscodeRunner {
    Q_OBJECT
public:
    explicit FFmpegProcess(const QString& program, QObject* parent = nullptr);
    ~FFmpegProcess() override;

    void start(const TranscodeRequest& request) override;
    void terminate() override;
    bool isRunning() const override;

    QString program() const { return m_program; }

private slots:
    void onReadyReadStderr();
    void onFinished(int exitCode, QProcess::ExitStatus status);
    void onErrorOccurred(QProcess::ProcessError error);

private:
    void report(const TranscodeResult& result);

    QString m_program;
    QProcess* m_process = nullptr;
    QByteArray m_stderrTail;
    double m_lastElapsed = -1.0;
    QString m_label;
    bool m_reported = true;

    static constexpr int StderrTailBytes = 4096;
    static constexpr int KillGraceMs = 5000;
};
