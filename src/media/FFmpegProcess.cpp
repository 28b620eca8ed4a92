#include "FFmpegProcess.h"
#include "Logging.h"
#include "TimeUtil.h"
#include <QPointer>
#include <QTimer>

FFmpegProcess::FFmpegProcess(const QString& program, QObject* parent)
    : TranscodeRunner(parent), m_program(program) {}

FFmpegProcess::~FFmpegProcess() {
    if (m_process && m_process->state() != QProcess::NotRunning) {
        m_process->kill();
        m_process->waitForFinished(1000);
    }
}

void FFmpegProcess::start(const TranscodeRequest& request) {
    if (m_process) {
        m_process->disconnect(this);
        m_process->deleteLater();
    }

    m_process = new QProcess(this);
    m_stderrTail.clear();
    m_lastElapsed = -1.0;
    m_label = request.label;
    m_reported = false;

    connect(m_process, &QProcess::readyReadStandardError, this, &FFmpegProcess::onReadyReadStderr);
    connect(m_process, &QProcess::finished, this, &FFmpegProcess::onFinished);
    connect(m_process, &QProcess::errorOccurred, this, &FFmpegProcess::onErrorOccurred);

    const QStringList args = request.arguments();
    qCDebug(lcProcess).noquote() << "[" + m_label + "]" << m_program << args.join(' ');
    m_process->start(m_program, args);
}

void FFmpegProcess::terminate() {
    if (!isRunning()) return;

    qCInfo(lcProcess) << "Terminating" << m_label;
    m_process->terminate();

    QPointer<QProcess> proc = m_process;
    QTimer::singleShot(KillGraceMs, this, [proc]() {
        if (proc && proc->state() != QProcess::NotRunning)
            proc->kill();
    });
}

bool FFmpegProcess::isRunning() const {
    return m_process && m_process->state() != QProcess::NotRunning;
}

void FFmpegProcess::onReadyReadStderr() {
    const QByteArray chunk = m_process->readAllStandardError();
    m_stderrTail.append(chunk);
    if (m_stderrTail.size() > StderrTailBytes)
        m_stderrTail = m_stderrTail.right(StderrTailBytes);

    // Status fields can straddle two reads, so parse the buffered tail
    const double elapsed = TimeUtil::parseLatestEncoderTime(m_stderrTail);
    if (elapsed > m_lastElapsed) {
        m_lastElapsed = elapsed;
        emit progress(elapsed);
    }
}

void FFmpegProcess::onFinished(int exitCode, QProcess::ExitStatus status) {
    m_stderrTail.append(m_process->readAllStandardError());

    TranscodeResult result;
    result.exitCode = exitCode;
    result.errorText = QString::fromUtf8(m_stderrTail.right(StderrTailBytes)).trimmed();

    if (status == QProcess::CrashExit) {
        result.outcome = TranscodeResult::Outcome::Crashed;
    } else if (exitCode != 0) {
        result.outcome = TranscodeResult::Outcome::ExitFailed;
    } else {
        result.outcome = TranscodeResult::Outcome::Success;
    }

    if (!result.ok()) {
        qCWarning(lcProcess).noquote() << "[" + m_label + "] exited with code" << exitCode
                                       << (status == QProcess::CrashExit ? "(crashed)" : "");
    }
    report(result);
}

void FFmpegProcess::onErrorOccurred(QProcess::ProcessError error) {
    // Every other error is followed by finished()
    if (error != QProcess::FailedToStart) return;

    TranscodeResult result;
    result.outcome = TranscodeResult::Outcome::SpawnFailed;
    result.exitCode = -1;
    result.errorText = QString("Could not start encoder '%1': %2. "
                               "Install ffmpeg or set REELFORGE_FFMPEG to its path.")
                           .arg(m_program, m_process->errorString());
    qCCritical(lcProcess).noquote() << result.errorText;
    report(result);
}

void FFmpegProcess::report(const TranscodeResult& result) {
    if (m_reported) return;
    m_reported = true;
    emit finished(result);
}
