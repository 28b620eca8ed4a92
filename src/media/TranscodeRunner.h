#pragma once

#include <QObject>
#include <QString>
#include "TranscodeRequest.h"

struct TranscodeResult {
    enum class Outcome {
        Success,
        SpawnFailed,   // binary missing or not launchable
        ExitFailed,    // ran and exited non-zero
        Crashed        // killed by a signal (including terminate())
    };

    Outcome outcome = Outcome::Success;
    int exitCode = 0;
    QString errorText;   // tail of the encoder's stderr, or the spawn error

    bool ok() const { return outcome == Outcome::Success; }
};

// Runs one external encoder invocation at a time and reports completion
// asynchronously through finished().
class TranscodeRunner : public QObject {
    Q_OBJECT
public:
    explicit TranscodeRunner(QObject* parent = nullptr);
    ~TranscodeRunner() override;

    virtual void start(const TranscodeRequest& request) = 0;
    // Sends a terminate signal to the in-flight process, if any
    virtual void terminate() = 0;
    virtual bool isRunning() const = 0;

signals:
    void progress(double elapsedSeconds);
    void finished(const TranscodeResult& result);
};
