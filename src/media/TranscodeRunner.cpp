#include "TranscodeRunner.h"

TranscodeRunner::TranscodeRunner(QObject* parent) : QObject(parent) {}
TranscodeRunner::~TranscodeRunner() = default;
