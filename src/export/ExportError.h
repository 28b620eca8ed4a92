#pragma once

#include <QString>

enum class ExportErrorKind {
    None,
    Validation,     // bad clip reference, trim bounds, missing source file
    ProcessSpawn,   // encoder binary could not be launched
    ProcessExit,    // encoder ran and exited non-zero
    Assembly,       // concatenation of rendered segments failed
    Cancelled
};

struct ExportError {
    ExportErrorKind kind = ExportErrorKind::None;
    QString message;

    bool isError() const { return kind != ExportErrorKind::None; }

    static ExportError validation(const QString& msg) { return {ExportErrorKind::Validation, msg}; }
    static ExportError spawn(const QString& msg) { return {ExportErrorKind::ProcessSpawn, msg}; }
    static ExportError exit(const QString& msg) { return {ExportErrorKind::ProcessExit, msg}; }
    static ExportError assembly(const QString& msg) { return {ExportErrorKind::Assembly, msg}; }
    static ExportError cancelled() { return {ExportErrorKind::Cancelled, "Export cancelled"}; }
};

inline const char* exportErrorKindName(ExportErrorKind kind) {
    switch (kind) {
    case ExportErrorKind::None:         return "none";
    case ExportErrorKind::Validation:   return "validation";
    case ExportErrorKind::ProcessSpawn: return "process-spawn";
    case ExportErrorKind::ProcessExit:  return "process-exit";
    case ExportErrorKind::Assembly:     return "assembly";
    case ExportErrorKind::Cancelled:    return "cancelled";
    }
    return "unknown";
}
