#pragma once

#include <QString>

namespace mm {

// Failure classes reported across the core's library boundary.
// Per-item batch failures are not errors here; they are carried in
// ItemResult so a batch always completes.
enum class CoreError : int {
    None               = 0,
    ValidationError    = 1,
    BackendUnavailable = 2,
    ResourceExhausted  = 3,
    NotInitialized     = 4,
    StorageFailure     = 5,
};

struct ErrorInfo {
    CoreError code = CoreError::None;
    QString message;
};

inline QString coreErrorToString(CoreError code)
{
    switch (code) {
    case CoreError::None:               return QStringLiteral("NONE");
    case CoreError::ValidationError:    return QStringLiteral("VALIDATION_ERROR");
    case CoreError::BackendUnavailable: return QStringLiteral("BACKEND_UNAVAILABLE");
    case CoreError::ResourceExhausted:  return QStringLiteral("RESOURCE_EXHAUSTED");
    case CoreError::NotInitialized:     return QStringLiteral("NOT_INITIALIZED");
    case CoreError::StorageFailure:     return QStringLiteral("STORAGE_FAILURE");
    }
    return QStringLiteral("UNKNOWN");
}

// Fills *errorOut when the caller asked for details. Always returns false
// so call sites can `return setError(...)`.
inline bool setError(ErrorInfo* errorOut, CoreError code, const QString& message)
{
    if (errorOut) {
        errorOut->code = code;
        errorOut->message = message;
    }
    return false;
}

} // namespace mm
