#include "core/backend/inference_backend.h"

namespace mm {

QString generateStatusToString(GenerateResult::Status status)
{
    switch (status) {
    case GenerateResult::Status::Success:          return QStringLiteral("success");
    case GenerateResult::Status::Timeout:          return QStringLiteral("timeout");
    case GenerateResult::Status::ConnectionFailed: return QStringLiteral("connection_failed");
    case GenerateResult::Status::ModelError:       return QStringLiteral("model_error");
    case GenerateResult::Status::InvalidResponse:  return QStringLiteral("invalid_response");
    case GenerateResult::Status::Unknown:          return QStringLiteral("unknown");
    }
    return QStringLiteral("unknown");
}

} // namespace mm
