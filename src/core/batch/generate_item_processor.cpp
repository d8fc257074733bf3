#include "core/batch/item_processor.h"
#include "core/shared/logging.h"

namespace mm {

GenerateItemProcessor::GenerateItemProcessor(std::shared_ptr<InferenceBackend> backend,
                                             GenerateOptions options)
    : m_backend(std::move(backend))
    , m_options(std::move(options))
{
}

std::optional<QJsonObject> GenerateItemProcessor::process(const WorkItem& item,
                                                          BackendHandle& handle,
                                                          QString* errorOut)
{
    if (item.payload.trimmed().isEmpty()) {
        if (errorOut) {
            *errorOut = QStringLiteral("Empty prompt");
        }
        return std::nullopt;
    }

    const GenerateResult result = m_backend->generate(handle, item.payload, m_options);
    if (result.status != GenerateResult::Status::Success || !result.text.has_value()) {
        const QString message = QStringLiteral("%1: %2")
            .arg(generateStatusToString(result.status),
                 result.errorMessage.value_or(QStringLiteral("no response text")));
        LOG_DEBUG(mmBatch, "Item %s failed on handle %d: %s",
                  qUtf8Printable(item.id), handle.id(), qUtf8Printable(message));
        if (errorOut) {
            *errorOut = message;
        }
        return std::nullopt;
    }

    QJsonObject payload;
    payload[QStringLiteral("item_id")] = item.id;
    payload[QStringLiteral("response")] = *result.text;
    payload[QStringLiteral("model")] = m_options.model;
    payload[QStringLiteral("duration_ms")] = result.durationMs;
    return payload;
}

} // namespace mm
