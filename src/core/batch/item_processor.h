#pragma once

#include "core/backend/inference_backend.h"
#include "core/batch/batch_types.h"

#include <QJsonObject>
#include <QString>

#include <memory>
#include <optional>

namespace mm {

// ItemProcessor -- turns one WorkItem into a JSON payload using a leased
// backend handle. Called concurrently from dispatcher workers, each with its
// own handle.
//
// Report failure by returning nullopt with errorOut set. Exceptions are
// also caught by the dispatcher and recorded as Error results.
class ItemProcessor {
public:
    virtual ~ItemProcessor() = default;

    virtual std::optional<QJsonObject> process(const WorkItem& item,
                                               BackendHandle& handle,
                                               QString* errorOut) = 0;
};

// Sends item.payload to InferenceBackend::generate() as the prompt.
// Success payload: {item_id, response, model, duration_ms}.
class GenerateItemProcessor final : public ItemProcessor {
public:
    GenerateItemProcessor(std::shared_ptr<InferenceBackend> backend, GenerateOptions options);

    std::optional<QJsonObject> process(const WorkItem& item,
                                       BackendHandle& handle,
                                       QString* errorOut) override;

private:
    std::shared_ptr<InferenceBackend> m_backend;
    GenerateOptions m_options;
};

} // namespace mm
