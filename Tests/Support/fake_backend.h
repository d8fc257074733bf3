#pragma once

#include "core/backend/inference_backend.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

namespace mm::test {

// Scriptable in-process InferenceBackend.
//
// connect() succeeds until failConnectAfter successes have been handed out
// (-1 = never fail). generate() delegates to the handler, or echoes the
// prompt when none is set. Handle lifetimes and generate() concurrency are
// counted so tests can assert on pool and dispatcher behavior.
class FakeBackend : public InferenceBackend {
public:
    using GenerateHandler = std::function<GenerateResult(const QString& prompt)>;

    FakeBackend();
    ~FakeBackend() override;

    std::unique_ptr<BackendHandle> connect(QString* errorOut = nullptr) override;
    std::optional<QStringList> listModels(QString* errorOut = nullptr) override;
    GenerateResult generate(BackendHandle& handle,
                            const QString& prompt,
                            const GenerateOptions& options) override;

    void setFailConnectAfter(int successes);
    void setGenerateHandler(GenerateHandler handler);
    void setModels(const QStringList& models);

    int connectCalls() const { return m_connectCalls.load(); }
    int liveHandles() const { return m_liveHandles->load(); }
    int generateCalls() const { return m_generateCalls.load(); }
    int maxConcurrentGenerates() const { return m_maxInFlight.load(); }

private:
    std::atomic<int> m_connectCalls{0};
    std::atomic<int> m_failConnectAfter{-1};
    std::atomic<int> m_nextId{1};
    std::shared_ptr<std::atomic<int>> m_liveHandles;

    std::atomic<int> m_generateCalls{0};
    std::atomic<int> m_inFlight{0};
    std::atomic<int> m_maxInFlight{0};

    mutable std::mutex m_mutex;
    GenerateHandler m_handler;
    QStringList m_models;
};

} // namespace mm::test
