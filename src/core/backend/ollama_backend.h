#pragma once

#include "core/backend/inference_backend.h"

#include <QByteArray>
#include <QJsonObject>
#include <QUrl>

#include <atomic>

namespace mm {

// OllamaBackend -- InferenceBackend over the Ollama HTTP API.
//
//   GET  /api/tags      -> installed models
//   POST /api/generate  -> non-streaming completion
//
// Requests are blocking: each call spins a private QEventLoop on the
// calling thread, so worker threads can share one backend instance.
// A QCoreApplication must exist for the network stack.
class OllamaBackend final : public InferenceBackend {
public:
    explicit OllamaBackend(QUrl baseUrl, int requestTimeoutMs = 60000);
    ~OllamaBackend() override;

    std::unique_ptr<BackendHandle> connect(QString* errorOut = nullptr) override;
    std::optional<QStringList> listModels(QString* errorOut = nullptr) override;
    GenerateResult generate(BackendHandle& handle,
                            const QString& prompt,
                            const GenerateOptions& options) override;

    // Chooses primary if installed, else fallback, else nullopt.
    // Matching ignores an implicit ":latest" tag.
    static std::optional<QString> resolveModel(const QStringList& available,
                                               const QString& primary,
                                               const QString& fallback);

    static QJsonObject buildGenerateRequest(const QString& prompt, const GenerateOptions& options);
    static std::optional<QString> parseGenerateResponse(const QByteArray& body, QString* errorOut = nullptr);
    static std::optional<QStringList> parseModelList(const QByteArray& body, QString* errorOut = nullptr);

    QUrl baseUrl() const { return m_baseUrl; }

private:
    struct HttpReply {
        int statusCode = 0;
        QByteArray body;
        bool timedOut = false;
        QString networkError;
    };

    enum class Method { Get, Post };

    HttpReply send(Method method, const QString& path, const QByteArray& body, int timeoutMs) const;
    QUrl endpoint(const QString& path) const;

    QUrl m_baseUrl;
    int m_requestTimeoutMs = 60000;
    std::atomic<int> m_nextHandleId{1};
};

} // namespace mm
