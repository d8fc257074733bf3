#pragma once

#include <QString>
#include <QStringList>

#include <memory>
#include <optional>

namespace mm {

// Options forwarded to a single generate() call.
struct GenerateOptions {
    QString model;
    double temperature = 0.3;
    int contextWindow = 8192;
    int timeoutMs = 60000;
};

// Result of a text generation attempt.
// Every attempt produces a status; text is present only on Success.
struct GenerateResult {
    enum class Status {
        Success,
        Timeout,
        ConnectionFailed,
        ModelError,
        InvalidResponse,
        Unknown,
    };

    Status status = Status::Unknown;
    std::optional<QString> text;
    std::optional<QString> errorMessage;
    int durationMs = 0;
};

QString generateStatusToString(GenerateResult::Status status);

// A connected, reusable backend client. A handle is used by at most one
// thread at a time; BackendPool enforces that.
class BackendHandle {
public:
    explicit BackendHandle(int id) : m_id(id) {}
    virtual ~BackendHandle() = default;

    BackendHandle(const BackendHandle&) = delete;
    BackendHandle& operator=(const BackendHandle&) = delete;

    int id() const { return m_id; }

private:
    int m_id = 0;
};

// InferenceBackend -- abstract capability of a local inference server.
//
// Implementations must allow connect() and generate() to be called from
// any thread; each handle is only ever touched by its current holder.
class InferenceBackend {
public:
    virtual ~InferenceBackend() = default;

    // Open a new client. Returns nullptr and fills errorOut when the
    // backend cannot be reached.
    virtual std::unique_ptr<BackendHandle> connect(QString* errorOut = nullptr) = 0;

    // Model identifiers installed on the backend, or nullopt on failure.
    virtual std::optional<QStringList> listModels(QString* errorOut = nullptr) = 0;

    virtual GenerateResult generate(BackendHandle& handle,
                                    const QString& prompt,
                                    const GenerateOptions& options) = 0;
};

} // namespace mm
