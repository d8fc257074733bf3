#include "core/backend/ollama_backend.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

#include <algorithm>
#include <memory>

namespace mm {

namespace {

constexpr int kConnectProbeTimeoutMs = 5000;

QString stripLatestTag(const QString& model)
{
    if (model.endsWith(QLatin1String(":latest"))) {
        return model.left(model.size() - 7);
    }
    return model;
}

bool isSuccessStatus(int statusCode)
{
    return statusCode >= 200 && statusCode < 300;
}

} // namespace

OllamaBackend::OllamaBackend(QUrl baseUrl, int requestTimeoutMs)
    : m_baseUrl(std::move(baseUrl))
    , m_requestTimeoutMs(std::max(1, requestTimeoutMs))
{
    LOG_INFO(mmBackend, "OllamaBackend targeting %s (timeout=%d ms)",
             qUtf8Printable(m_baseUrl.toString()), m_requestTimeoutMs);
}

OllamaBackend::~OllamaBackend() = default;

// ── InferenceBackend ────────────────────────────────────────

std::unique_ptr<BackendHandle> OllamaBackend::connect(QString* errorOut)
{
    // Probe reachability so the pool fails fast instead of on first use.
    const HttpReply reply = send(Method::Get, QStringLiteral("/api/tags"), QByteArray(),
                                 std::min(kConnectProbeTimeoutMs, m_requestTimeoutMs));
    if (reply.timedOut || !isSuccessStatus(reply.statusCode)) {
        const QString error = reply.timedOut
            ? QStringLiteral("Ollama did not answer within the connect timeout")
            : QStringLiteral("Ollama unreachable at %1: %2")
                  .arg(m_baseUrl.toString(),
                       reply.networkError.isEmpty() ? QString::number(reply.statusCode)
                                                    : reply.networkError);
        LOG_WARN(mmBackend, "%s", qUtf8Printable(error));
        if (errorOut) {
            *errorOut = error;
        }
        return nullptr;
    }

    const int id = m_nextHandleId.fetch_add(1);
    LOG_DEBUG(mmBackend, "Opened Ollama handle %d", id);
    return std::make_unique<BackendHandle>(id);
}

std::optional<QStringList> OllamaBackend::listModels(QString* errorOut)
{
    const HttpReply reply = send(Method::Get, QStringLiteral("/api/tags"), QByteArray(),
                                 m_requestTimeoutMs);
    if (reply.timedOut || !isSuccessStatus(reply.statusCode)) {
        if (errorOut) {
            *errorOut = reply.timedOut ? QStringLiteral("Timed out listing models")
                                       : QStringLiteral("Model listing failed: %1")
                                             .arg(reply.networkError);
        }
        return std::nullopt;
    }
    return parseModelList(reply.body, errorOut);
}

GenerateResult OllamaBackend::generate(BackendHandle& handle,
                                       const QString& prompt,
                                       const GenerateOptions& options)
{
    GenerateResult result;
    QElapsedTimer timer;
    timer.start();

    if (options.model.isEmpty()) {
        result.status = GenerateResult::Status::ModelError;
        result.errorMessage = QStringLiteral("No model selected");
        return result;
    }

    const QByteArray body = QJsonDocument(buildGenerateRequest(prompt, options))
                                .toJson(QJsonDocument::Compact);
    const int timeoutMs = options.timeoutMs > 0 ? options.timeoutMs : m_requestTimeoutMs;
    const HttpReply reply = send(Method::Post, QStringLiteral("/api/generate"), body, timeoutMs);
    result.durationMs = static_cast<int>(timer.elapsed());

    if (reply.timedOut) {
        result.status = GenerateResult::Status::Timeout;
        result.errorMessage = QStringLiteral("Generation exceeded %1 ms").arg(timeoutMs);
        LOG_WARN(mmBackend, "generate timed out on handle %d after %d ms",
                 handle.id(), result.durationMs);
        return result;
    }

    if (reply.statusCode == 404) {
        result.status = GenerateResult::Status::ModelError;
        result.errorMessage = QStringLiteral("Model '%1' is not installed").arg(options.model);
        return result;
    }

    if (!isSuccessStatus(reply.statusCode)) {
        result.status = GenerateResult::Status::ConnectionFailed;
        result.errorMessage = reply.networkError.isEmpty()
            ? QStringLiteral("HTTP %1").arg(reply.statusCode)
            : reply.networkError;
        return result;
    }

    QString parseError;
    std::optional<QString> text = parseGenerateResponse(reply.body, &parseError);
    if (!text) {
        result.status = GenerateResult::Status::InvalidResponse;
        result.errorMessage = parseError;
        return result;
    }

    result.status = GenerateResult::Status::Success;
    result.text = std::move(text);
    LOG_DEBUG(mmBackend, "generate ok on handle %d (%d ms, %lld chars)",
              handle.id(), result.durationMs,
              static_cast<long long>(result.text->size()));
    return result;
}

// ── Payload helpers ─────────────────────────────────────────

std::optional<QString> OllamaBackend::resolveModel(const QStringList& available,
                                                   const QString& primary,
                                                   const QString& fallback)
{
    const auto contains = [&](const QString& wanted) {
        if (wanted.isEmpty()) {
            return false;
        }
        const QString normalizedWanted = stripLatestTag(wanted);
        return std::any_of(available.begin(), available.end(), [&](const QString& model) {
            return stripLatestTag(model) == normalizedWanted;
        });
    };

    if (contains(primary)) {
        return primary;
    }
    if (contains(fallback)) {
        LOG_WARN(mmBackend, "Primary model %s missing, using fallback %s",
                 qUtf8Printable(primary), qUtf8Printable(fallback));
        return fallback;
    }
    return std::nullopt;
}

QJsonObject OllamaBackend::buildGenerateRequest(const QString& prompt, const GenerateOptions& options)
{
    QJsonObject modelOptions;
    modelOptions[QStringLiteral("temperature")] = options.temperature;
    modelOptions[QStringLiteral("num_ctx")] = options.contextWindow;

    QJsonObject request;
    request[QStringLiteral("model")] = options.model;
    request[QStringLiteral("prompt")] = prompt;
    request[QStringLiteral("stream")] = false;
    request[QStringLiteral("options")] = modelOptions;
    return request;
}

std::optional<QString> OllamaBackend::parseGenerateResponse(const QByteArray& body, QString* errorOut)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorOut) {
            *errorOut = QStringLiteral("Malformed generate response: %1").arg(parseError.errorString());
        }
        return std::nullopt;
    }

    const QJsonObject obj = doc.object();
    if (obj.contains(QStringLiteral("error"))) {
        if (errorOut) {
            *errorOut = obj.value(QStringLiteral("error")).toString();
        }
        return std::nullopt;
    }

    const QJsonValue response = obj.value(QStringLiteral("response"));
    if (!response.isString()) {
        if (errorOut) {
            *errorOut = QStringLiteral("Generate response has no 'response' field");
        }
        return std::nullopt;
    }
    return response.toString();
}

std::optional<QStringList> OllamaBackend::parseModelList(const QByteArray& body, QString* errorOut)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorOut) {
            *errorOut = QStringLiteral("Malformed model list: %1").arg(parseError.errorString());
        }
        return std::nullopt;
    }

    QStringList models;
    const QJsonArray entries = doc.object().value(QStringLiteral("models")).toArray();
    for (const QJsonValue& entry : entries) {
        const QJsonObject model = entry.toObject();
        QString name = model.value(QStringLiteral("name")).toString();
        if (name.isEmpty()) {
            name = model.value(QStringLiteral("model")).toString();
        }
        if (!name.isEmpty()) {
            models.append(name);
        }
    }
    return models;
}

// ── HTTP ────────────────────────────────────────────────────

QUrl OllamaBackend::endpoint(const QString& path) const
{
    QUrl url = m_baseUrl;
    QString basePath = url.path();
    if (basePath.endsWith(QLatin1Char('/'))) {
        basePath.chop(1);
    }
    url.setPath(basePath + path);
    return url;
}

OllamaBackend::HttpReply OllamaBackend::send(Method method,
                                             const QString& path,
                                             const QByteArray& body,
                                             int timeoutMs) const
{
    const int waitMs = std::max(1, timeoutMs);

    // QNetworkAccessManager is thread-affine, so each call owns one.
    QNetworkAccessManager manager;
    QNetworkRequest request(endpoint(path));
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));

    std::unique_ptr<QNetworkReply> reply(method == Method::Get ? manager.get(request)
                                                               : manager.post(request, body));

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timer.start(waitMs);
    if (!reply->isFinished()) {
        loop.exec();
    }

    HttpReply out;
    if (!reply->isFinished()) {
        out.timedOut = true;
        reply->abort();
        return out;
    }

    out.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    out.body = reply->readAll();
    if (reply->error() != QNetworkReply::NoError) {
        out.networkError = reply->errorString();
    }
    return out;
}

} // namespace mm
