#include "core/backend/ollama_backend.h"
#include "core/batch/batch_dispatcher.h"
#include "core/batch/item_processor.h"
#include "core/learning/priority_classifier.h"
#include "core/pool/backend_pool.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"
#include "core/store/sqlite_preference_store.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QStandardPaths>
#include <QTextStream>

#include <algorithm>
#include <cstdio>

namespace {

// Accepts ["prompt", ...] or [{"id": "...", "prompt": "..."}, ...].
std::optional<std::vector<mm::WorkItem>> readWorkItems(const QString& path, QString* errorOut)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        *errorOut = QStringLiteral("Cannot open %1: %2").arg(path, file.errorString());
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        *errorOut = parseError.error != QJsonParseError::NoError
            ? parseError.errorString()
            : QStringLiteral("Input must be a JSON array");
        return std::nullopt;
    }

    std::vector<mm::WorkItem> items;
    const QJsonArray array = doc.array();
    items.reserve(static_cast<size_t>(array.size()));
    for (int i = 0; i < array.size(); ++i) {
        const QJsonValue value = array.at(i);
        mm::WorkItem item;
        if (value.isString()) {
            item.id = QString::number(i);
            item.payload = value.toString();
        } else if (value.isObject()) {
            const QJsonObject obj = value.toObject();
            item.id = obj.value(QStringLiteral("id")).toString(QString::number(i));
            item.payload = obj.value(QStringLiteral("prompt")).toString();
        } else {
            *errorOut = QStringLiteral("Entry %1 is neither a string nor an object").arg(i);
            return std::nullopt;
        }
        items.push_back(std::move(item));
    }
    return items;
}

void printJson(const QJsonObject& obj)
{
    QTextStream out(stdout);
    out << QJsonDocument(obj).toJson(QJsonDocument::Indented);
    out.flush();
}

// Prune learning history past the retention window and report accuracy.
int runStats(const mm::Settings& settings, int days)
{
    QString dbPath = settings.dbPath;
    if (dbPath.isEmpty()) {
        dbPath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
            + QStringLiteral("/mailmind/mailmind.db");
    }
    QDir().mkpath(QFileInfo(dbPath).absolutePath());

    QString openError;
    auto store = mm::SQLitePreferenceStore::open(dbPath, &openError);
    if (!store) {
        LOG_ERROR(mmCore, "Cannot open %s: %s", qUtf8Printable(dbPath), qUtf8Printable(openError));
        return 1;
    }

    mm::PriorityClassifier classifier(store.get());
    mm::ErrorInfo error;
    const auto pruned = classifier.pruneHistory(settings.eventRetentionDays, &error);
    if (!pruned) {
        LOG_WARN(mmCore, "History pruning failed: %s", qUtf8Printable(error.message));
    }

    const auto window = classifier.getClassificationAccuracy(days, &error);
    if (!window) {
        LOG_ERROR(mmCore, "Accuracy query failed: %s", qUtf8Printable(error.message));
        return 1;
    }

    QJsonObject report = window->toJson();
    report[QStringLiteral("pruned_events")] = static_cast<qint64>(pruned.value_or(0));
    printJson(report);
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("mailmind-batch"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Run a JSON file of prompts through the local inference backend."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("input"),
                                 QStringLiteral("JSON array of prompts or {id, prompt} objects."),
                                 QStringLiteral("[input]"));

    const QCommandLineOption settingsOption(QStringLiteral("settings"),
        QStringLiteral("Settings file (default: %1).").arg(mm::SettingsManager::settingsFilePath()),
        QStringLiteral("path"));
    const QCommandLineOption poolSizeOption(QStringLiteral("pool-size"),
        QStringLiteral("Backend connections, 2-5."), QStringLiteral("n"));
    const QCommandLineOption timeoutOption(QStringLiteral("timeout"),
        QStringLiteral("Per-item timeout in milliseconds."), QStringLiteral("ms"));
    const QCommandLineOption statsOption(QStringLiteral("stats"),
        QStringLiteral("Print classification accuracy over the last <days> days and exit."),
        QStringLiteral("days"));
    parser.addOption(settingsOption);
    parser.addOption(poolSizeOption);
    parser.addOption(timeoutOption);
    parser.addOption(statsOption);
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (!parser.isSet(statsOption) && positional.size() != 1) {
        parser.showHelp(2);
    }

    std::optional<mm::Settings> loaded = parser.isSet(settingsOption)
        ? mm::SettingsManager::loadFrom(parser.value(settingsOption))
        : mm::SettingsManager::load();
    if (!loaded && parser.isSet(settingsOption)) {
        LOG_ERROR(mmCore, "Could not read settings from %s",
                  qUtf8Printable(parser.value(settingsOption)));
        return 1;
    }
    mm::Settings settings = loaded.value_or(mm::Settings{});

    if (parser.isSet(statsOption)) {
        bool ok = false;
        const int days = parser.value(statsOption).toInt(&ok);
        if (!ok || days <= 0) {
            LOG_ERROR(mmCore, "--stats expects a positive number of days");
            return 1;
        }
        return runStats(settings, days);
    }

    int poolSize = settings.poolSize;
    if (parser.isSet(poolSizeOption)) {
        bool ok = false;
        poolSize = parser.value(poolSizeOption).toInt(&ok);
        if (!ok) {
            LOG_ERROR(mmCore, "--pool-size expects an integer");
            return 1;
        }
    }
    int itemTimeoutMs = settings.itemTimeoutMs;
    if (parser.isSet(timeoutOption)) {
        bool ok = false;
        itemTimeoutMs = parser.value(timeoutOption).toInt(&ok);
        if (!ok || itemTimeoutMs <= 0) {
            LOG_ERROR(mmCore, "--timeout expects a positive integer");
            return 1;
        }
    }

    QString readError;
    const auto items = readWorkItems(positional.first(), &readError);
    if (!items) {
        LOG_ERROR(mmCore, "%s", qUtf8Printable(readError));
        return 1;
    }

    auto backend = std::make_shared<mm::OllamaBackend>(QUrl(settings.ollamaBaseUrl),
                                                       settings.requestTimeoutMs);

    QString modelError;
    const auto models = backend->listModels(&modelError);
    if (!models) {
        LOG_ERROR(mmCore, "Inference backend unavailable: %s", qUtf8Printable(modelError));
        return 1;
    }
    const auto model = mm::OllamaBackend::resolveModel(*models, settings.primaryModel,
                                                       settings.fallbackModel);
    if (!model) {
        LOG_ERROR(mmCore, "Neither %s nor %s is installed; run `ollama pull %s`",
                  qUtf8Printable(settings.primaryModel), qUtf8Printable(settings.fallbackModel),
                  qUtf8Printable(settings.primaryModel));
        return 1;
    }
    LOG_INFO(mmCore, "Using model %s", qUtf8Printable(*model));

    mm::BackendPool pool(backend);
    mm::ErrorInfo poolError;
    if (!pool.initialize(poolSize, &poolError)) {
        LOG_ERROR(mmCore, "Pool initialization failed (%s): %s",
                  qUtf8Printable(mm::coreErrorToString(poolError.code)),
                  qUtf8Printable(poolError.message));
        return 1;
    }

    mm::GenerateOptions options;
    options.model = *model;
    options.temperature = settings.temperature;
    options.contextWindow = settings.contextWindow;
    // A generate call never outlives its item's slot.
    options.timeoutMs = std::min(settings.requestTimeoutMs, itemTimeoutMs);

    mm::BatchDispatcher dispatcher(&pool, std::make_shared<mm::GenerateItemProcessor>(backend, options));
    dispatcher.setAcquireTimeoutMs(settings.acquireTimeoutMs);
    const mm::BatchResult result = dispatcher.processBatch(
        *items, itemTimeoutMs, [](int done, int total) {
            std::fprintf(stderr, "\r%d/%d", done, total);
            if (done == total) {
                std::fprintf(stderr, "\n");
            }
        });

    printJson(result.toJson());

    pool.shutdown();
    return 0;
}
