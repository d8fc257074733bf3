#pragma once

#include <QString>
#include <cstdint>

namespace mm {

struct Settings {
    // Database
    QString dbPath;

    // Backend pool
    int poolSize = 3;                   // validated to [2, 5]
    int acquireTimeoutMs = 30000;

    // Batch processing
    int itemTimeoutMs = 30000;

    // Ollama
    QString ollamaBaseUrl = QStringLiteral("http://localhost:11434");
    QString primaryModel = QStringLiteral("llama3.1:8b-instruct-q4_K_M");
    QString fallbackModel = QStringLiteral("mistral:7b-instruct-q4_K_M");
    double temperature = 0.3;
    int contextWindow = 8192;
    int requestTimeoutMs = 60000;

    // Learning history
    int eventRetentionDays = 365;
};

} // namespace mm
