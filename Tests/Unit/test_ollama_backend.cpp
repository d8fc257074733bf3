#include <QtTest/QtTest>
#include "core/backend/ollama_backend.h"

#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTcpServer>
#include <QTcpSocket>

namespace {

// Minimal HTTP/1.1 responder standing in for a local Ollama server.
// Runs on the test thread; OllamaBackend's nested event loop drives it.
class FakeOllamaServer : public QObject {
public:
    FakeOllamaServer()
    {
        QObject::connect(&m_server, &QTcpServer::newConnection, this, [this]() {
            while (QTcpSocket* socket = m_server.nextPendingConnection()) {
                QObject::connect(socket, &QTcpSocket::readyRead, this, [this, socket]() {
                    onReadyRead(socket);
                });
                QObject::connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
            }
        });
    }

    bool listen() { return m_server.listen(QHostAddress::LocalHost); }
    QUrl url() const
    {
        return QUrl(QStringLiteral("http://127.0.0.1:%1").arg(m_server.serverPort()));
    }

    QJsonObject lastGenerateRequest;
    int tagsRequests = 0;

private:
    void onReadyRead(QTcpSocket* socket)
    {
        QByteArray& buffer = m_buffers[socket];
        buffer += socket->readAll();

        const int headerEnd = buffer.indexOf("\r\n\r\n");
        if (headerEnd < 0) {
            return;
        }
        const QByteArray head = buffer.left(headerEnd);
        int contentLength = 0;
        for (const QByteArray& line : head.split('\n')) {
            if (line.toLower().startsWith("content-length:")) {
                contentLength = line.mid(15).trimmed().toInt();
            }
        }
        if (buffer.size() < headerEnd + 4 + contentLength) {
            return;
        }

        const QByteArray body = buffer.mid(headerEnd + 4, contentLength);
        const QList<QByteArray> requestLine = head.left(head.indexOf('\r')).split(' ');
        m_buffers.remove(socket);
        const QByteArray path = requestLine.value(1);

        if (path == "/api/tags") {
            ++tagsRequests;
            QJsonArray models;
            models.append(QJsonObject{{QStringLiteral("name"), QStringLiteral("llama3.1:8b-instruct-q4_K_M")}});
            models.append(QJsonObject{{QStringLiteral("name"), QStringLiteral("mistral:latest")}});
            respond(socket, 200, QJsonObject{{QStringLiteral("models"), models}});
            return;
        }

        if (path == "/api/generate") {
            lastGenerateRequest = QJsonDocument::fromJson(body).object();
            const QString model = lastGenerateRequest.value(QStringLiteral("model")).toString();
            const QString prompt = lastGenerateRequest.value(QStringLiteral("prompt")).toString();
            if (model == QLatin1String("missing")) {
                respond(socket, 404, QJsonObject{{QStringLiteral("error"), QStringLiteral("model not found")}});
            } else if (prompt == QLatin1String("hang")) {
                // Never answer.
            } else {
                respond(socket, 200, QJsonObject{
                    {QStringLiteral("response"), QStringLiteral("echo:") + prompt},
                    {QStringLiteral("done"), true}});
            }
            return;
        }

        respond(socket, 404, QJsonObject{{QStringLiteral("error"), QStringLiteral("no route")}});
    }

    void respond(QTcpSocket* socket, int status, const QJsonObject& payload)
    {
        const QByteArray body = QJsonDocument(payload).toJson(QJsonDocument::Compact);
        QByteArray response = "HTTP/1.1 " + QByteArray::number(status)
            + (status == 200 ? " OK" : " Not Found") + "\r\n"
            + "Content-Type: application/json\r\n"
            + "Content-Length: " + QByteArray::number(body.size()) + "\r\n"
            + "Connection: close\r\n\r\n" + body;
        socket->write(response);
        socket->disconnectFromHost();
    }

    QTcpServer m_server;
    QHash<QTcpSocket*, QByteArray> m_buffers;
};

} // anonymous namespace

class TestOllamaBackend : public QObject {
    Q_OBJECT

private slots:
    void testResolveModelPrefersPrimary();
    void testResolveModelFallsBack();
    void testResolveModelIgnoresLatestTag();
    void testResolveModelNothingInstalled();
    void testBuildGenerateRequest();
    void testParseGenerateResponse();
    void testParseModelList();

    void testConnectAndListModels();
    void testGenerateRoundTrip();
    void testGenerateMissingModel();
    void testGenerateTimeout();
    void testConnectFailsWhenServerDown();
};

void TestOllamaBackend::testResolveModelPrefersPrimary()
{
    const QStringList available{QStringLiteral("mistral:7b-instruct-q4_K_M"),
                                QStringLiteral("llama3.1:8b-instruct-q4_K_M")};
    QCOMPARE(mm::OllamaBackend::resolveModel(available, QStringLiteral("llama3.1:8b-instruct-q4_K_M"),
                                             QStringLiteral("mistral:7b-instruct-q4_K_M")).value_or(QString()),
             QStringLiteral("llama3.1:8b-instruct-q4_K_M"));
}

void TestOllamaBackend::testResolveModelFallsBack()
{
    const QStringList available{QStringLiteral("mistral:7b-instruct-q4_K_M")};
    QCOMPARE(mm::OllamaBackend::resolveModel(available, QStringLiteral("llama3.1:8b-instruct-q4_K_M"),
                                             QStringLiteral("mistral:7b-instruct-q4_K_M")).value_or(QString()),
             QStringLiteral("mistral:7b-instruct-q4_K_M"));
}

void TestOllamaBackend::testResolveModelIgnoresLatestTag()
{
    QCOMPARE(mm::OllamaBackend::resolveModel({QStringLiteral("mistral:latest")},
                                             QStringLiteral("mistral"), QString()).value_or(QString()),
             QStringLiteral("mistral"));
}

void TestOllamaBackend::testResolveModelNothingInstalled()
{
    QVERIFY(!mm::OllamaBackend::resolveModel({QStringLiteral("phi3:mini")},
                                             QStringLiteral("llama3.1:8b"),
                                             QStringLiteral("mistral:7b")).has_value());
    QVERIFY(!mm::OllamaBackend::resolveModel({}, QStringLiteral("a"), QStringLiteral("b")).has_value());
}

void TestOllamaBackend::testBuildGenerateRequest()
{
    mm::GenerateOptions options;
    options.model = QStringLiteral("llama3.1:8b");
    options.temperature = 0.3;
    options.contextWindow = 8192;

    const QJsonObject request = mm::OllamaBackend::buildGenerateRequest(QStringLiteral("Summarize"), options);
    QCOMPARE(request.value(QStringLiteral("model")).toString(), QStringLiteral("llama3.1:8b"));
    QCOMPARE(request.value(QStringLiteral("prompt")).toString(), QStringLiteral("Summarize"));
    QCOMPARE(request.value(QStringLiteral("stream")).toBool(true), false);
    const QJsonObject modelOptions = request.value(QStringLiteral("options")).toObject();
    QCOMPARE(modelOptions.value(QStringLiteral("temperature")).toDouble(), 0.3);
    QCOMPARE(modelOptions.value(QStringLiteral("num_ctx")).toInt(), 8192);
}

void TestOllamaBackend::testParseGenerateResponse()
{
    QCOMPARE(mm::OllamaBackend::parseGenerateResponse(R"({"response":"High","done":true})").value_or(QString()),
             QStringLiteral("High"));

    QString error;
    QVERIFY(!mm::OllamaBackend::parseGenerateResponse(R"({"error":"out of memory"})", &error));
    QCOMPARE(error, QStringLiteral("out of memory"));

    QVERIFY(!mm::OllamaBackend::parseGenerateResponse("not json", &error));
    QVERIFY(error.startsWith(QStringLiteral("Malformed")));

    QVERIFY(!mm::OllamaBackend::parseGenerateResponse(R"({"done":true})", &error));
}

void TestOllamaBackend::testParseModelList()
{
    const auto models = mm::OllamaBackend::parseModelList(
        R"({"models":[{"name":"llama3.1:8b"},{"model":"mistral:7b"},{"size":1}]})");
    QVERIFY(models.has_value());
    QCOMPARE(*models, (QStringList{QStringLiteral("llama3.1:8b"), QStringLiteral("mistral:7b")}));

    const auto empty = mm::OllamaBackend::parseModelList(R"({"models":[]})");
    QVERIFY(empty.has_value());
    QVERIFY(empty->isEmpty());

    QVERIFY(!mm::OllamaBackend::parseModelList("[").has_value());
}

void TestOllamaBackend::testConnectAndListModels()
{
    FakeOllamaServer server;
    QVERIFY(server.listen());
    mm::OllamaBackend backend(server.url(), 5000);

    QString error;
    auto first = backend.connect(&error);
    auto second = backend.connect(&error);
    QVERIFY2(first && second, qPrintable(error));
    QVERIFY(first->id() != second->id());

    const auto models = backend.listModels(&error);
    QVERIFY2(models.has_value(), qPrintable(error));
    QCOMPARE(models->size(), 2);
    QCOMPARE(mm::OllamaBackend::resolveModel(*models, QStringLiteral("qwen"), QStringLiteral("mistral"))
                 .value_or(QString()),
             QStringLiteral("mistral"));
    QCOMPARE(server.tagsRequests, 3);
}

void TestOllamaBackend::testGenerateRoundTrip()
{
    FakeOllamaServer server;
    QVERIFY(server.listen());
    mm::OllamaBackend backend(server.url(), 5000);
    auto handle = backend.connect();
    QVERIFY(handle);

    mm::GenerateOptions options;
    options.model = QStringLiteral("llama3.1:8b-instruct-q4_K_M");
    options.temperature = 0.2;
    options.timeoutMs = 5000;
    const mm::GenerateResult result = backend.generate(*handle, QStringLiteral("classify me"), options);

    QCOMPARE(result.status, mm::GenerateResult::Status::Success);
    QCOMPARE(result.text.value_or(QString()), QStringLiteral("echo:classify me"));
    QCOMPARE(server.lastGenerateRequest.value(QStringLiteral("model")).toString(), options.model);
    QCOMPARE(server.lastGenerateRequest.value(QStringLiteral("stream")).toBool(true), false);
}

void TestOllamaBackend::testGenerateMissingModel()
{
    FakeOllamaServer server;
    QVERIFY(server.listen());
    mm::OllamaBackend backend(server.url(), 5000);
    auto handle = backend.connect();
    QVERIFY(handle);

    mm::GenerateOptions options;
    options.model = QStringLiteral("missing");
    const mm::GenerateResult result = backend.generate(*handle, QStringLiteral("x"), options);
    QCOMPARE(result.status, mm::GenerateResult::Status::ModelError);
    QVERIFY(!result.text.has_value());
    QVERIFY(result.errorMessage.has_value());

    options.model.clear();
    QCOMPARE(backend.generate(*handle, QStringLiteral("x"), options).status,
             mm::GenerateResult::Status::ModelError);
}

void TestOllamaBackend::testGenerateTimeout()
{
    FakeOllamaServer server;
    QVERIFY(server.listen());
    mm::OllamaBackend backend(server.url(), 5000);
    auto handle = backend.connect();
    QVERIFY(handle);

    mm::GenerateOptions options;
    options.model = QStringLiteral("llama3.1:8b-instruct-q4_K_M");
    options.timeoutMs = 200;

    QElapsedTimer timer;
    timer.start();
    const mm::GenerateResult result = backend.generate(*handle, QStringLiteral("hang"), options);
    QCOMPARE(result.status, mm::GenerateResult::Status::Timeout);
    QVERIFY(timer.elapsed() < 3000);
}

void TestOllamaBackend::testConnectFailsWhenServerDown()
{
    quint16 port = 0;
    {
        QTcpServer portFinder;
        QVERIFY(portFinder.listen(QHostAddress::LocalHost));
        port = portFinder.serverPort();
    }

    mm::OllamaBackend backend(QUrl(QStringLiteral("http://127.0.0.1:%1").arg(port)), 2000);
    QString error;
    QVERIFY(!backend.connect(&error));
    QVERIFY(!error.isEmpty());
    QVERIFY(!backend.listModels(&error).has_value());
}

QTEST_MAIN(TestOllamaBackend)
#include "test_ollama_backend.moc"
