#include <QtTest/QtTest>
#include "core/batch/batch_dispatcher.h"
#include "core/pool/backend_pool.h"
#include "fake_backend.h"

#include <QElapsedTimer>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace {

// Per-prompt behavior: "throw", "fail", "sleep:<ms>", anything else succeeds.
class ScriptedProcessor : public mm::ItemProcessor {
public:
    std::optional<QJsonObject> process(const mm::WorkItem& item,
                                       mm::BackendHandle& handle,
                                       QString* errorOut) override
    {
        m_calls.fetch_add(1);
        const int inFlight = m_inFlight.fetch_add(1) + 1;
        int seen = m_maxInFlight.load();
        while (inFlight > seen && !m_maxInFlight.compare_exchange_weak(seen, inFlight)) {
        }

        std::optional<QJsonObject> result;
        if (item.payload == QLatin1String("throw")) {
            m_inFlight.fetch_sub(1);
            throw std::runtime_error("model crashed");
        }
        if (item.payload.startsWith(QLatin1String("sleep:"))) {
            std::this_thread::sleep_for(std::chrono::milliseconds(item.payload.mid(6).toInt()));
        }
        if (item.payload == QLatin1String("fail")) {
            *errorOut = QStringLiteral("rejected");
        } else {
            QJsonObject obj;
            obj[QStringLiteral("item_id")] = item.id;
            obj[QStringLiteral("handle")] = handle.id();
            result = obj;
        }
        m_inFlight.fetch_sub(1);
        return result;
    }

    int calls() const { return m_calls.load(); }
    int inFlight() const { return m_inFlight.load(); }
    int maxInFlight() const { return m_maxInFlight.load(); }

private:
    std::atomic<int> m_calls{0};
    std::atomic<int> m_inFlight{0};
    std::atomic<int> m_maxInFlight{0};
};

std::vector<mm::WorkItem> makeItems(const QStringList& payloads)
{
    std::vector<mm::WorkItem> items;
    for (int i = 0; i < payloads.size(); ++i) {
        items.push_back({QStringLiteral("item-%1").arg(i), payloads.at(i)});
    }
    return items;
}

} // anonymous namespace

class TestBatchDispatcher : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testEmptyBatch();
    void testAllSucceed();
    void testFailureIsolation();
    void testConcurrencyBoundedByPool();
    void testHungWorkerIsReplaced();
    void testProgressIsMonotonic();
    void testCancelSuppressesQueuedItems();
    void testCancelBetweenBatchesIsIgnored();
    void testDestructorJoinsRetiredWorkers();
    void testSubmitBatchDeliversFuture();
    void testGenerateItemProcessor();

private:
    std::shared_ptr<mm::test::FakeBackend> m_backend;
    std::unique_ptr<mm::BackendPool> m_pool;
};

void TestBatchDispatcher::init()
{
    m_backend = std::make_shared<mm::test::FakeBackend>();
    m_pool = std::make_unique<mm::BackendPool>(m_backend);
    QVERIFY(m_pool->initialize(3));
}

void TestBatchDispatcher::cleanup()
{
    m_pool.reset();
    m_backend.reset();
}

void TestBatchDispatcher::testEmptyBatch()
{
    auto processor = std::make_shared<ScriptedProcessor>();
    mm::BatchDispatcher dispatcher(m_pool.get(), processor);

    int callbacks = 0;
    const mm::BatchResult result = dispatcher.processBatch({}, 1000, [&](int, int) { ++callbacks; });
    QCOMPARE(result.total, 0);
    QCOMPARE(result.success, 0);
    QCOMPARE(result.failed, 0);
    QVERIFY(result.results.empty());
    QCOMPARE(result.itemsPerMinute, 0.0);
    QCOMPARE(callbacks, 0);
    QCOMPARE(processor->calls(), 0);
    QCOMPARE(dispatcher.workerCount(), 0);
}

void TestBatchDispatcher::testAllSucceed()
{
    auto processor = std::make_shared<ScriptedProcessor>();
    mm::BatchDispatcher dispatcher(m_pool.get(), processor);

    const auto items = makeItems({QStringLiteral("a"), QStringLiteral("b"), QStringLiteral("c"),
                                  QStringLiteral("d"), QStringLiteral("e"), QStringLiteral("f")});
    const mm::BatchResult result = dispatcher.processBatch(items, 2000);

    QCOMPARE(result.total, 6);
    QCOMPARE(result.success, 6);
    QCOMPARE(result.failed, 0);
    QCOMPARE(static_cast<int>(result.results.size()), 6);
    for (size_t i = 0; i < items.size(); ++i) {
        QCOMPARE(result.results[i].itemId, items[i].id);
        QCOMPARE(result.results[i].payload.value(QStringLiteral("item_id")).toString(), items[i].id);
    }
    QVERIFY(result.elapsedSeconds > 0.0);
    QVERIFY(result.itemsPerMinute > 0.0);
    QCOMPARE(m_pool->stats().active, 0);
}

void TestBatchDispatcher::testFailureIsolation()
{
    auto processor = std::make_shared<ScriptedProcessor>();
    mm::BatchDispatcher dispatcher(m_pool.get(), processor);

    const auto items = makeItems({QStringLiteral("ok"), QStringLiteral("ok"),
                                  QStringLiteral("throw"), QStringLiteral("sleep:1500"),
                                  QStringLiteral("ok")});

    int callbacks = 0;
    const mm::BatchResult result = dispatcher.processBatch(items, 200, [&](int, int) {
        ++callbacks;
        throw std::runtime_error("observer bug");
    });

    QCOMPARE(result.total, 5);
    QCOMPARE(result.success, 3);
    QCOMPARE(result.failed, 2);
    QCOMPARE(callbacks, 5);

    QVERIFY(result.results[0].ok());
    QVERIFY(result.results[1].ok());
    QVERIFY(result.results[4].ok());

    const mm::ItemResult& thrown = result.results[2];
    QCOMPARE(thrown.status, mm::ItemResult::Status::Error);
    QVERIFY(thrown.error.contains(QStringLiteral("model crashed")));
    QCOMPARE(thrown.toJson().value(QStringLiteral("item_id")).toString(), QStringLiteral("item-2"));
    QCOMPARE(thrown.toJson().value(QStringLiteral("timeout")).toBool(), false);

    const mm::ItemResult& slow = result.results[3];
    QCOMPARE(slow.status, mm::ItemResult::Status::Timeout);
    QCOMPARE(slow.toJson().value(QStringLiteral("timeout")).toBool(), true);
    QCOMPARE(slow.toJson().value(QStringLiteral("item_id")).toString(), QStringLiteral("item-3"));

    // The retired worker still holds its lease until the slow call returns.
    QTRY_COMPARE_WITH_TIMEOUT(m_pool->stats().active, 0, 5000);
}

void TestBatchDispatcher::testConcurrencyBoundedByPool()
{
    auto processor = std::make_shared<ScriptedProcessor>();
    mm::BatchDispatcher dispatcher(m_pool.get(), processor);

    QStringList payloads;
    for (int i = 0; i < 12; ++i) {
        payloads << QStringLiteral("sleep:30");
    }
    const mm::BatchResult result = dispatcher.processBatch(makeItems(payloads), 5000);

    QCOMPARE(result.success, 12);
    QCOMPARE(dispatcher.workerCount(), 3);
    QVERIFY(processor->maxInFlight() <= 3);
    QVERIFY(processor->maxInFlight() >= 2);
}

void TestBatchDispatcher::testHungWorkerIsReplaced()
{
    auto processor = std::make_shared<ScriptedProcessor>();
    mm::BatchDispatcher dispatcher(m_pool.get(), processor);

    // Two hung items occupy two workers; the rest must still be processed.
    const auto items = makeItems({QStringLiteral("sleep:1000"), QStringLiteral("sleep:1000"),
                                  QStringLiteral("a"), QStringLiteral("b"), QStringLiteral("c")});
    const mm::BatchResult result = dispatcher.processBatch(items, 150);

    QCOMPARE(result.results[0].status, mm::ItemResult::Status::Timeout);
    QCOMPARE(result.results[1].status, mm::ItemResult::Status::Timeout);
    QCOMPARE(result.success, 3);
    QCOMPARE(dispatcher.workerCount(), 3);
    QVERIFY(result.elapsedSeconds < 1.0);

    QTRY_COMPARE_WITH_TIMEOUT(m_pool->stats().active, 0, 5000);
}

void TestBatchDispatcher::testProgressIsMonotonic()
{
    auto processor = std::make_shared<ScriptedProcessor>();
    mm::BatchDispatcher dispatcher(m_pool.get(), processor);

    QStringList payloads;
    for (int i = 0; i < 10; ++i) {
        payloads << QStringLiteral("sleep:%1").arg((i * 7) % 20);
    }

    const std::thread::id caller = std::this_thread::get_id();
    std::vector<int> seen;
    bool onCaller = true;
    dispatcher.processBatch(makeItems(payloads), 5000, [&](int done, int total) {
        QCOMPARE(total, 10);
        seen.push_back(done);
        onCaller = onCaller && std::this_thread::get_id() == caller;
    });

    QCOMPARE(static_cast<int>(seen.size()), 10);
    for (int i = 0; i < 10; ++i) {
        QCOMPARE(seen[static_cast<size_t>(i)], i + 1);
    }
    QVERIFY(onCaller);
}

void TestBatchDispatcher::testCancelSuppressesQueuedItems()
{
    auto processor = std::make_shared<ScriptedProcessor>();
    mm::BatchDispatcher dispatcher(m_pool.get(), processor);

    QStringList payloads;
    for (int i = 0; i < 9; ++i) {
        payloads << QStringLiteral("sleep:100");
    }

    const mm::BatchResult result = dispatcher.processBatch(makeItems(payloads), 5000,
        [&](int done, int) {
            if (done == 1) {
                dispatcher.requestCancel();
            }
        });

    QCOMPARE(result.total, 9);
    QCOMPARE(result.success + result.failed, 9);
    int cancelled = 0;
    for (const mm::ItemResult& r : result.results) {
        if (r.status == mm::ItemResult::Status::Cancelled) {
            ++cancelled;
        }
    }
    QVERIFY(cancelled > 0);
    QCOMPARE(result.failed, cancelled);
    QVERIFY(processor->calls() < 9);

    const mm::BatchResult next = dispatcher.processBatch(makeItems({QStringLiteral("x")}), 1000);
    QCOMPARE(next.success, 1);
}

void TestBatchDispatcher::testCancelBetweenBatchesIsIgnored()
{
    auto processor = std::make_shared<ScriptedProcessor>();
    mm::BatchDispatcher dispatcher(m_pool.get(), processor);

    QVERIFY(!dispatcher.requestCancel());

    const mm::BatchResult first = dispatcher.processBatch(
        makeItems({QStringLiteral("a"), QStringLiteral("b")}), 1000);
    QCOMPARE(first.success, 2);

    QVERIFY(!dispatcher.requestCancel());

    const mm::BatchResult second = dispatcher.processBatch(
        makeItems({QStringLiteral("c"), QStringLiteral("d"), QStringLiteral("e"),
                   QStringLiteral("f")}), 1000);
    QCOMPARE(second.total, 4);
    QCOMPARE(second.success, 4);
    QCOMPARE(second.failed, 0);
    QCOMPARE(processor->calls(), 6);
}

void TestBatchDispatcher::testDestructorJoinsRetiredWorkers()
{
    auto processor = std::make_shared<ScriptedProcessor>();
    QElapsedTimer timer;
    {
        mm::BatchDispatcher dispatcher(m_pool.get(), processor);
        const mm::BatchResult result = dispatcher.processBatch(
            makeItems({QStringLiteral("sleep:800"), QStringLiteral("a")}), 100);
        QCOMPARE(result.results[0].status, mm::ItemResult::Status::Timeout);
        QCOMPARE(result.success, 1);

        // The retired worker is still inside its call.
        QCOMPARE(processor->inFlight(), 1);
        timer.start();
    }

    QCOMPARE(processor->inFlight(), 0);
    QVERIFY(timer.elapsed() >= 300);
    QCOMPARE(m_pool->stats().active, 0);
}

void TestBatchDispatcher::testSubmitBatchDeliversFuture()
{
    auto processor = std::make_shared<ScriptedProcessor>();
    mm::BatchDispatcher dispatcher(m_pool.get(), processor);

    std::future<mm::BatchResult> future = dispatcher.submitBatch(
        makeItems({QStringLiteral("a"), QStringLiteral("fail"), QStringLiteral("c")}), 2000);
    QVERIFY(future.wait_for(std::chrono::seconds(5)) == std::future_status::ready);

    const mm::BatchResult result = future.get();
    QCOMPARE(result.success, 2);
    QCOMPARE(result.failed, 1);
    QCOMPARE(result.results[1].status, mm::ItemResult::Status::Error);
    QCOMPARE(result.results[1].error, QStringLiteral("rejected"));
}

void TestBatchDispatcher::testGenerateItemProcessor()
{
    m_backend->setGenerateHandler([](const QString& prompt) {
        mm::GenerateResult r;
        if (prompt == QLatin1String("bad")) {
            r.status = mm::GenerateResult::Status::ModelError;
            r.errorMessage = QStringLiteral("model not found");
        } else {
            r.status = mm::GenerateResult::Status::Success;
            r.text = prompt.toUpper();
        }
        return r;
    });

    mm::GenerateOptions options;
    options.model = QStringLiteral("llama3.1:8b-instruct-q4_K_M");
    mm::BatchDispatcher dispatcher(
        m_pool.get(), std::make_shared<mm::GenerateItemProcessor>(m_backend, options));

    const mm::BatchResult result = dispatcher.processBatch(
        makeItems({QStringLiteral("hello"), QStringLiteral("bad"), QStringLiteral("  ")}), 2000);

    QCOMPARE(result.success, 1);
    QCOMPARE(result.results[0].payload.value(QStringLiteral("response")).toString(),
             QStringLiteral("HELLO"));
    QCOMPARE(result.results[0].payload.value(QStringLiteral("model")).toString(), options.model);
    QVERIFY(result.results[1].error.contains(QStringLiteral("model not found")));
    QCOMPARE(result.results[2].status, mm::ItemResult::Status::Error);
    QCOMPARE(m_backend->generateCalls(), 2);
}

QTEST_MAIN(TestBatchDispatcher)
#include "test_batch_dispatcher.moc"
