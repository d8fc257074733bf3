#include "fake_backend.h"

#include <QElapsedTimer>

namespace mm::test {

namespace {

class FakeHandle : public BackendHandle {
public:
    FakeHandle(int id, std::shared_ptr<std::atomic<int>> live)
        : BackendHandle(id)
        , m_live(std::move(live))
    {
        m_live->fetch_add(1);
    }
    ~FakeHandle() override { m_live->fetch_sub(1); }

private:
    std::shared_ptr<std::atomic<int>> m_live;
};

} // anonymous namespace

FakeBackend::FakeBackend()
    : m_liveHandles(std::make_shared<std::atomic<int>>(0))
{
}

FakeBackend::~FakeBackend() = default;

std::unique_ptr<BackendHandle> FakeBackend::connect(QString* errorOut)
{
    const int call = m_connectCalls.fetch_add(1);
    const int limit = m_failConnectAfter.load();
    if (limit >= 0 && call >= limit) {
        if (errorOut) {
            *errorOut = QStringLiteral("connection refused (scripted)");
        }
        return nullptr;
    }
    return std::make_unique<FakeHandle>(m_nextId.fetch_add(1), m_liveHandles);
}

std::optional<QStringList> FakeBackend::listModels(QString* errorOut)
{
    Q_UNUSED(errorOut);
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_models;
}

GenerateResult FakeBackend::generate(BackendHandle& handle,
                                     const QString& prompt,
                                     const GenerateOptions& options)
{
    Q_UNUSED(handle);
    Q_UNUSED(options);

    m_generateCalls.fetch_add(1);
    const int inFlight = m_inFlight.fetch_add(1) + 1;
    int seen = m_maxInFlight.load();
    while (inFlight > seen && !m_maxInFlight.compare_exchange_weak(seen, inFlight)) {
    }

    GenerateHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        handler = m_handler;
    }

    QElapsedTimer timer;
    timer.start();
    GenerateResult result;
    if (handler) {
        result = handler(prompt);
    } else {
        result.status = GenerateResult::Status::Success;
        result.text = QStringLiteral("echo: ") + prompt;
    }
    result.durationMs = static_cast<int>(timer.elapsed());

    m_inFlight.fetch_sub(1);
    return result;
}

void FakeBackend::setFailConnectAfter(int successes)
{
    m_failConnectAfter.store(successes);
}

void FakeBackend::setGenerateHandler(GenerateHandler handler)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handler = std::move(handler);
}

void FakeBackend::setModels(const QStringList& models)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_models = models;
}

} // namespace mm::test
