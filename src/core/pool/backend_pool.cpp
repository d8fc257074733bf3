#include "core/pool/backend_pool.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <vector>

namespace mm {

struct PoolState {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::unique_ptr<BackendHandle>> idle;
    int total = 0;
    int active = 0;
    int configuredSize = 0;
    bool initialized = false;
    bool shutdown = false;

    void giveBack(std::unique_ptr<BackendHandle> handle)
    {
        std::unique_ptr<BackendHandle> discarded;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (active > 0) {
                --active;
            }
            if (shutdown) {
                --total;
                discarded = std::move(handle);
            } else {
                idle.push_back(std::move(handle));
            }
        }
        cv.notify_one();
        // `discarded` is destroyed here, outside the lock.
    }
};

// ── PoolLease ───────────────────────────────────────────────

PoolLease::PoolLease(std::shared_ptr<PoolState> state, std::unique_ptr<BackendHandle> handle)
    : m_state(std::move(state))
    , m_handle(std::move(handle))
{
}

PoolLease::~PoolLease()
{
    release();
}

PoolLease::PoolLease(PoolLease&& other) noexcept
    : m_state(std::move(other.m_state))
    , m_handle(std::move(other.m_handle))
{
}

PoolLease& PoolLease::operator=(PoolLease&& other) noexcept
{
    if (this != &other) {
        release();
        m_state = std::move(other.m_state);
        m_handle = std::move(other.m_handle);
    }
    return *this;
}

void PoolLease::release()
{
    if (m_state && m_handle) {
        LOG_DEBUG(mmPool, "Releasing handle %d", m_handle->id());
        m_state->giveBack(std::move(m_handle));
    }
    m_handle.reset();
    m_state.reset();
}

// ── BackendPool ─────────────────────────────────────────────

BackendPool::BackendPool(std::shared_ptr<InferenceBackend> backend)
    : m_backend(std::move(backend))
    , m_state(std::make_shared<PoolState>())
{
}

BackendPool::~BackendPool()
{
    shutdown();
}

bool BackendPool::initialize(int size, ErrorInfo* errorOut)
{
    if (size < kMinSize || size > kMaxSize) {
        LOG_WARN(mmPool, "Rejected pool size %d (allowed %d-%d)", size, kMinSize, kMaxSize);
        return setError(errorOut, CoreError::ValidationError,
                        QStringLiteral("Pool size must be between %1 and %2, got %3")
                            .arg(kMinSize).arg(kMaxSize).arg(size));
    }
    if (!m_backend) {
        return setError(errorOut, CoreError::BackendUnavailable,
                        QStringLiteral("No inference backend configured"));
    }

    // Serializes concurrent initialize() calls; acquire() never takes it.
    std::lock_guard<std::mutex> initLock(m_initMutex);
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (m_state->initialized) {
            LOG_DEBUG(mmPool, "initialize() on an initialized pool, ignoring");
            return true;
        }
        if (m_state->shutdown) {
            return setError(errorOut, CoreError::NotInitialized,
                            QStringLiteral("Pool has been shut down"));
        }
    }

    std::vector<std::unique_ptr<BackendHandle>> handles;
    handles.reserve(static_cast<size_t>(size));
    for (int i = 0; i < size; ++i) {
        QString connectError;
        std::unique_ptr<BackendHandle> handle = m_backend->connect(&connectError);
        if (!handle) {
            LOG_ERROR(mmPool, "Backend connection %d/%d failed: %s",
                      i + 1, size, qUtf8Printable(connectError));
            return setError(errorOut, CoreError::BackendUnavailable,
                            QStringLiteral("Failed to connect to inference backend: %1")
                                .arg(connectError));
        }
        handles.push_back(std::move(handle));
    }

    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        for (auto& handle : handles) {
            m_state->idle.push_back(std::move(handle));
        }
        m_state->total = size;
        m_state->active = 0;
        m_state->configuredSize = size;
        m_state->initialized = true;
    }
    m_state->cv.notify_all();

    LOG_INFO(mmPool, "Backend pool initialized with %d handles", size);
    return true;
}

std::optional<PoolLease> BackendPool::acquire(int timeoutMs, ErrorInfo* errorOut)
{
    const auto deadline = std::chrono::steady_clock::now()
        + std::chrono::milliseconds(std::max(0, timeoutMs));

    std::unique_ptr<BackendHandle> handle;
    {
        std::unique_lock<std::mutex> lock(m_state->mutex);
        if (!m_state->initialized || m_state->shutdown) {
            setError(errorOut, CoreError::NotInitialized,
                     QStringLiteral("Backend pool not initialized"));
            return std::nullopt;
        }

        const bool ready = m_state->cv.wait_until(lock, deadline, [this] {
            return m_state->shutdown || !m_state->idle.empty();
        });

        if (m_state->shutdown) {
            setError(errorOut, CoreError::NotInitialized,
                     QStringLiteral("Backend pool shut down while waiting"));
            return std::nullopt;
        }
        if (!ready) {
            LOG_WARN(mmPool, "acquire() timed out after %d ms (active=%d, total=%d)",
                     timeoutMs, m_state->active, m_state->total);
            setError(errorOut, CoreError::ResourceExhausted,
                     QStringLiteral("No backend handle available within %1 ms").arg(timeoutMs));
            return std::nullopt;
        }

        handle = std::move(m_state->idle.front());
        m_state->idle.pop_front();
        ++m_state->active;
    }

    LOG_DEBUG(mmPool, "Leased handle %d", handle->id());
    return PoolLease(m_state, std::move(handle));
}

PoolStats BackendPool::stats() const
{
    std::lock_guard<std::mutex> lock(m_state->mutex);
    PoolStats s;
    s.total = m_state->total;
    s.active = m_state->active;
    s.idle = static_cast<int>(m_state->idle.size());
    return s;
}

bool BackendPool::healthCheck() const
{
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->initialized && !m_state->shutdown && m_state->total > 0;
}

int BackendPool::size() const
{
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->configuredSize;
}

void BackendPool::shutdown()
{
    std::deque<std::unique_ptr<BackendHandle>> drained;
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (m_state->shutdown) {
            return;
        }
        m_state->shutdown = true;
        m_state->total -= static_cast<int>(m_state->idle.size());
        drained.swap(m_state->idle);
        if (m_state->initialized) {
            LOG_INFO(mmPool, "Backend pool shutting down (leased=%d)", m_state->active);
        }
    }
    m_state->cv.notify_all();
}

} // namespace mm
