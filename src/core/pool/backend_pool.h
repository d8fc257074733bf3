#pragma once

#include "core/backend/inference_backend.h"
#include "core/shared/errors.h"

#include <memory>
#include <mutex>
#include <optional>

namespace mm {

struct PoolStats {
    int total = 0;
    int active = 0;
    int idle = 0;
};

// Bookkeeping shared between a pool and its outstanding leases; defined
// in backend_pool.cpp. Leases keep it alive, so a handle returned after
// the pool is gone is simply dropped.
struct PoolState;

// PoolLease -- exclusive, scoped ownership of one pooled handle.
//
// The handle goes back to the pool when the lease is destroyed or
// release() is called, including during stack unwinding.
class PoolLease {
public:
    PoolLease() = default;
    ~PoolLease();

    PoolLease(PoolLease&& other) noexcept;
    PoolLease& operator=(PoolLease&& other) noexcept;
    PoolLease(const PoolLease&) = delete;
    PoolLease& operator=(const PoolLease&) = delete;

    bool isValid() const { return m_handle != nullptr; }
    BackendHandle& handle() const { return *m_handle; }
    BackendHandle* operator->() const { return m_handle.get(); }

    // Return the handle early. No-op on an empty lease.
    void release();

private:
    friend class BackendPool;
    PoolLease(std::shared_ptr<PoolState> state, std::unique_ptr<BackendHandle> handle);

    std::shared_ptr<PoolState> m_state;
    std::unique_ptr<BackendHandle> m_handle;
};

// BackendPool -- bounded set of reusable inference-backend handles.
//
// Invariants:
//   active + idle == total at every observable instant (stats() reads all
//   three under one lock), and no handle is leased to two holders at once.
//
// acquire() blocks on a condition variable until a handle is idle or the
// timeout elapses; the lock is held only for queue bookkeeping, never for
// backend work.
class BackendPool {
public:
    static constexpr int kMinSize = 2;
    static constexpr int kMaxSize = 5;
    static constexpr int kDefaultSize = 3;
    static constexpr int kDefaultAcquireTimeoutMs = 30000;

    explicit BackendPool(std::shared_ptr<InferenceBackend> backend);
    ~BackendPool();

    BackendPool(const BackendPool&) = delete;
    BackendPool& operator=(const BackendPool&) = delete;
    BackendPool(BackendPool&&) = delete;
    BackendPool& operator=(BackendPool&&) = delete;

    // Connect `size` handles eagerly. Fails with ValidationError when size
    // is outside [kMinSize, kMaxSize] and BackendUnavailable when any
    // connection fails (no handles are kept in that case). Calling again
    // after success is a no-op.
    bool initialize(int size = kDefaultSize, ErrorInfo* errorOut = nullptr);

    // Lease a handle, waiting up to timeoutMs. Fails with ResourceExhausted
    // on timeout and NotInitialized before initialize() or after shutdown().
    std::optional<PoolLease> acquire(int timeoutMs = kDefaultAcquireTimeoutMs,
                                     ErrorInfo* errorOut = nullptr);

    PoolStats stats() const;

    // True iff initialize() succeeded and the pool has not been shut down.
    bool healthCheck() const;

    // Configured handle count; 0 before initialize().
    int size() const;

    // Drop idle handles and wake blocked acquirers. Leased handles are
    // destroyed when their lease ends.
    void shutdown();

    InferenceBackend& backend() const { return *m_backend; }

private:
    std::shared_ptr<InferenceBackend> m_backend;
    std::shared_ptr<PoolState> m_state;
    mutable std::mutex m_initMutex;
};

} // namespace mm
