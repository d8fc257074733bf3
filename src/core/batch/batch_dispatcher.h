#pragma once

#include "core/batch/batch_types.h"
#include "core/batch/item_processor.h"

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <vector>

namespace mm {

class BackendPool;

// BatchDispatcher -- runs WorkItems concurrently over a BackendPool.
//
// A fixed set of worker threads (one per pool handle, created on the first
// batch) pulls items from a shared queue. For each item a worker leases a
// handle, calls the ItemProcessor, and releases the lease before taking the
// next item. The calling thread coordinates: it collects completions,
// enforces the per-item timeout, and fires the progress callback.
//
// Failure isolation: a processor error or exception yields an Error slot;
// an item still running perItemTimeoutMs after pickup yields a Timeout slot
// and its worker is retired and replaced, so the batch never stalls on a
// hung call. The retired thread exits once its call returns and is joined
// when the dispatcher is destroyed.
//
// One batch runs at a time; concurrent processBatch() calls queue up.
class BatchDispatcher {
public:
    using ProgressCallback = std::function<void(int completed, int total)>;

    static constexpr int kDefaultItemTimeoutMs = 30000;

    // `pool` is not owned and must outlive the dispatcher.
    BatchDispatcher(BackendPool* pool, std::shared_ptr<ItemProcessor> processor);
    ~BatchDispatcher();

    BatchDispatcher(const BatchDispatcher&) = delete;
    BatchDispatcher& operator=(const BatchDispatcher&) = delete;

    // Process all items and block until every one has a result.
    // Callback exceptions are logged and ignored.
    BatchResult processBatch(const std::vector<WorkItem>& items,
                             int perItemTimeoutMs = kDefaultItemTimeoutMs,
                             const ProgressCallback& progress = {});

    // processBatch() on a background thread. The dispatcher must outlive
    // the returned future.
    std::future<BatchResult> submitBatch(std::vector<WorkItem> items,
                                         int perItemTimeoutMs = kDefaultItemTimeoutMs,
                                         ProgressCallback progress = {});

    // Upper bound on waiting for a pool lease; the wait is further capped
    // by the per-item timeout.
    void setAcquireTimeoutMs(int timeoutMs);

    // Cancel the batch currently running. Its items not yet picked up by a
    // worker finish as Cancelled; in-flight items run to completion or
    // timeout. Returns false when no batch is running. Later batches are
    // unaffected.
    bool requestCancel();

    int workerCount() const;

    struct Worker;
    struct SharedState;
    struct Channel;

private:
    void ensureWorkersLocked();
    void spawnWorkerLocked();
    void retireWorkerLocked(int workerId);
    void stopWorkers();

    BackendPool* m_pool = nullptr;
    std::shared_ptr<ItemProcessor> m_processor;
    std::shared_ptr<SharedState> m_state;

    std::mutex m_batchMutex;                    // one batch at a time
    mutable std::mutex m_workersMutex;
    std::vector<std::shared_ptr<Worker>> m_workers;
    std::vector<std::shared_ptr<Worker>> m_retired; // joined in stopWorkers()
    int m_nextWorkerId = 0;

    std::mutex m_activeMutex;
    std::shared_ptr<Channel> m_activeChannel;
};

} // namespace mm
