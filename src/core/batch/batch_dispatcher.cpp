#include "core/batch/batch_dispatcher.h"
#include "core/pool/backend_pool.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <deque>
#include <exception>
#include <thread>

namespace mm {

// Completion channel of one batch. Workers push finished indices, the
// coordinator drains them.
struct BatchDispatcher::Channel {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<size_t> completed;
    uint64_t startedVersion = 0;
    std::atomic<bool> cancelled{false};
};

namespace {

using BatchChannel = BatchDispatcher::Channel;
using Clock = std::chrono::steady_clock;

enum class TaskState {
    Queued,
    Running,
    Finished,
    TimedOut,
};

struct ItemTask {
    size_t index = 0;
    WorkItem item;
    int timeoutMs = 0;
    std::shared_ptr<BatchChannel> channel;

    // Guarded by channel->mutex.
    TaskState state = TaskState::Queued;
    Clock::time_point startedAt;
    int workerId = -1;
    ItemResult result;
};

int elapsedMs(Clock::time_point since)
{
    return static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - since).count());
}

} // anonymous namespace

struct BatchDispatcher::SharedState {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::shared_ptr<ItemTask>> queue;
    bool stopping = false;

    BackendPool* pool = nullptr;
    std::shared_ptr<ItemProcessor> processor;
    std::atomic<int> acquireTimeoutMs{BackendPool::kDefaultAcquireTimeoutMs};
};

struct BatchDispatcher::Worker {
    int id = 0;
    std::thread thread;
    std::atomic<bool> retired{false};
    std::atomic<bool> exited{false};
};

namespace {

ItemResult runTask(BatchDispatcher::SharedState& state, const ItemTask& task,
                   Clock::time_point startedAt)
{
    const int acquireMs = std::min(task.timeoutMs, state.acquireTimeoutMs.load());
    ErrorInfo acquireError;
    std::optional<PoolLease> lease = state.pool->acquire(acquireMs, &acquireError);
    if (!lease) {
        if (acquireError.code == CoreError::ResourceExhausted) {
            return ItemResult::timedOut(task.item.id, elapsedMs(startedAt));
        }
        return ItemResult::failure(task.item.id, acquireError.message, elapsedMs(startedAt));
    }

    try {
        QString error;
        std::optional<QJsonObject> payload = state.processor->process(task.item, lease->handle(), &error);
        lease->release();
        if (!payload) {
            return ItemResult::failure(task.item.id,
                                       error.isEmpty() ? QStringLiteral("Processing failed") : error,
                                       elapsedMs(startedAt));
        }
        return ItemResult::success(task.item.id, std::move(*payload), elapsedMs(startedAt));
    } catch (const std::exception& e) {
        LOG_WARN(mmBatch, "Item %s threw: %s", qUtf8Printable(task.item.id), e.what());
        return ItemResult::failure(task.item.id, QString::fromUtf8(e.what()), elapsedMs(startedAt));
    } catch (...) {
        LOG_WARN(mmBatch, "Item %s threw a non-standard exception", qUtf8Printable(task.item.id));
        return ItemResult::failure(task.item.id, QStringLiteral("Unknown exception"),
                                   elapsedMs(startedAt));
    }
}

void workerLoop(const std::shared_ptr<BatchDispatcher::SharedState>& state,
                const std::shared_ptr<BatchDispatcher::Worker>& worker)
{
    while (true) {
        std::shared_ptr<ItemTask> task;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            state->cv.wait(lock, [&] {
                return state->stopping || worker->retired.load() || !state->queue.empty();
            });
            if (state->stopping || worker->retired.load()) {
                return;
            }
            task = std::move(state->queue.front());
            state->queue.pop_front();
        }

        BatchChannel& channel = *task->channel;

        if (channel.cancelled.load()) {
            {
                std::lock_guard<std::mutex> lock(channel.mutex);
                task->state = TaskState::Finished;
                task->result = ItemResult::cancelled(task->item.id);
                channel.completed.push_back(task->index);
            }
            channel.cv.notify_all();
            continue;
        }

        const Clock::time_point startedAt = Clock::now();
        {
            std::lock_guard<std::mutex> lock(channel.mutex);
            task->state = TaskState::Running;
            task->startedAt = startedAt;
            task->workerId = worker->id;
            ++channel.startedVersion;
        }
        channel.cv.notify_all();

        ItemResult result = runTask(*state, *task, startedAt);

        {
            std::lock_guard<std::mutex> lock(channel.mutex);
            // A TimedOut task already has its slot filled by the coordinator.
            if (task->state == TaskState::Running) {
                task->state = TaskState::Finished;
                task->result = std::move(result);
                channel.completed.push_back(task->index);
            }
        }
        channel.cv.notify_all();

        if (worker->retired.load()) {
            LOG_DEBUG(mmBatch, "Retired worker %d exiting", worker->id);
            return;
        }
    }
}

} // anonymous namespace

// ── Lifecycle ───────────────────────────────────────────────

BatchDispatcher::BatchDispatcher(BackendPool* pool, std::shared_ptr<ItemProcessor> processor)
    : m_pool(pool)
    , m_processor(std::move(processor))
    , m_state(std::make_shared<SharedState>())
{
    m_state->pool = m_pool;
    m_state->processor = m_processor;
}

BatchDispatcher::~BatchDispatcher()
{
    std::lock_guard<std::mutex> batchLock(m_batchMutex);
    stopWorkers();
}

void BatchDispatcher::stopWorkers()
{
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->stopping = true;
    }
    m_state->cv.notify_all();

    std::vector<std::shared_ptr<Worker>> workers;
    {
        std::lock_guard<std::mutex> lock(m_workersMutex);
        workers.swap(m_workers);
        workers.insert(workers.end(), m_retired.begin(), m_retired.end());
        m_retired.clear();
    }
    for (auto& worker : workers) {
        if (worker->thread.joinable()) {
            worker->thread.join();
        }
    }
}

void BatchDispatcher::ensureWorkersLocked()
{
    const int target = std::max(1, m_pool->size());
    while (static_cast<int>(m_workers.size()) < target) {
        spawnWorkerLocked();
    }
}

void BatchDispatcher::spawnWorkerLocked()
{
    auto worker = std::make_shared<Worker>();
    worker->id = m_nextWorkerId++;
    std::shared_ptr<SharedState> state = m_state;
    worker->thread = std::thread([state, worker]() {
        workerLoop(state, worker);
        worker->exited.store(true);
    });
    m_workers.push_back(std::move(worker));
}

void BatchDispatcher::retireWorkerLocked(int workerId)
{
    auto it = std::find_if(m_workers.begin(), m_workers.end(),
                           [workerId](const std::shared_ptr<Worker>& w) { return w->id == workerId; });
    if (it == m_workers.end()) {
        return;
    }

    std::shared_ptr<Worker> worker = *it;
    m_workers.erase(it);
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        worker->retired.store(true);
    }
    m_state->cv.notify_all();

    // Join retired threads whose calls have since returned; the rest wait
    // for stopWorkers().
    m_retired.erase(std::remove_if(m_retired.begin(), m_retired.end(),
                                   [](const std::shared_ptr<Worker>& w) {
                                       if (!w->exited.load()) {
                                           return false;
                                       }
                                       w->thread.join();
                                       return true;
                                   }),
                    m_retired.end());
    m_retired.push_back(std::move(worker));

    LOG_WARN(mmBatch, "Worker %d retired after item timeout; spawning replacement", workerId);
    spawnWorkerLocked();
}

int BatchDispatcher::workerCount() const
{
    std::lock_guard<std::mutex> lock(m_workersMutex);
    return static_cast<int>(m_workers.size());
}

void BatchDispatcher::setAcquireTimeoutMs(int timeoutMs)
{
    m_state->acquireTimeoutMs.store(std::max(1, timeoutMs));
}

// ── Cancellation ────────────────────────────────────────────

bool BatchDispatcher::requestCancel()
{
    std::lock_guard<std::mutex> lock(m_activeMutex);
    if (!m_activeChannel) {
        LOG_DEBUG(mmBatch, "Cancel requested with no batch running");
        return false;
    }
    m_activeChannel->cancelled.store(true);
    LOG_INFO(mmBatch, "Batch cancellation requested");
    return true;
}

// ── Batch processing ────────────────────────────────────────

BatchResult BatchDispatcher::processBatch(const std::vector<WorkItem>& items,
                                          int perItemTimeoutMs,
                                          const ProgressCallback& progress)
{
    BatchResult batch;
    if (items.empty()) {
        return batch;
    }

    std::lock_guard<std::mutex> batchLock(m_batchMutex);

    QElapsedTimer timer;
    timer.start();

    const int timeoutMs = std::max(1, perItemTimeoutMs);
    const int total = static_cast<int>(items.size());
    batch.total = total;
    batch.results.resize(items.size());

    auto channel = std::make_shared<BatchChannel>();
    {
        std::lock_guard<std::mutex> lock(m_activeMutex);
        m_activeChannel = channel;
    }
    std::vector<std::shared_ptr<ItemTask>> tasks;
    tasks.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        auto task = std::make_shared<ItemTask>();
        task->index = i;
        task->item = items[i];
        task->timeoutMs = timeoutMs;
        task->channel = channel;
        tasks.push_back(std::move(task));
    }

    {
        std::lock_guard<std::mutex> lock(m_workersMutex);
        ensureWorkersLocked();
    }
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        for (const auto& task : tasks) {
            m_state->queue.push_back(task);
        }
    }
    m_state->cv.notify_all();

    LOG_INFO(mmBatch, "Processing batch of %d items (timeout=%d ms, workers=%d)",
             total, timeoutMs, workerCount());

    int completed = 0;
    uint64_t seenVersion = 0;
    while (completed < total) {
        std::vector<size_t> finished;
        std::vector<int> hungWorkers;
        {
            std::unique_lock<std::mutex> lock(channel->mutex);

            // Earliest deadline among running items; none means wait for an event.
            Clock::time_point deadline = Clock::time_point::max();
            for (const auto& task : tasks) {
                if (task->state == TaskState::Running) {
                    deadline = std::min(deadline,
                                        task->startedAt + std::chrono::milliseconds(task->timeoutMs));
                }
            }

            const auto ready = [&] {
                return !channel->completed.empty() || channel->startedVersion != seenVersion;
            };
            if (deadline == Clock::time_point::max()) {
                channel->cv.wait(lock, ready);
            } else {
                channel->cv.wait_until(lock, deadline, ready);
            }
            seenVersion = channel->startedVersion;

            while (!channel->completed.empty()) {
                finished.push_back(channel->completed.front());
                channel->completed.pop_front();
            }

            const Clock::time_point now = Clock::now();
            for (const auto& task : tasks) {
                if (task->state == TaskState::Running
                    && now >= task->startedAt + std::chrono::milliseconds(task->timeoutMs)) {
                    task->state = TaskState::TimedOut;
                    task->result = ItemResult::timedOut(task->item.id, task->timeoutMs);
                    finished.push_back(task->index);
                    hungWorkers.push_back(task->workerId);
                }
            }
        }

        if (!hungWorkers.empty()) {
            std::lock_guard<std::mutex> lock(m_workersMutex);
            for (int workerId : hungWorkers) {
                retireWorkerLocked(workerId);
            }
        }

        for (size_t index : finished) {
            ItemResult result;
            {
                std::lock_guard<std::mutex> lock(channel->mutex);
                result = tasks[index]->result;
            }
            if (result.status == ItemResult::Status::Timeout) {
                LOG_WARN(mmBatch, "Item %s timed out after %d ms",
                         qUtf8Printable(result.itemId), timeoutMs);
            }
            batch.results[index] = std::move(result);
            ++completed;

            if (progress) {
                try {
                    progress(completed, total);
                } catch (const std::exception& e) {
                    LOG_WARN(mmBatch, "Progress callback threw: %s", e.what());
                } catch (...) {
                    LOG_WARN(mmBatch, "Progress callback threw a non-standard exception");
                }
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_activeMutex);
        m_activeChannel.reset();
    }

    for (const ItemResult& r : batch.results) {
        if (r.ok()) {
            ++batch.success;
        } else {
            ++batch.failed;
        }
    }

    batch.elapsedSeconds = static_cast<double>(timer.nsecsElapsed()) / 1e9;
    batch.itemsPerMinute = static_cast<double>(total) / std::max(batch.elapsedSeconds, 0.001) * 60.0;

    LOG_INFO(mmBatch, "Batch complete: %d/%d succeeded in %.2fs (%.1f items/min)",
             batch.success, total, batch.elapsedSeconds, batch.itemsPerMinute);
    return batch;
}

std::future<BatchResult> BatchDispatcher::submitBatch(std::vector<WorkItem> items,
                                                      int perItemTimeoutMs,
                                                      ProgressCallback progress)
{
    return std::async(std::launch::async,
                      [this, items = std::move(items), perItemTimeoutMs,
                       progress = std::move(progress)]() {
                          return processBatch(items, perItemTimeoutMs, progress);
                      });
}

} // namespace mm
