#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "BundleError.h"

namespace SnAPI::GraphBundle
{

// Shared failure flag. Checked between work units, never mid-unit.
class CancellationToken
{
public:
    CancellationToken() : m_Cancelled(std::make_shared<std::atomic<bool>>(false)) {}

    void Cancel() { m_Cancelled->store(true, std::memory_order_release); }
    bool IsCancelled() const { return m_Cancelled->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> m_Cancelled;
};

// Fixed pool of worker threads used by the data-parallel load stages
class WorkerPool
{
public:
    using UnitFn = std::function<BundleResult<void>(size_t)>;

    // 0 = hardware concurrency - 1, 1 = no threads (everything runs on the caller)
    explicit WorkerPool(uint32_t NumThreads = 0);
    ~WorkerPool();

    uint32_t GetThreadCount() const { return static_cast<uint32_t>(m_Workers.size()); }

    // Run Fn(0..Count-1). Units are claimed in index order; after the first failure the token
    // is cancelled and no further units start. Returns the error of the lowest failing index.
    BundleResult<void> ParallelFor(size_t Count, const UnitFn& Fn, CancellationToken& Token);

    // Stops and joins the workers
    void Shutdown();

    // Non-copyable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

private:
    void WorkerThread();
    void Submit(std::function<void()> Job);

    std::vector<std::thread> m_Workers;
    std::queue<std::function<void()>> m_Queue;
    std::mutex m_QueueMutex;
    std::condition_variable m_QueueCV;
    std::atomic<bool> m_Shutdown{false};
};

} // namespace SnAPI::GraphBundle
