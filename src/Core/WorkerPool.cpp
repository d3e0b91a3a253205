#include "WorkerPool.h"

#include <algorithm>
#include <limits>

namespace SnAPI::GraphBundle
{

  namespace
  {
    struct BatchState
    {
        std::atomic<size_t> NextUnit{0};
        size_t Count = 0;

        std::mutex Mutex;
        std::condition_variable DoneCV;
        size_t RunnersLeft = 0;

        size_t ErrorIndex = std::numeric_limits<size_t>::max();
        BundleError Error;
    };

    void RunUnits(BatchState& Batch, const WorkerPool::UnitFn& Fn, CancellationToken& Token)
    {
      while (!Token.IsCancelled())
      {
        const size_t Index = Batch.NextUnit.fetch_add(1);
        if (Index >= Batch.Count)
        {
          break;
        }

        BundleResult<void> Result;
        try
        {
          Result = Fn(Index);
        }
        catch (const std::bad_alloc&)
        {
          Result = MakeError(EBundleErrorCode::AllocationFailed, "Out of memory in work unit " + std::to_string(Index));
        }

        if (!Result.has_value())
        {
          std::lock_guard Lock(Batch.Mutex);
          if (Index < Batch.ErrorIndex)
          {
            Batch.ErrorIndex = Index;
            Batch.Error = std::move(Result.error());
          }
          Token.Cancel();
        }
      }
    }
  } // namespace

  WorkerPool::WorkerPool(uint32_t NumThreads)
  {
    if (NumThreads == 0)
    {
      NumThreads = std::max(1u, std::thread::hardware_concurrency() - 1);
    }

    // A single thread means the caller does all the work
    if (NumThreads <= 1)
    {
      return;
    }

    m_Workers.reserve(NumThreads);
    for (uint32_t I = 0; I < NumThreads; ++I)
    {
      m_Workers.emplace_back(&WorkerPool::WorkerThread, this);
    }
  }

  WorkerPool::~WorkerPool()
  {
    Shutdown();
  }

  void WorkerPool::WorkerThread()
  {
    while (true)
    {
      std::function<void()> Job;

      {
        std::unique_lock Lock(m_QueueMutex);
        m_QueueCV.wait(Lock, [this] { return m_Shutdown.load() || !m_Queue.empty(); });

        if (m_Shutdown.load() && m_Queue.empty())
        {
          return;
        }

        Job = std::move(m_Queue.front());
        m_Queue.pop();
      }

      Job();
    }
  }

  void WorkerPool::Submit(std::function<void()> Job)
  {
    {
      std::lock_guard Lock(m_QueueMutex);
      m_Queue.push(std::move(Job));
    }
    m_QueueCV.notify_one();
  }

  BundleResult<void> WorkerPool::ParallelFor(size_t Count, const UnitFn& Fn, CancellationToken& Token)
  {
    if (Count == 0 || Token.IsCancelled())
    {
      return {};
    }

    auto Batch = std::make_shared<BatchState>();
    Batch->Count = Count;

    // The calling thread is one of the runners
    const size_t Helpers = std::min<size_t>(m_Workers.size(), Count - 1);
    Batch->RunnersLeft = Helpers;

    for (size_t I = 0; I < Helpers; ++I)
    {
      Submit([Batch, &Fn, &Token] {
        RunUnits(*Batch, Fn, Token);
        std::lock_guard Lock(Batch->Mutex);
        if (--Batch->RunnersLeft == 0)
        {
          Batch->DoneCV.notify_all();
        }
      });
    }

    RunUnits(*Batch, Fn, Token);

    std::unique_lock Lock(Batch->Mutex);
    Batch->DoneCV.wait(Lock, [&Batch] { return Batch->RunnersLeft == 0; });

    if (Batch->ErrorIndex != std::numeric_limits<size_t>::max())
    {
      return std::unexpected(std::move(Batch->Error));
    }
    if (Token.IsCancelled())
    {
      return MakeError(EBundleErrorCode::InvalidState, "Work cancelled");
    }
    return {};
  }

  void WorkerPool::Shutdown()
  {
    m_Shutdown.store(true);
    m_QueueCV.notify_all();

    for (auto& Worker : m_Workers)
    {
      if (Worker.joinable())
      {
        Worker.join();
      }
    }
    m_Workers.clear();
  }

} // namespace SnAPI::GraphBundle
