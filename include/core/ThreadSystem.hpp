/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 *
 * Thread System: worker pool with prioritized queues. Runs room batches of
 * attack ticker fires and out-of-band persistence retries.
 */

#ifndef THREAD_SYSTEM_HPP
#define THREAD_SYSTEM_HPP

#include "core/Logger.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#if defined(__linux__) || defined(__APPLE__) || defined(_GNU_SOURCE)
#include <pthread.h>
#endif

namespace AnchorMud {

// Task priority levels
enum class TaskPriority {
  Critical = 0, // Must execute ASAP (combat room batches)
  High = 1,     // Important tasks
  Normal = 2,   // Default priority for most tasks
  Low = 3,      // Background tasks (persistence retries)
  Idle = 4      // Only execute when nothing else is pending
};

// Task wrapper with priority information
struct PrioritizedTask {
  std::function<void()> task;
  TaskPriority priority;
  std::chrono::steady_clock::time_point enqueueTime;
  std::string description;

  PrioritizedTask()
      : priority(TaskPriority::Normal),
        enqueueTime(std::chrono::steady_clock::now()) {}

  PrioritizedTask(std::function<void()> t, TaskPriority p,
                  std::string desc = "")
      : task(std::move(t)), priority(p),
        enqueueTime(std::chrono::steady_clock::now()),
        description(std::move(desc)) {}
};

/**
 * @brief Thread-safe queue with one deque per priority level.
 *
 * pop() always serves the highest non-empty priority first; within one
 * priority tasks are FIFO.
 */
class TaskQueue {
public:
  static constexpr size_t PRIORITY_COUNT =
      static_cast<size_t>(TaskPriority::Idle) + 1;

  void push(std::function<void()> task,
            TaskPriority priority = TaskPriority::Normal,
            const std::string &description = "") {
    {
      std::lock_guard<std::mutex> lock(m_queueMutex);
      m_priorityQueues[static_cast<size_t>(priority)].emplace_back(
          std::move(task), priority, description);
      m_pendingCount.fetch_add(1, std::memory_order_relaxed);
    }

    // Notify all for critical, otherwise notify one.
    if (priority == TaskPriority::Critical) {
      m_condition.notify_all();
    } else {
      m_condition.notify_one();
    }
  }

  bool pop(PrioritizedTask &out) {
    std::unique_lock<std::mutex> lock(m_queueMutex);
    m_condition.wait(lock, [this] {
      return m_stopping.load(std::memory_order_acquire) ||
             m_pendingCount.load(std::memory_order_relaxed) > 0;
    });

    if (m_stopping.load(std::memory_order_acquire)) {
      return false;
    }

    for (auto &queue : m_priorityQueues) {
      if (!queue.empty()) {
        out = std::move(queue.front());
        queue.pop_front();
        m_pendingCount.fetch_sub(1, std::memory_order_relaxed);
        return true;
      }
    }
    return false;
  }

  void stop() {
    {
      std::lock_guard<std::mutex> lock(m_queueMutex);
      m_stopping.store(true, std::memory_order_release);
      for (auto &queue : m_priorityQueues) {
        queue.clear();
      }
      m_pendingCount.store(0, std::memory_order_relaxed);
    }
    m_condition.notify_all();
  }

  [[nodiscard]] size_t size() const {
    return m_pendingCount.load(std::memory_order_relaxed);
  }

  [[nodiscard]] bool isEmpty() const { return size() == 0; }

private:
  std::array<std::deque<PrioritizedTask>, PRIORITY_COUNT> m_priorityQueues;
  mutable std::mutex m_queueMutex;
  std::condition_variable m_condition;
  std::atomic<size_t> m_pendingCount{0};
  std::atomic<bool> m_stopping{false};
};

class ThreadPool {
public:
  explicit ThreadPool(size_t numThreads) {
    m_workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
      m_workers.emplace_back([this, i] {
#if defined(__linux__) || defined(_GNU_SOURCE)
        std::string threadName = "Worker-" + std::to_string(i);
        pthread_setname_np(pthread_self(), threadName.c_str());
#elif defined(__APPLE__)
        std::string threadName = "Worker-" + std::to_string(i);
        pthread_setname_np(threadName.c_str());
#endif
        workerThread(i);
      });
    }
  }

  ~ThreadPool() {
    m_isRunning.store(false, std::memory_order_release);
    m_taskQueue.stop();

    for (auto &worker : m_workers) {
      if (worker.joinable()) {
        worker.join();
      }
    }
    THREADSYSTEM_INFO("ThreadPool shutdown completed");
  }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  void enqueue(std::function<void()> task,
               TaskPriority priority = TaskPriority::Normal,
               const std::string &description = "") {
    m_taskQueue.push(std::move(task), priority, description);
    m_totalTasksEnqueued.fetch_add(1, std::memory_order_relaxed);
  }

  template <class F, class... Args>
  auto enqueueWithResult(F &&f, TaskPriority priority = TaskPriority::Normal,
                         const std::string &description = "", Args &&...args)
      -> std::future<typename std::invoke_result<F, Args...>::type> {
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));

    std::future<return_type> result = task->get_future();
    enqueue([task]() { (*task)(); }, priority, description);
    return result;
  }

  [[nodiscard]] bool busy() const {
    return !m_taskQueue.isEmpty() ||
           m_activeTasks.load(std::memory_order_relaxed) > 0;
  }

  [[nodiscard]] size_t getThreadCount() const { return m_workers.size(); }
  [[nodiscard]] size_t getQueueSize() const { return m_taskQueue.size(); }
  [[nodiscard]] size_t getTotalTasksProcessed() const {
    return m_totalTasksProcessed.load(std::memory_order_relaxed);
  }
  [[nodiscard]] size_t getTotalTasksEnqueued() const {
    return m_totalTasksEnqueued.load(std::memory_order_relaxed);
  }

private:
  std::vector<std::thread> m_workers;
  TaskQueue m_taskQueue;
  std::atomic<bool> m_isRunning{true};
  std::atomic<size_t> m_activeTasks{0};
  std::atomic<size_t> m_totalTasksEnqueued{0};
  std::atomic<size_t> m_totalTasksProcessed{0};

  void workerThread(size_t threadIndex) {
    PrioritizedTask task;
    size_t tasksProcessed = 0;

    while (m_isRunning.load(std::memory_order_acquire)) {
      if (!m_taskQueue.pop(task)) {
        break;
      }

      m_activeTasks.fetch_add(1, std::memory_order_relaxed);
      auto taskStartTime = std::chrono::steady_clock::now();

      try {
        task.task();
        ++tasksProcessed;
        m_totalTasksProcessed.fetch_add(1, std::memory_order_relaxed);
      } catch (const std::exception &e) {
        THREADSYSTEM_ERROR("Error in worker thread " +
                           std::to_string(threadIndex) + " (" +
                           task.description + "): " + std::string(e.what()));
      } catch (...) {
        THREADSYSTEM_ERROR("Unknown error in worker thread " +
                           std::to_string(threadIndex));
      }

      m_activeTasks.fetch_sub(1, std::memory_order_relaxed);

      auto taskDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - taskStartTime)
                              .count();
      if (taskDuration > 100) {
        THREADSYSTEM_WARN("Worker " + std::to_string(threadIndex) +
                          " - Slow task: " + std::to_string(taskDuration) +
                          "ms " + task.description);
      }

      task.task = nullptr;
    }

    THREADSYSTEM_DEBUG("Worker " + std::to_string(threadIndex) +
                       " exiting after processing " +
                       std::to_string(tasksProcessed) + " tasks");
    (void)tasksProcessed;
  }
};

/**
 * @brief Process-wide worker pool singleton.
 *
 * Callers check Exists() and run work inline when no pool is running, so
 * unit tests and tools can drive the runtime single-threaded.
 */
class ThreadSystem {
public:
  static ThreadSystem &Instance() {
    static ThreadSystem instance;
    return instance;
  }

  static bool Exists() {
    return Instance().m_isRunning.load(std::memory_order_acquire);
  }

  bool init(unsigned int customThreadCount = 0) {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    if (m_threadPool) {
      THREADSYSTEM_WARN("ThreadSystem already initialized");
      return true;
    }

    if (customThreadCount > 0) {
      m_numThreads = customThreadCount;
    } else {
      unsigned int hardwareThreads = std::thread::hardware_concurrency();
      m_numThreads = (hardwareThreads > 1) ? (hardwareThreads - 1) : 1;
    }

    try {
      m_threadPool = std::make_unique<ThreadPool>(m_numThreads);
      m_isRunning.store(true, std::memory_order_release);
      THREADSYSTEM_INFO("ThreadSystem initialized with " +
                        std::to_string(m_numThreads) + " worker threads");
      return true;
    } catch (const std::exception &e) {
      THREADSYSTEM_ERROR("Failed to initialize ThreadSystem: " +
                         std::string(e.what()));
      return false;
    }
  }

  void clean() {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    m_isRunning.store(false, std::memory_order_release);
    if (m_threadPool) {
      size_t pendingTasks = m_threadPool->getQueueSize();
      if (pendingTasks > 0) {
        THREADSYSTEM_INFO("Canceling " + std::to_string(pendingTasks) +
                          " pending tasks during shutdown...");
      }
      m_threadPool.reset();
      THREADSYSTEM_INFO("ThreadSystem resources cleaned!");
    }
  }

  ~ThreadSystem() { clean(); }

  void enqueueTask(std::function<void()> task,
                   TaskPriority priority = TaskPriority::Normal,
                   const std::string &description = "") {
    if (!m_isRunning.load(std::memory_order_acquire) || !m_threadPool) {
      THREADSYSTEM_DEBUG("Ignoring task after shutdown" +
                         (description.empty() ? "" : " (" + description + ")"));
      return;
    }
    m_threadPool->enqueue(std::move(task), priority, description);
  }

  template <class F, class... Args>
  auto enqueueTaskWithResult(F &&f,
                             TaskPriority priority = TaskPriority::Normal,
                             const std::string &description = "",
                             Args &&...args)
      -> std::future<typename std::invoke_result<F, Args...>::type> {
    if (!m_isRunning.load(std::memory_order_acquire) || !m_threadPool) {
      throw std::runtime_error("ThreadSystem is not running");
    }
    return m_threadPool->enqueueWithResult(std::forward<F>(f), priority,
                                           description,
                                           std::forward<Args>(args)...);
  }

  [[nodiscard]] bool isBusy() const {
    return m_threadPool && m_threadPool->busy();
  }

  [[nodiscard]] unsigned int getThreadCount() const { return m_numThreads; }

  [[nodiscard]] size_t getQueueSize() const {
    return m_threadPool ? m_threadPool->getQueueSize() : 0;
  }

  [[nodiscard]] size_t getTotalTasksProcessed() const {
    return m_threadPool ? m_threadPool->getTotalTasksProcessed() : 0;
  }

private:
  ThreadSystem() = default;
  ThreadSystem(const ThreadSystem &) = delete;
  ThreadSystem &operator=(const ThreadSystem &) = delete;

  std::unique_ptr<ThreadPool> m_threadPool;
  std::mutex m_lifecycleMutex;
  std::atomic<bool> m_isRunning{false};
  unsigned int m_numThreads{0};
};

} // namespace AnchorMud

#endif // THREAD_SYSTEM_HPP
