/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 *
 * Thread System: Handles task scheduling, thread pooling and task
 * prioritization for background path searches
 */

#ifndef THREAD_SYSTEM_HPP
#define THREAD_SYSTEM_HPP

#include "Logger.hpp"
#include <algorithm>
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
#include <type_traits>
#include <vector>

// Platform-specific includes for thread naming
#if defined(__linux__) || defined(__APPLE__) || defined(_GNU_SOURCE)
#include <pthread.h>
#endif

namespace HexPath {

// Task priority levels
enum class TaskPriority {
  Critical = 0, // Must execute ASAP
  High = 1,     // Interactive requests (player-issued moves)
  Normal = 2,   // Default priority for most tasks
  Low = 3,      // Background tasks (AI look-ahead)
  Idle = 4      // Only execute when nothing else is pending
};

// Task wrapper with priority information
struct PrioritizedTask {
  std::function<void()> task;
  TaskPriority priority{TaskPriority::Normal};
  std::chrono::steady_clock::time_point enqueueTime{
      std::chrono::steady_clock::now()};
  std::string description;

  PrioritizedTask() = default;

  PrioritizedTask(std::function<void()> t, TaskPriority p,
                  std::string desc = "")
      : task(std::move(t)), priority(p),
        enqueueTime(std::chrono::steady_clock::now()),
        description(std::move(desc)) {}
};

/**
 * @brief Thread-safe prioritized task queue using separate deques per priority
 *
 * Workers always take the oldest task of the highest non-empty priority.
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
      ++m_size;
    }

    if (priority == TaskPriority::Critical) {
      m_condition.notify_all();
    } else {
      m_condition.notify_one();
    }
  }

  // Blocks until a task is available or the queue is stopping
  bool pop(std::function<void()> &task) {
    std::unique_lock<std::mutex> lock(m_queueMutex);
    m_condition.wait(lock, [this] {
      return m_stopping.load(std::memory_order_acquire) || m_size > 0;
    });

    if (m_stopping.load(std::memory_order_acquire)) {
      return false;
    }

    for (auto &queue : m_priorityQueues) {
      if (!queue.empty()) {
        PrioritizedTask prioritizedTask = std::move(queue.front());
        queue.pop_front();
        --m_size;

        auto waitTime = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() -
                            prioritizedTask.enqueueTime)
                            .count();
        if (prioritizedTask.priority <= TaskPriority::High && waitTime > 100 &&
            !prioritizedTask.description.empty()) {
          THREADSYSTEM_WARN("High priority task delayed: " +
                            prioritizedTask.description + " waited " +
                            std::to_string(waitTime) + "ms");
        }

        task = std::move(prioritizedTask.task);
        return true;
      }
    }
    return false;
  }

  // Drops every queued task; futures of dropped tasks report broken_promise
  void stop() {
    std::array<std::deque<PrioritizedTask>, PRIORITY_COUNT> dropped;
    {
      std::lock_guard<std::mutex> lock(m_queueMutex);
      m_stopping.store(true, std::memory_order_release);
      dropped.swap(m_priorityQueues);
      m_size = 0;
    }
    m_condition.notify_all();
  }

  bool isEmpty() const { return size() == 0; }

  bool isStopping() const { return m_stopping.load(std::memory_order_acquire); }

  size_t size() const {
    std::lock_guard<std::mutex> lock(m_queueMutex);
    return m_size;
  }

private:
  std::array<std::deque<PrioritizedTask>, PRIORITY_COUNT> m_priorityQueues;
  size_t m_size{0};
  mutable std::mutex m_queueMutex;
  std::condition_variable m_condition;
  std::atomic<bool> m_stopping{false};
};

// Thread pool for managing worker threads
class ThreadPool {
public:
  explicit ThreadPool(size_t numThreads) {
    m_workers.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
      m_workers.emplace_back([this, i] {
#if defined(__linux__) || defined(_GNU_SOURCE)
        std::string threadName = "PathWorker-" + std::to_string(i);
        pthread_setname_np(pthread_self(), threadName.c_str());
#elif defined(__APPLE__)
        std::string threadName = "PathWorker-" + std::to_string(i);
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

  /**
   * @brief Enqueue a task that returns a result with specified priority
   *
   * @param f The function to execute
   * @param priority The priority level (default: Normal)
   * @param description Optional description for debugging
   * @return A future containing the result
   */
  template <class F>
  auto enqueueWithResult(F &&f, TaskPriority priority = TaskPriority::Normal,
                         const std::string &description = "")
      -> std::future<typename std::invoke_result<F>::type> {
    using return_type = typename std::invoke_result<F>::type;

    auto task =
        std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));

    std::future<return_type> result = task->get_future();
    enqueue([task]() { (*task)(); }, priority, description);
    return result;
  }

  bool busy() const {
    return !m_taskQueue.isEmpty() ||
           m_activeTasks.load(std::memory_order_relaxed) > 0;
  }

  TaskQueue &getTaskQueue() { return m_taskQueue; }
  const TaskQueue &getTaskQueue() const { return m_taskQueue; }

  size_t getTotalTasksEnqueued() const {
    return m_totalTasksEnqueued.load(std::memory_order_relaxed);
  }

  size_t getTotalTasksProcessed() const {
    return m_totalTasksProcessed.load(std::memory_order_relaxed);
  }

private:
  std::vector<std::thread> m_workers;
  TaskQueue m_taskQueue;
  std::atomic<bool> m_isRunning{true};
  std::atomic<size_t> m_activeTasks{0};
  std::atomic<size_t> m_totalTasksEnqueued{0};
  std::atomic<size_t> m_totalTasksProcessed{0};

  void workerThread(size_t threadIndex) {
    std::function<void()> task;
    size_t tasksProcessed = 0;

    while (m_isRunning.load(std::memory_order_acquire)) {
      if (!m_taskQueue.pop(task)) {
        break;
      }

      m_activeTasks.fetch_add(1, std::memory_order_relaxed);
      auto taskStartTime = std::chrono::steady_clock::now();

      try {
        task();
        ++tasksProcessed;
        m_totalTasksProcessed.fetch_add(1, std::memory_order_relaxed);
      } catch (const std::exception &e) {
        THREADSYSTEM_ERROR("Error in worker thread " +
                           std::to_string(threadIndex) + ": " +
                           std::string(e.what()));
      }

      m_activeTasks.fetch_sub(1, std::memory_order_relaxed);

      auto taskDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - taskStartTime)
                              .count();
      if (taskDuration > 100) {
        THREADSYSTEM_WARN("Worker " + std::to_string(threadIndex) +
                          " - Slow task: " + std::to_string(taskDuration) +
                          "ms");
      }

      task = nullptr;
    }

    THREADSYSTEM_DEBUG("Worker " + std::to_string(threadIndex) +
                       " exiting after processing " +
                       std::to_string(tasksProcessed) + " tasks");
    (void)tasksProcessed;
  }
};

/**
 * @brief Owns a worker pool for background path searches
 *
 * Unlike a process-wide singleton, each ThreadSystem is constructed by its
 * owner and handed to the services that need it. A ThreadSystem that was
 * never initialized, or that has been cleaned, rejects new work.
 */
class ThreadSystem {
public:
  ThreadSystem() = default;

  ~ThreadSystem() {
    if (!m_isShutdown.load(std::memory_order_acquire)) {
      clean();
    }
  }

  ThreadSystem(const ThreadSystem &) = delete;
  ThreadSystem &operator=(const ThreadSystem &) = delete;

  /**
   * @brief Start the worker threads
   *
   * @param customThreadCount Exact worker count (0 for hardware threads - 1,
   * minimum 1)
   * @return true if initialization succeeded, false otherwise
   */
  bool init(unsigned int customThreadCount = 0) {
    if (m_isShutdown.load(std::memory_order_acquire)) {
      THREADSYSTEM_WARN("ThreadSystem already shut down, ignoring init request");
      return false;
    }
    if (m_threadPool) {
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
      THREADSYSTEM_INFO("ThreadSystem initialized with " +
                        std::to_string(m_numThreads) + " worker threads");
      return true;
    } catch (const std::exception &e) {
      THREADSYSTEM_ERROR("Failed to initialize ThreadSystem: " +
                         std::string(e.what()));
      return false;
    }
  }

  // Stops the workers; queued tasks are dropped
  void clean() {
    m_isShutdown.store(true, std::memory_order_release);

    std::unique_ptr<ThreadPool> pool;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      pool = std::move(m_threadPool);
    }

    if (pool) {
      size_t pendingTasks = pool->getTaskQueue().size();
      if (pendingTasks > 0) {
        THREADSYSTEM_INFO("Canceling " + std::to_string(pendingTasks) +
                          " pending tasks during shutdown...");
      }
      pool.reset();
      THREADSYSTEM_INFO("ThreadSystem resources cleaned!");
    }
  }

  /**
   * @brief Enqueue a fire-and-forget task
   * @return false when the system is not running and the task was rejected
   */
  bool enqueueTask(std::function<void()> task,
                   TaskPriority priority = TaskPriority::Normal,
                   const std::string &description = "") {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_isShutdown.load(std::memory_order_acquire) || !m_threadPool) {
      THREADSYSTEM_DEBUG("Ignoring task after shutdown" +
                         (description.empty() ? "" : " (" + description + ")"));
      return false;
    }

    m_threadPool->enqueue(std::move(task), priority, description);
    return true;
  }

  /**
   * @brief Enqueue a task that returns a result with priority
   *
   * @throws std::runtime_error if the ThreadSystem is not running
   */
  template <class F>
  auto enqueueTaskWithResult(F &&f,
                             TaskPriority priority = TaskPriority::Normal,
                             const std::string &description = "")
      -> std::future<typename std::invoke_result<F>::type> {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_isShutdown.load(std::memory_order_acquire) || !m_threadPool) {
      throw std::runtime_error("ThreadSystem is not running" +
                               (description.empty() ? std::string()
                                                    : " (" + description + ")"));
    }
    return m_threadPool->enqueueWithResult(std::forward<F>(f), priority,
                                           description);
  }

  bool isRunning() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool != nullptr &&
           !m_isShutdown.load(std::memory_order_acquire);
  }

  bool isBusy() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool && m_threadPool->busy();
  }

  bool isShutdown() const {
    return m_isShutdown.load(std::memory_order_acquire);
  }

  unsigned int getThreadCount() const { return m_numThreads; }

  size_t getQueueSize() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool ? m_threadPool->getTaskQueue().size() : 0;
  }

  size_t getTotalTasksProcessed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool ? m_threadPool->getTotalTasksProcessed() : 0;
  }

  size_t getTotalTasksEnqueued() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threadPool ? m_threadPool->getTotalTasksEnqueued() : 0;
  }

private:
  std::unique_ptr<ThreadPool> m_threadPool;
  unsigned int m_numThreads{0};
  std::atomic<bool> m_isShutdown{false};
  mutable std::mutex m_mutex;
};

} // namespace HexPath

#endif // THREAD_SYSTEM_HPP
