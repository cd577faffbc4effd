#pragma once

#include "IParallelExecutor.h"
#include <queue>
#include <future>
#include <thread>
#include <vector>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <exception>
#include <memory>

/**
 * @file ParallelExecutors.h
 * @brief Executor policies used to evaluate independent work items.
 *
 *  - SingleThreadExecutor: runs tasks inline on the calling thread. Execution
 *    order equals submission order, which makes it the policy of choice in
 *    unit tests.
 *  - ThreadPoolExecutor<N>: a fixed pool of worker threads fed from a FIFO
 *    queue. N == 0 sizes the pool from std::thread::hardware_concurrency().
 */
namespace concurrency
{
  inline std::size_t getDefaultThreadCount()
  {
    const unsigned hw = std::thread::hardware_concurrency();
    return hw ? hw : 2;
  }

  /**
   * @brief Executes tasks synchronously on the calling thread.
   */
  class SingleThreadExecutor : public IParallelExecutor {
  public:
    std::future<void> submit(std::function<void()> task) override {
      std::promise<void> prom;
      auto fut = prom.get_future();
      try {
	task();
	prom.set_value();
      } catch (...) {
	prom.set_exception(std::current_exception());
      }
      return fut;
    }

    std::size_t getNumThreads() const { return 1; }
  };

  /**
   * @brief Fixed-size thread pool executor.
   *
   * If N == 0 the pool size is taken from the constructor argument, or from
   * getDefaultThreadCount() when that argument is also 0.
   */
  template <std::size_t N = 0>
  class ThreadPoolExecutor : public IParallelExecutor {
  public:
    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
    ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

    explicit ThreadPoolExecutor(std::size_t requestedThreads = 0) : stop_(false)
    {
      const std::size_t threads =
	N > 0 ? N : (requestedThreads > 0 ? requestedThreads : getDefaultThreadCount());

      try {
	for (std::size_t i = 0; i < threads; ++i) {
	  workers_.emplace_back([this] { workerLoop(); });
	}
      }
      catch (...) {
	shutdown();
	throw;
      }
    }

    ~ThreadPoolExecutor()
    {
      shutdown();
    }

    std::future<void> submit(std::function<void()> task) override
    {
      auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
      auto fut = packaged->get_future();
      {
	std::unique_lock<std::mutex> lock(tasksMutex_);
	if (stop_)
	  throw std::runtime_error("enqueue on stopped ThreadPoolExecutor");
	tasks_.emplace([packaged]() { (*packaged)(); });
      }
      condition_.notify_one();
      return fut;
    }

    std::size_t getNumThreads() const { return workers_.size(); }

  private:
    void workerLoop()
    {
      for (;;) {
	std::function<void()> task;
	{
	  std::unique_lock<std::mutex> lock(tasksMutex_);
	  condition_.wait(lock, [this]{ return stop_ || !tasks_.empty(); });
	  if (stop_ && tasks_.empty()) return;
	  task = std::move(tasks_.front());
	  tasks_.pop();
	}
	task();
      }
    }

    void shutdown()
    {
      {
	std::unique_lock<std::mutex> lock(tasksMutex_);
	stop_ = true;
      }
      condition_.notify_all();
      for (auto &worker : workers_) {
	if (worker.joinable())
	  worker.join();
      }
    }

  private:
    std::vector<std::thread>          workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex                        tasksMutex_;
    std::condition_variable           condition_;
    bool                              stop_;
  };
} // namespace concurrency
