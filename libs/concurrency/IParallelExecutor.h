#pragma once

#include <functional>
#include <future>
#include <vector>
#include <exception>

namespace concurrency
{
  /**
   * @brief Interface for executor policies that run submitted tasks.
   *
   * submit() hands back a future that becomes ready when the task finishes
   * and carries any exception the task threw.
   */
  class IParallelExecutor
  {
  public:
    virtual ~IParallelExecutor() = default;

    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Wait for every future, then rethrow the first stored exception.
     *
     * All futures are drained before rethrowing so no task is still writing
     * into caller-owned memory when control returns.
     */
    void waitAll(std::vector<std::future<void>>& futures)
    {
      std::exception_ptr first;
      for (auto& f : futures)
	{
	  try
	    {
	      f.get();
	    }
	  catch (...)
	    {
	      if (!first)
		first = std::current_exception();
	    }
	}

      if (first)
	std::rethrow_exception(first);
    }
  };
} // namespace concurrency
