#pragma once

#include <atomic>
#include <chrono>
#include <optional>

namespace concurrency
{
  /**
   * @brief Cooperative stop signal shared between a caller and running tasks.
   *
   * A token is cancelled either explicitly through cancel() or implicitly
   * once its steady-clock deadline has passed. Tasks poll isCancelled()
   * between units of work; nothing is interrupted mid-unit.
   */
  class CancellationToken
  {
  public:
    using Clock = std::chrono::steady_clock;

    CancellationToken()
      : mCancelled(false),
	mDeadline()
    {}

    explicit CancellationToken(Clock::time_point deadline)
      : mCancelled(false),
	mDeadline(deadline)
    {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    static Clock::time_point deadlineAfter(std::chrono::milliseconds budget)
    {
      return Clock::now() + budget;
    }

    void cancel()
    {
      mCancelled.store(true, std::memory_order_release);
    }

    bool isCancelled() const
    {
      if (mCancelled.load(std::memory_order_acquire))
	return true;

      return mDeadline.has_value() && (Clock::now() >= *mDeadline);
    }

    bool hasDeadline() const
    {
      return mDeadline.has_value();
    }

  private:
    std::atomic<bool> mCancelled;
    std::optional<Clock::time_point> mDeadline;
  };
} // namespace concurrency
