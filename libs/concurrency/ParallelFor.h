#pragma once

#include <cstdint>    // for uint32_t
#include <vector>     // for std::vector
#include <future>     // for std::future
#include <algorithm>  // for std::min
#include <atomic>
#include "CancellationToken.h"
#include "ParallelExecutors.h"

namespace concurrency {

  // Split [0…total) into at most numTasks contiguous chunks, submit each
  // chunk to exec.submit, and waitAll. Inside a chunk body(p) is called for
  // p = chunk.start .. chunk.end-1 in order.
  template<typename Executor, typename Body>
  void parallel_for(uint32_t total, Executor& exec, Body body,
		    std::size_t numTasks = getDefaultThreadCount()) {
    if (total == 0) return;
    if (numTasks == 0) numTasks = 1;

    const uint32_t chunkSize = static_cast<uint32_t>((total + numTasks - 1) / numTasks); // ceil-divide

    std::vector<std::future<void>> futures;
    for (uint32_t start = 0; start < total; start += chunkSize)
      {
	uint32_t end = std::min(total, start + chunkSize);
	futures.emplace_back(
			     exec.submit([=]() {
				 for (uint32_t p = start; p < end; ++p) {
				   body(p);
				 }
			       })
			     );
      }
    exec.waitAll(futures);
  }

  // Same chunking as parallel_for, but each worker checks @p token before
  // starting an index and stops its chunk once cancellation is observed.
  // Indices already started always run to completion.
  //
  // Returns the number of indices whose body was executed.
  template<typename Executor, typename Body>
  uint32_t parallel_for_cancellable(uint32_t total, Executor& exec,
				    const CancellationToken& token, Body body,
				    std::size_t numTasks = getDefaultThreadCount()) {
    if (total == 0) return 0;
    if (numTasks == 0) numTasks = 1;

    const uint32_t chunkSize = static_cast<uint32_t>((total + numTasks - 1) / numTasks);
    std::atomic<uint32_t> executed{0};

    std::vector<std::future<void>> futures;
    for (uint32_t start = 0; start < total; start += chunkSize)
      {
	uint32_t end = std::min(total, start + chunkSize);
	futures.emplace_back(
			     exec.submit([=, &token, &executed]() {
				 for (uint32_t p = start; p < end; ++p) {
				   if (token.isCancelled())
				     return;
				   body(p);
				   executed.fetch_add(1, std::memory_order_relaxed);
				 }
			       })
			     );
      }
    exec.waitAll(futures);
    return executed.load();
  }
}
