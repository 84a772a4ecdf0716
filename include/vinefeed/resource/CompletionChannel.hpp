// Repository: Retrovue-vinefeed
// Component: Completion Channel
// Purpose: Thread-safe hand-off of warm-up results from worker threads back
//          to the owner thread.
// Copyright (c) 2025 RetroVue

#ifndef VINEFEED_RESOURCE_COMPLETION_CHANNEL_HPP_
#define VINEFEED_RESOURCE_COMPLETION_CHANNEL_HPP_

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

#include "vinefeed/decode/IDecoderBackend.hpp"
#include "vinefeed/resource/ResourceTypes.hpp"

namespace vinefeed::resource {

struct WarmupCompletion {
  VideoId id;
  uint64_t generation = 0;  // Stamped at acquisition; used to detect staleness
  decode::WarmupResult result;
  int64_t elapsed_ms = 0;
};

// Multi-producer (workers), single-consumer (owner thread) queue.
// Completions are delivered in the order they were posted.
class CompletionChannel {
 public:
  CompletionChannel() = default;

  CompletionChannel(const CompletionChannel&) = delete;
  CompletionChannel& operator=(const CompletionChannel&) = delete;

  void Post(WarmupCompletion completion);

  // Non-blocking: moves out everything posted so far.
  std::vector<WarmupCompletion> Drain();

  // Blocks until at least one completion is pending or the timeout expires.
  // Returns true if something is pending.
  bool WaitFor(std::chrono::milliseconds timeout);

  std::size_t Pending() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<WarmupCompletion> queue_;  // Guarded by mutex_
};

}  // namespace vinefeed::resource

#endif  // VINEFEED_RESOURCE_COMPLETION_CHANNEL_HPP_
