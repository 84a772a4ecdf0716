// Repository: Retrovue-vinefeed
// Component: Warm-up Executor
// Purpose: Runs decoder warm-ups on background threads, off the owner
//          thread, and posts every outcome to the CompletionChannel.
// Copyright (c) 2025 RetroVue
//
// One worker thread per in-flight warm-up.  A worker whose slot was
// released keeps running until the backend returns, so the manager counts
// InFlight() against the slot capacity before starting another.

#ifndef VINEFEED_RESOURCE_WARMUP_EXECUTOR_HPP_
#define VINEFEED_RESOURCE_WARMUP_EXECUTOR_HPP_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include "vinefeed/decode/IDecoderBackend.hpp"
#include "vinefeed/resource/CompletionChannel.hpp"
#include "vinefeed/resource/ResourceTypes.hpp"
#include "vinefeed/time/ITimeSource.hpp"

namespace vinefeed::resource {

class WarmupExecutor {
 public:
  // Optional test hook: called on the worker before the backend.  Production
  // code leaves this null.  Tests set it to simulate slow fetches.
  using DelayHookFn = std::function<void(const VideoDescriptor&, const decode::CancelToken&)>;

  WarmupExecutor(std::shared_ptr<decode::IDecoderBackend> backend,
                 CompletionChannel& channel,
                 std::shared_ptr<time::ITimeSource> clock);
  ~WarmupExecutor();

  WarmupExecutor(const WarmupExecutor&) = delete;
  WarmupExecutor& operator=(const WarmupExecutor&) = delete;

  // Starts a warm-up for `descriptor` on a new worker thread.  The worker
  // posts exactly one completion carrying `generation`.
  void Start(const VideoDescriptor& descriptor, uint64_t generation,
             decode::CancelToken cancel);

  // Joins workers that have already posted.  Owner thread, non-blocking in
  // practice (only finished threads are joined).
  void ReapFinished();

  // Cancels every in-flight warm-up and joins all workers.  Blocks until the
  // backend honours the cancel tokens.  Idempotent.
  void CancelAll();

  // Number of workers not yet reaped (finished or not).  Call
  // ReapFinished() first for a count of workers still inside the backend.
  std::size_t InFlight() const { return tasks_.size(); }

  // Test-only.
  void SetDelayHook(DelayHookFn hook);

 private:
  struct Task {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
    decode::CancelToken cancel;
  };

  void Worker(VideoDescriptor descriptor, uint64_t generation,
              decode::CancelToken cancel,
              std::shared_ptr<std::atomic<bool>> done);

  std::shared_ptr<decode::IDecoderBackend> backend_;
  CompletionChannel& channel_;
  std::shared_ptr<time::ITimeSource> clock_;
  std::vector<Task> tasks_;  // Owner thread only

  DelayHookFn delay_hook_;  // Test-only; set before the first Start()
};

}  // namespace vinefeed::resource

#endif  // VINEFEED_RESOURCE_WARMUP_EXECUTOR_HPP_
