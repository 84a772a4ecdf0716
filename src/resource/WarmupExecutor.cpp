// Repository: Retrovue-vinefeed
// Component: Warm-up Executor Implementation
// Purpose: Background decoder warm-up with cooperative cancellation.
// Copyright (c) 2025 RetroVue

#include "vinefeed/resource/WarmupExecutor.hpp"

#include <exception>
#include <sstream>
#include <utility>

#include "vinefeed/util/Logger.hpp"

namespace vinefeed::resource {

using vinefeed::util::Logger;

WarmupExecutor::WarmupExecutor(std::shared_ptr<decode::IDecoderBackend> backend,
                               CompletionChannel& channel,
                               std::shared_ptr<time::ITimeSource> clock)
    : backend_(std::move(backend)), channel_(channel), clock_(std::move(clock)) {}

WarmupExecutor::~WarmupExecutor() {
  CancelAll();
}

void WarmupExecutor::Start(const VideoDescriptor& descriptor, uint64_t generation,
                           decode::CancelToken cancel) {
  Task task;
  task.done = std::make_shared<std::atomic<bool>>(false);
  task.cancel = cancel;
  task.thread = std::thread(&WarmupExecutor::Worker, this, descriptor, generation,
                            std::move(cancel), task.done);
  tasks_.push_back(std::move(task));
}

void WarmupExecutor::ReapFinished() {
  auto it = tasks_.begin();
  while (it != tasks_.end()) {
    if (it->done->load(std::memory_order_acquire)) {
      if (it->thread.joinable()) {
        it->thread.join();
      }
      it = tasks_.erase(it);
    } else {
      ++it;
    }
  }
}

void WarmupExecutor::CancelAll() {
  for (auto& task : tasks_) {
    task.cancel.Cancel();
  }
  for (auto& task : tasks_) {
    if (task.thread.joinable()) {
      task.thread.join();
    }
  }
  tasks_.clear();
}

void WarmupExecutor::SetDelayHook(DelayHookFn hook) {
  delay_hook_ = std::move(hook);
}

// =============================================================================
// Worker: runs on a background thread
// Checks the cancel token before and after the backend call.  Marks itself
// done, then posts exactly one completion.  A handle produced after
// cancellation is destroyed here; the owner never sees it.
// =============================================================================

void WarmupExecutor::Worker(VideoDescriptor descriptor, uint64_t generation,
                            decode::CancelToken cancel,
                            std::shared_ptr<std::atomic<bool>> done) {
  const int64_t started_ms = clock_->NowMs();
  WarmupCompletion completion;
  completion.id = descriptor.id;
  completion.generation = generation;

  // Checkpoint 1
  if (cancel.IsCancelled()) {
    completion.result = decode::WarmupResult::Failure(ResourceError::kCancelled,
                                                      "cancelled before start");
  } else {
    if (delay_hook_) {
      delay_hook_(descriptor, cancel);
    }

    try {
      completion.result = backend_->Warmup(descriptor, cancel);
    } catch (const std::exception& e) {
      std::ostringstream oss;
      oss << "[WarmupExecutor] BACKEND_THREW video_id=" << descriptor.id
          << " generation=" << generation << " what=" << e.what();
      Logger::Warn(oss.str());
      completion.result = decode::WarmupResult::Failure(ResourceError::kDecodeFailure,
                                                        e.what());
    }

    // Checkpoint 2: superseded while the backend was working.
    if (cancel.IsCancelled() && completion.result.ok()) {
      completion.result = decode::WarmupResult::Failure(ResourceError::kCancelled,
                                                        "cancelled during warm-up");
    } else if (!completion.result.ok() &&
               completion.result.error == ResourceError::kNone) {
      // Backend returned neither a handle nor an error.
      completion.result = decode::WarmupResult::Failure(
          ResourceError::kDecodeFailure, "backend returned no handle");
    }
  }

  completion.elapsed_ms = clock_->NowMs() - started_ms;

  if (Logger::DebugEnabled()) {
    std::ostringstream oss;
    oss << "[WarmupExecutor] WARMUP_DONE video_id=" << descriptor.id
        << " generation=" << generation
        << " result=" << ResourceErrorToString(completion.result.error)
        << " elapsed_ms=" << completion.elapsed_ms;
    Logger::Debug(oss.str());
  }

  // Done before posting: once the owner sees this completion, ReapFinished()
  // is guaranteed to reclaim the worker.
  done->store(true, std::memory_order_release);
  channel_.Post(std::move(completion));
}

}  // namespace vinefeed::resource
