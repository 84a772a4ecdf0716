// Repository: Retrovue-vinefeed
// Component: Completion Channel Implementation
// Copyright (c) 2025 RetroVue

#include "vinefeed/resource/CompletionChannel.hpp"

#include <utility>

namespace vinefeed::resource {

void CompletionChannel::Post(WarmupCompletion completion) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(completion));
  }
  cv_.notify_all();
}

std::vector<WarmupCompletion> CompletionChannel::Drain() {
  std::vector<WarmupCompletion> out;
  std::lock_guard<std::mutex> lock(mutex_);
  out.reserve(queue_.size());
  while (!queue_.empty()) {
    out.push_back(std::move(queue_.front()));
    queue_.pop_front();
  }
  return out;
}

bool CompletionChannel::WaitFor(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); });
}

std::size_t CompletionChannel::Pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

}  // namespace vinefeed::resource
