// Repository: Retrovue-vinefeed
// Component: Retry Backoff Implementation
// Copyright (c) 2025 RetroVue

#include "vinefeed/resource/RetryBackoff.hpp"

#include <algorithm>
#include <cmath>

namespace vinefeed::resource {

RetryBackoff::RetryBackoff(BackoffPolicy policy) : policy_(policy) {}

int64_t RetryBackoff::DelayForFailure(int failure_count) const {
  if (failure_count <= 0) return 0;
  const double raw = static_cast<double>(policy_.base_delay_ms) *
                     std::pow(policy_.factor, failure_count - 1);
  if (raw >= static_cast<double>(policy_.max_delay_ms)) {
    return policy_.max_delay_ms;
  }
  return std::max<int64_t>(0, static_cast<int64_t>(raw));
}

int64_t RetryBackoff::RecordFailure(const VideoId& id, int64_t now_ms) {
  Record& record = records_[id];
  record.failures += 1;
  if (record.failures > policy_.max_retries) {
    record.next_attempt_at_ms = 0;
    return -1;
  }
  const int64_t delay = DelayForFailure(record.failures);
  record.next_attempt_at_ms = now_ms + delay;
  return delay;
}

bool RetryBackoff::CanAttempt(const VideoId& id, int64_t now_ms) const {
  auto it = records_.find(id);
  if (it == records_.end()) return true;
  if (it->second.failures > policy_.max_retries) return false;
  return now_ms >= it->second.next_attempt_at_ms;
}

bool RetryBackoff::IsExhausted(const VideoId& id) const {
  auto it = records_.find(id);
  return it != records_.end() && it->second.failures > policy_.max_retries;
}

int RetryBackoff::Failures(const VideoId& id) const {
  auto it = records_.find(id);
  return it == records_.end() ? 0 : it->second.failures;
}

int64_t RetryBackoff::NextAttemptAtMs(const VideoId& id) const {
  auto it = records_.find(id);
  return it == records_.end() ? 0 : it->second.next_attempt_at_ms;
}

void RetryBackoff::Reset(const VideoId& id) {
  records_.erase(id);
}

void RetryBackoff::Clear() {
  records_.clear();
}

}  // namespace vinefeed::resource
