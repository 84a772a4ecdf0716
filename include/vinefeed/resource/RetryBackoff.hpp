// Repository: Retrovue-vinefeed
// Component: Retry Backoff
// Purpose: Per-video exponential backoff so a permanently broken source URI
//          is not re-attempted in a hot loop.
// Copyright (c) 2025 RetroVue

#ifndef VINEFEED_RESOURCE_RETRY_BACKOFF_HPP_
#define VINEFEED_RESOURCE_RETRY_BACKOFF_HPP_

#include <cstdint>
#include <unordered_map>

#include "vinefeed/resource/ResourceTypes.hpp"

namespace vinefeed::resource {

struct BackoffPolicy {
  int64_t base_delay_ms = 1000;
  double factor = 2.0;
  int64_t max_delay_ms = 30000;
  // Automatic retries allowed after the first failed attempt.
  int max_retries = 5;
};

// Failure n (1-based) schedules the next attempt at
//   now + min(base_delay_ms * factor^(n-1), max_delay_ms).
// Once failures exceed max_retries the id is exhausted: no attempt is
// allowed until Reset().
class RetryBackoff {
 public:
  explicit RetryBackoff(BackoffPolicy policy);

  // Records a failed attempt.  Returns the delay scheduled, or -1 if the id
  // is now exhausted.
  int64_t RecordFailure(const VideoId& id, int64_t now_ms);

  // True if `id` has no failure record, or its delay has elapsed and it is
  // not exhausted.
  bool CanAttempt(const VideoId& id, int64_t now_ms) const;

  bool IsExhausted(const VideoId& id) const;
  int Failures(const VideoId& id) const;
  int64_t NextAttemptAtMs(const VideoId& id) const;  // 0 if no record

  // Forget the id's history (success, or explicit external retry).
  void Reset(const VideoId& id);
  void Clear();

  int64_t DelayForFailure(int failure_count) const;

  const BackoffPolicy& policy() const { return policy_; }

 private:
  struct Record {
    int failures = 0;
    int64_t next_attempt_at_ms = 0;
  };

  BackoffPolicy policy_;
  std::unordered_map<VideoId, Record> records_;
};

}  // namespace vinefeed::resource

#endif  // VINEFEED_RESOURCE_RETRY_BACKOFF_HPP_
