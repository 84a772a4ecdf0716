// Repository: Retrovue-vinefeed
// Component: Priority Scheduler
// Purpose: Ordered list of feed positions that should hold a decoder slot,
//          highest priority first, derived from the viewport index.
// Copyright (c) 2025 RetroVue

#ifndef VINEFEED_SCHEDULER_PRIORITY_SCHEDULER_HPP_
#define VINEFEED_SCHEDULER_PRIORITY_SCHEDULER_HPP_

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace vinefeed::scheduler {

struct WindowConfig {
  int ahead_radius = 2;   // Positions after the viewport worth a slot
  int behind_radius = 1;  // Positions before the viewport worth a slot
};

// Ordering rule:
//
//   [i, i+1, i-1, i+2, i-2, ...]
//
// clipped to [0, feed_size) and to the radii.  The viewport comes first,
// then alternating forward/backward by increasing distance; forward wins
// ties because the feed scrolls forward far more often than back.
// Recomputation is O(window), never O(feed).
class PriorityScheduler {
 public:
  // Rank reported for positions outside the window (lowest priority).
  static constexpr std::size_t kOutOfWindow = std::numeric_limits<std::size_t>::max();

  explicit PriorityScheduler(WindowConfig config);

  // Stores the viewport and rebuilds the ordering.  Returns the new ordering.
  const std::vector<int64_t>& Recompute(int64_t viewport_index, int64_t feed_size);

  // Rebuilds the ordering for the stored viewport (feed grew or shrank).
  const std::vector<int64_t>& Refresh(int64_t feed_size);

  // 0 = highest priority; kOutOfWindow if not in the current window.
  std::size_t RankOf(int64_t feed_index) const;
  bool InWindow(int64_t feed_index) const { return RankOf(feed_index) != kOutOfWindow; }

  const std::vector<int64_t>& ordering() const { return ordering_; }
  bool has_viewport() const { return viewport_index_ >= 0; }
  int64_t viewport_index() const { return viewport_index_; }

  // +1 scrolled forward, -1 backward, 0 unchanged or first placement.
  int scroll_direction() const { return scroll_direction_; }

  const WindowConfig& config() const { return config_; }

  static std::vector<int64_t> ComputeOrdering(int64_t viewport_index,
                                              int64_t feed_size,
                                              const WindowConfig& config);

 private:
  WindowConfig config_;
  int64_t viewport_index_ = -1;
  int scroll_direction_ = 0;
  std::vector<int64_t> ordering_;
};

}  // namespace vinefeed::scheduler

#endif  // VINEFEED_SCHEDULER_PRIORITY_SCHEDULER_HPP_
