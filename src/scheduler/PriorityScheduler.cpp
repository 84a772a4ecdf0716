// Repository: Retrovue-vinefeed
// Component: Priority Scheduler Implementation
// Copyright (c) 2025 RetroVue

#include "vinefeed/scheduler/PriorityScheduler.hpp"

#include <algorithm>

namespace vinefeed::scheduler {

PriorityScheduler::PriorityScheduler(WindowConfig config) : config_(config) {}

std::vector<int64_t> PriorityScheduler::ComputeOrdering(int64_t viewport_index,
                                                        int64_t feed_size,
                                                        const WindowConfig& config) {
  std::vector<int64_t> out;
  if (viewport_index < 0 || feed_size <= 0) return out;

  const int ahead = std::max(0, config.ahead_radius);
  const int behind = std::max(0, config.behind_radius);
  out.reserve(static_cast<std::size_t>(1 + ahead + behind));

  // Bounds are compared as distances so that no position is formed unless
  // it lies in [0, feed_size); the viewport may be any non-negative value.
  if (viewport_index < feed_size) {
    out.push_back(viewport_index);
  }
  const int max_distance = std::max(ahead, behind);
  for (int d = 1; d <= max_distance; ++d) {
    if (d <= ahead && viewport_index < feed_size - d) {
      out.push_back(viewport_index + d);
    }
    if (d <= behind && viewport_index >= d && viewport_index - d < feed_size) {
      out.push_back(viewport_index - d);
    }
  }
  return out;
}

const std::vector<int64_t>& PriorityScheduler::Recompute(int64_t viewport_index,
                                                         int64_t feed_size) {
  if (viewport_index_ < 0 || viewport_index == viewport_index_) {
    scroll_direction_ = 0;
  } else {
    scroll_direction_ = viewport_index > viewport_index_ ? 1 : -1;
  }
  viewport_index_ = viewport_index;
  ordering_ = ComputeOrdering(viewport_index_, feed_size, config_);
  return ordering_;
}

const std::vector<int64_t>& PriorityScheduler::Refresh(int64_t feed_size) {
  ordering_ = ComputeOrdering(viewport_index_, feed_size, config_);
  return ordering_;
}

std::size_t PriorityScheduler::RankOf(int64_t feed_index) const {
  auto it = std::find(ordering_.begin(), ordering_.end(), feed_index);
  if (it == ordering_.end()) return kOutOfWindow;
  return static_cast<std::size_t>(it - ordering_.begin());
}

}  // namespace vinefeed::scheduler
