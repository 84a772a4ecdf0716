// Repository: Retrovue-vinefeed
// Component: Resource Manager Configuration
// Purpose: Capacity, window radii, retry backoff and warm-up deadline for
//          VideoResourceManager.
// Copyright (c) 2025 RetroVue

#ifndef VINEFEED_MANAGER_RESOURCE_MANAGER_CONFIG_HPP_
#define VINEFEED_MANAGER_RESOURCE_MANAGER_CONFIG_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

#include "vinefeed/resource/RetryBackoff.hpp"
#include "vinefeed/scheduler/PriorityScheduler.hpp"

namespace vinefeed::manager {

// Configuration for VideoResourceManager
// POD struct - immutable after construction
struct ResourceManagerConfig {
  std::size_t slot_capacity = 3;      // Hard ceiling on live decoders
  scheduler::WindowConfig window;     // ahead 2, behind 1

  // Held slots this many positions beyond the window survive a viewport
  // change; they are reclaimed only through the eviction policy.  0 evicts
  // everything outside the window on every viewport change.
  int keep_margin = 1;

  resource::BackoffPolicy backoff;    // 1s base, x2, 30s cap, 5 retries

  int64_t warmup_timeout_ms = 10000;  // Hard deadline for a single warm-up

  // Page size used by LoadMoreFromFeed().
  std::size_t feed_page_size = 20;

  // Most descriptors remembered at once.  The oldest ones behind the window
  // that hold no slot are forgotten to make room; memory pressure trims the
  // set to 70% of this.
  std::size_t max_descriptors = 100;

  // Per-decoder estimate reported in ManagerMetrics::estimated_memory_mb.
  std::size_t memory_per_slot_mb = 20;

  // Empty string when valid; otherwise a description of the first problem.
  std::string Validate() const;

  // Presets mirroring the client's network profiles.
  static ResourceManagerConfig Wifi();
  static ResourceManagerConfig Cellular();
  static ResourceManagerConfig Testing();
};

}  // namespace vinefeed::manager

#endif  // VINEFEED_MANAGER_RESOURCE_MANAGER_CONFIG_HPP_
