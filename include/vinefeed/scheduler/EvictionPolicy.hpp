// Repository: Retrovue-vinefeed
// Component: Eviction Policy
// Purpose: Chooses which held slot to reclaim when the pool is full and a
//          higher-priority video asks for one.
// Copyright (c) 2025 RetroVue

#ifndef VINEFEED_SCHEDULER_EVICTION_POLICY_HPP_
#define VINEFEED_SCHEDULER_EVICTION_POLICY_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "vinefeed/resource/ResourceTypes.hpp"

namespace vinefeed::scheduler {

struct EvictionCandidate {
  resource::VideoId id;
  std::size_t rank = 0;         // PriorityScheduler::RankOf(); larger = lower priority
  int64_t last_touched_ms = 0;
  bool playing = false;
};

// Victim selection:
//   1. Playing slots are never candidates.
//   2. Only slots with strictly lower priority than the requester
//      (rank > requester_rank) are candidates.
//   3. Lowest priority wins; equal priorities fall back to least recently
//      touched, so a slot that was just warmed up is not thrashed.
// Returns the index into `candidates`, or nullopt when nothing is
// evictable (the request is deferred).
class EvictionPolicy {
 public:
  std::optional<std::size_t> SelectVictim(const std::vector<EvictionCandidate>& candidates,
                                          std::size_t requester_rank) const;
};

}  // namespace vinefeed::scheduler

#endif  // VINEFEED_SCHEDULER_EVICTION_POLICY_HPP_
