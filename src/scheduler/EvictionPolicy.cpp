// Repository: Retrovue-vinefeed
// Component: Eviction Policy Implementation
// Copyright (c) 2025 RetroVue

#include "vinefeed/scheduler/EvictionPolicy.hpp"

namespace vinefeed::scheduler {

std::optional<std::size_t> EvictionPolicy::SelectVictim(
    const std::vector<EvictionCandidate>& candidates,
    std::size_t requester_rank) const {
  std::optional<std::size_t> victim;
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    const auto& c = candidates[i];
    if (c.playing) continue;
    if (c.rank <= requester_rank) continue;

    if (!victim) {
      victim = i;
      continue;
    }
    const auto& best = candidates[*victim];
    if (c.rank > best.rank ||
        (c.rank == best.rank && c.last_touched_ms < best.last_touched_ms)) {
      victim = i;
    }
  }
  return victim;
}

}  // namespace vinefeed::scheduler
