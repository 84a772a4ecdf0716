// Repository: Retrovue-vinefeed
// Component: Slot Pool
// Purpose: Fixed-capacity collection of ResourceSlots.  Enforces the hard
//          ceiling on concurrently live decoders and owns every slot ↔ id
//          binding.
// Copyright (c) 2025 RetroVue

#ifndef VINEFEED_RESOURCE_SLOT_POOL_HPP_
#define VINEFEED_RESOURCE_SLOT_POOL_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

#include "vinefeed/decode/IDecoderBackend.hpp"
#include "vinefeed/resource/ResourceSlot.hpp"
#include "vinefeed/resource/ResourceTypes.hpp"

namespace vinefeed::resource {

// SlotPool: owner-thread only, not internally synchronized.
//
// Invariants held after every call:
//   occupied() <= capacity()
//   an id is bound to at most one slot
//   every binding gets a generation number never used before
class SlotPool {
 public:
  enum class WarmupApply {
    kApplied,  // Handle attached; slot is Ready
    kStale,    // No binding, different generation, or not Preparing
  };

  // Throws std::invalid_argument if capacity is zero.
  explicit SlotPool(std::size_t capacity);

  SlotPool(const SlotPool&) = delete;
  SlotPool& operator=(const SlotPool&) = delete;

  // Binds a free slot to `id` (Preparing).  Returns nullptr if the pool is
  // full or `id` is already bound.
  ResourceSlot* Acquire(const VideoId& id, int64_t now_ms);

  // Hands a warm-up result to the slot bound to `id`.  On kStale the handle
  // is left in `handle` for the caller to destroy.
  WarmupApply CompleteWarmup(const VideoId& id, uint64_t generation,
                             std::unique_ptr<decode::IPlaybackHandle>& handle,
                             int64_t now_ms);

  // Unbinds and releases the slot bound to `id`.  Returns false if none.
  bool Release(const VideoId& id);

  void ReleaseAll();

  ResourceSlot* Find(const VideoId& id);
  const ResourceSlot* Find(const VideoId& id) const;

  std::vector<const ResourceSlot*> OccupiedSlots() const;

  std::size_t capacity() const { return slots_.size(); }
  std::size_t occupied() const { return bindings_.size(); }
  bool IsFull() const { return occupied() >= capacity(); }

 private:
  std::vector<ResourceSlot> slots_;
  std::unordered_map<VideoId, std::size_t> bindings_;
  uint64_t next_generation_ = 1;
};

}  // namespace vinefeed::resource

#endif  // VINEFEED_RESOURCE_SLOT_POOL_HPP_
