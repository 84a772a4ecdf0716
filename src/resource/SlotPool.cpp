// Repository: Retrovue-vinefeed
// Component: Slot Pool Implementation
// Copyright (c) 2025 RetroVue

#include "vinefeed/resource/SlotPool.hpp"

#include <sstream>
#include <stdexcept>

#include "vinefeed/util/Logger.hpp"

namespace vinefeed::resource {

using vinefeed::util::Logger;

SlotPool::SlotPool(std::size_t capacity) {
  if (capacity == 0) {
    throw std::invalid_argument("SlotPool requires a capacity of at least 1");
  }
  slots_.reserve(capacity);
  for (std::size_t i = 0; i < capacity; ++i) {
    slots_.emplace_back(i);
  }
}

ResourceSlot* SlotPool::Acquire(const VideoId& id, int64_t now_ms) {
  if (bindings_.count(id) != 0) return nullptr;
  if (IsFull()) return nullptr;

  for (auto& slot : slots_) {
    if (!slot.IsFree()) continue;
    slot.Bind(id, next_generation_++, now_ms);
    bindings_.emplace(id, slot.index());
    return &slot;
  }

  // bindings_ and slot states disagree.
  std::ostringstream oss;
  oss << "[SlotPool] BINDING_MISMATCH occupied=" << bindings_.size()
      << " capacity=" << slots_.size() << " but no free slot";
  Logger::Error(oss.str());
  return nullptr;
}

SlotPool::WarmupApply SlotPool::CompleteWarmup(
    const VideoId& id, uint64_t generation,
    std::unique_ptr<decode::IPlaybackHandle>& handle, int64_t now_ms) {
  ResourceSlot* slot = Find(id);
  if (slot == nullptr) return WarmupApply::kStale;
  if (!slot->AttachHandle(generation, handle, now_ms)) {
    return WarmupApply::kStale;
  }
  return WarmupApply::kApplied;
}

bool SlotPool::Release(const VideoId& id) {
  auto it = bindings_.find(id);
  if (it == bindings_.end()) return false;
  slots_[it->second].Release();
  bindings_.erase(it);
  return true;
}

void SlotPool::ReleaseAll() {
  for (auto& slot : slots_) {
    if (!slot.IsFree()) {
      slot.Release();
    }
  }
  bindings_.clear();
}

ResourceSlot* SlotPool::Find(const VideoId& id) {
  auto it = bindings_.find(id);
  if (it == bindings_.end()) return nullptr;
  return &slots_[it->second];
}

const ResourceSlot* SlotPool::Find(const VideoId& id) const {
  auto it = bindings_.find(id);
  if (it == bindings_.end()) return nullptr;
  return &slots_[it->second];
}

std::vector<const ResourceSlot*> SlotPool::OccupiedSlots() const {
  std::vector<const ResourceSlot*> out;
  out.reserve(bindings_.size());
  for (const auto& slot : slots_) {
    if (!slot.IsFree()) {
      out.push_back(&slot);
    }
  }
  return out;
}

}  // namespace vinefeed::resource
