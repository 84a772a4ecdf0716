// Repository: Retrovue-vinefeed
// Component: Resource Types
// Purpose: Identifiers, descriptors, lifecycle states and error codes shared
//          by the slot pool, scheduler and manager.
// Copyright (c) 2025 RetroVue

#ifndef VINEFEED_RESOURCE_RESOURCE_TYPES_HPP_
#define VINEFEED_RESOURCE_RESOURCE_TYPES_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace vinefeed::resource {

// Opaque, content-addressed key (e.g. a feed event id).  Never empty.
using VideoId = std::string;

// =============================================================================
// VideoDescriptor
// Created once when the feed registers a video; never mutated afterwards.
// =============================================================================

struct VideoDescriptor {
  VideoId id;
  std::string source_uri;
  int64_t duration_ms = 0;

  // Feed position.  Assigned by the manager at registration; any value set
  // by the caller is overwritten.
  int64_t arrival_order = -1;
};

// =============================================================================
// ResourceState
// One state per VideoId, owned exclusively by the manager.
//
//   Unregistered → Registered            first registration
//   Registered   → Preparing             selected by the scheduler
//   Preparing    → Ready | Failed        warm-up completion
//   Ready ↔ Playing ↔ Paused             play / pause commands
//   any          → Unregistered          eviction (descriptor retained)
// =============================================================================

enum class ResourceState {
  kUnregistered = 0,
  kRegistered = 1,
  kPreparing = 2,
  kReady = 3,
  kPlaying = 4,
  kPaused = 5,
  kFailed = 6,
};

const char* ResourceStateToString(ResourceState state);

// Preparing/Ready/Playing/Paused: a slot is bound to the id.
bool HoldsSlot(ResourceState state);

// Ready/Playing/Paused: the slot carries a live playback handle.
bool IsPlayable(ResourceState state);

// =============================================================================
// Error Codes
// =============================================================================

enum class ResourceError {
  kNone = 0,

  // Network or URI failure (unreachable host, 404, malformed/empty URI).
  kSourceUnavailable,

  // Codec rejected the content.
  kDecodeFailure,

  // Warm-up superseded by eviction.  Expected; never surfaced.
  kCancelled,

  // Pool full and nothing evictable.  Preload deferred; never surfaced.
  kCapacityExhausted,

  // Warm-up still preparing past the hard deadline.
  kTimedOut,
};

const char* ResourceErrorToString(ResourceError error);

// =============================================================================
// Change notifications
// =============================================================================

struct StateChange {
  VideoId id;
  ResourceState from = ResourceState::kUnregistered;
  ResourceState to = ResourceState::kUnregistered;
  ResourceError error = ResourceError::kNone;  // Set when `to` is kFailed
};

// All transitions produced by one command or one Pump() pass, in the order
// they occurred.
struct StateChangeBatch {
  uint64_t sequence = 0;
  std::vector<StateChange> changes;
};

// Point-in-time record returned by IVideoResourceManager::GetSnapshot().
struct VideoStateSnapshot {
  VideoDescriptor descriptor;
  ResourceState state = ResourceState::kUnregistered;
  ResourceError error = ResourceError::kNone;
  std::string error_message;
  int failed_attempts = 0;
  int64_t next_retry_at_ms = 0;
  bool retries_exhausted = false;
  bool has_slot = false;
  bool play_pending = false;
};

}  // namespace vinefeed::resource

#endif  // VINEFEED_RESOURCE_RESOURCE_TYPES_HPP_
