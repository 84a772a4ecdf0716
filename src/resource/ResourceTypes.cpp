// Repository: Retrovue-vinefeed
// Component: Resource Types Implementation
// Copyright (c) 2025 RetroVue

#include "vinefeed/resource/ResourceTypes.hpp"

namespace vinefeed::resource {

const char* ResourceStateToString(ResourceState state) {
  switch (state) {
    case ResourceState::kUnregistered:
      return "UNREGISTERED";
    case ResourceState::kRegistered:
      return "REGISTERED";
    case ResourceState::kPreparing:
      return "PREPARING";
    case ResourceState::kReady:
      return "READY";
    case ResourceState::kPlaying:
      return "PLAYING";
    case ResourceState::kPaused:
      return "PAUSED";
    case ResourceState::kFailed:
      return "FAILED";
  }
  return "UNKNOWN_STATE";
}

bool HoldsSlot(ResourceState state) {
  return state == ResourceState::kPreparing || IsPlayable(state);
}

bool IsPlayable(ResourceState state) {
  return state == ResourceState::kReady ||
         state == ResourceState::kPlaying ||
         state == ResourceState::kPaused;
}

// New error codes may be added; existing codes must not change meaning.
const char* ResourceErrorToString(ResourceError error) {
  switch (error) {
    case ResourceError::kNone:
      return "NONE";
    case ResourceError::kSourceUnavailable:
      return "SOURCE_UNAVAILABLE";
    case ResourceError::kDecodeFailure:
      return "DECODE_FAILURE";
    case ResourceError::kCancelled:
      return "CANCELLED";
    case ResourceError::kCapacityExhausted:
      return "CAPACITY_EXHAUSTED";
    case ResourceError::kTimedOut:
      return "TIMED_OUT";
  }
  return "UNKNOWN_ERROR";
}

}  // namespace vinefeed::resource
