// Repository: Retrovue-vinefeed
// Component: Resource Slot
// Purpose: One unit of bounded decoder capacity, bound to at most one video.
// Copyright (c) 2025 RetroVue

#ifndef VINEFEED_RESOURCE_RESOURCE_SLOT_HPP_
#define VINEFEED_RESOURCE_RESOURCE_SLOT_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>

#include "vinefeed/decode/IDecoderBackend.hpp"
#include "vinefeed/resource/ResourceTypes.hpp"

namespace vinefeed::resource {

class SlotPool;

// ResourceSlot owns exactly one playback handle for the video it is bound to.
//
// A slot is not storage for descriptors.
// A slot may be empty, preparing, ready, playing or paused.
//
// Binding, handle attachment and release are performed by SlotPool only
// (the pool is the sole mutator of slot ↔ id bindings).  Play/Pause are
// public: the manager routes playback commands through a borrowed slot.
class ResourceSlot {
 public:
  enum class State {
    kEmpty = 0,
    kPreparing = 1,
    kReady = 2,
    kPlaying = 3,
    kPaused = 4,
  };

  static const char* StateToString(State state);

  explicit ResourceSlot(std::size_t index);

  ResourceSlot(const ResourceSlot&) = delete;
  ResourceSlot& operator=(const ResourceSlot&) = delete;
  ResourceSlot(ResourceSlot&&) = default;
  ResourceSlot& operator=(ResourceSlot&&) = default;

  // Ready/Paused → Playing.  Returns false if not playable or the handle
  // refused; state is unchanged on failure.
  bool Play(int64_t now_ms);

  // Playing → Paused.  Returns false if not playing or the handle refused.
  bool Pause(int64_t now_ms);

  std::size_t index() const { return index_; }
  const VideoId& owner() const { return owner_; }
  uint64_t generation() const { return generation_; }
  State state() const { return state_; }
  bool IsFree() const { return state_ == State::kEmpty; }
  int64_t bound_at_ms() const { return bound_at_ms_; }
  int64_t last_touched_ms() const { return last_touched_ms_; }
  const decode::CancelToken& cancel_token() const { return cancel_token_; }

  // Borrowed; null unless Ready/Playing/Paused.  Invalidated by release.
  decode::IPlaybackHandle* handle() const { return handle_.get(); }

 private:
  friend class SlotPool;

  // Empty → Preparing with a fresh cancel token.
  void Bind(const VideoId& id, uint64_t generation, int64_t now_ms);

  // Preparing → Ready.  Takes ownership of the handle only when the
  // generation matches the current binding; otherwise returns false and the
  // handle is destroyed by the caller's scope.
  bool AttachHandle(uint64_t generation,
                    std::unique_ptr<decode::IPlaybackHandle>& handle,
                    int64_t now_ms);

  // Any → Empty.  Cancels an in-flight warm-up, pauses a playing handle,
  // and destroys the handle.
  void Release();

  std::size_t index_;
  VideoId owner_;
  uint64_t generation_ = 0;
  State state_ = State::kEmpty;
  int64_t bound_at_ms_ = 0;
  int64_t last_touched_ms_ = 0;
  decode::CancelToken cancel_token_;
  std::unique_ptr<decode::IPlaybackHandle> handle_;
};

}  // namespace vinefeed::resource

#endif  // VINEFEED_RESOURCE_RESOURCE_SLOT_HPP_
