// Repository: Retrovue-vinefeed
// Component: Video Resource Manager Interface
// Purpose: Public contract the UI layer programs against.
// Copyright (c) 2025 RetroVue

#ifndef VINEFEED_MANAGER_IVIDEO_RESOURCE_MANAGER_HPP_
#define VINEFEED_MANAGER_IVIDEO_RESOURCE_MANAGER_HPP_

#include <cstdint>
#include <functional>

#include "vinefeed/decode/IDecoderBackend.hpp"
#include "vinefeed/resource/ResourceTypes.hpp"

namespace vinefeed::manager {

// IVideoResourceManager defines the commands and reads exposed to the UI.
//
// Threading: every method is called from a single owner thread (the UI event
// loop).  Reads are point-in-time values; a controller returned by
// GetController() must be re-fetched after SetViewportIndex(), since
// eviction can destroy it.
//
// Alternative strategies (e.g. a pool-less implementation for diagnostics)
// implement this interface; the choice is made at construction, never by
// runtime global state.
class IVideoResourceManager {
 public:
  using Listener = std::function<void(const resource::StateChangeBatch&)>;
  using SubscriptionToken = uint64_t;

  virtual ~IVideoResourceManager() = default;

  // Idempotent.  Returns true only when the descriptor was new.  Never
  // blocks, never allocates a decoder.
  virtual bool Register(const resource::VideoDescriptor& descriptor) = 0;

  // Fire-and-forget: moves the id toward Ready.  Failures surface through
  // notifications, never to the caller.
  virtual void RequestPreload(const resource::VideoId& id) = 0;

  // Updates the current feed position and reschedules.  Returns false for a
  // negative index.
  virtual bool SetViewportIndex(int64_t index) = 0;

  // Returns false only when the command cannot be accepted (unknown id,
  // handle refused).  Commands on non-ready ids are remembered, one per id.
  virtual bool Play(const resource::VideoId& id) = 0;
  virtual bool Pause(const resource::VideoId& id) = 0;
  virtual void PauseAll() = 0;

  virtual resource::ResourceState GetState(const resource::VideoId& id) const = 0;

  // Borrowed pointer, null when the id has no live Ready/Playing/Paused slot.
  virtual decode::IPlaybackHandle* GetController(const resource::VideoId& id) const = 0;

  // Delegates to the feed pagination collaborator.
  virtual bool CanLoadMore() const = 0;

  // Listeners run on the owner thread after each command or Pump() pass
  // that changed at least one state.  Listeners must not throw.
  virtual SubscriptionToken Subscribe(Listener listener) = 0;
  virtual bool Unsubscribe(SubscriptionToken token) = 0;
};

}  // namespace vinefeed::manager

#endif  // VINEFEED_MANAGER_IVIDEO_RESOURCE_MANAGER_HPP_
