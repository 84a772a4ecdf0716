// Repository: Retrovue-vinefeed
// Component: Video Resource Manager
// Purpose: Owns the lifecycle of decoder resources for a scrolling short-video
//          feed.  Decides which videos hold a slot, which are warming up and
//          which are released, and routes play/pause to the live handle.
// Copyright (c) 2025 RetroVue

#ifndef VINEFEED_MANAGER_VIDEO_RESOURCE_MANAGER_HPP_
#define VINEFEED_MANAGER_VIDEO_RESOURCE_MANAGER_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "vinefeed/decode/IDecoderBackend.hpp"
#include "vinefeed/feed/IFeedSource.hpp"
#include "vinefeed/manager/IVideoResourceManager.hpp"
#include "vinefeed/manager/ResourceManagerConfig.hpp"
#include "vinefeed/resource/CompletionChannel.hpp"
#include "vinefeed/resource/ResourceTypes.hpp"
#include "vinefeed/resource/RetryBackoff.hpp"
#include "vinefeed/resource/SlotPool.hpp"
#include "vinefeed/resource/WarmupExecutor.hpp"
#include "vinefeed/scheduler/EvictionPolicy.hpp"
#include "vinefeed/scheduler/PriorityScheduler.hpp"
#include "vinefeed/time/ITimeSource.hpp"

namespace vinefeed::manager {

// Diagnostic counters and gauges (see GetMetrics()).
struct ManagerMetrics {
  // Gauges
  std::size_t feed_size = 0;
  std::size_t slot_capacity = 0;
  std::size_t live_slots = 0;
  std::size_t in_flight_warmups = 0;
  std::size_t preparing = 0;
  std::size_t ready = 0;
  std::size_t playing = 0;
  std::size_t paused = 0;
  std::size_t failed = 0;
  std::size_t unloaded = 0;  // Registered or Unregistered
  std::size_t retained_descriptors = 0;
  int64_t viewport_index = -1;
  std::size_t estimated_memory_mb = 0;    // live_slots * memory_per_slot_mb
  double memory_utilization_percent = 0;  // live_slots / slot_capacity

  // Counters (monotonic since construction)
  uint64_t preloads_started = 0;
  uint64_t preloads_succeeded = 0;
  uint64_t preloads_failed = 0;
  uint64_t retries = 0;
  uint64_t timeouts = 0;
  uint64_t evictions = 0;
  uint64_t cancelled_warmups = 0;
  uint64_t stale_completions_discarded = 0;
  uint64_t deferred_acquisitions = 0;
  uint64_t memory_pressure_events = 0;
  uint64_t descriptors_trimmed = 0;
  uint64_t notification_batches = 0;
};

// VideoResourceManager is the single entry point for the UI.
//
// Threading model:
//   - Every public method runs on the owner thread.
//   - Warm-ups run on worker threads owned by WarmupExecutor and report
//     through the CompletionChannel.  Results are applied only inside
//     Pump(), so all state is mutated by the owner thread.
//   - A completion whose generation no longer matches its slot binding is
//     stale and is discarded (its handle destroyed) without touching state.
//
// Notifications: every transition inside one command or one Pump() is
// collected and delivered as one StateChangeBatch after the command's
// outermost pass completes.  A listener may call back into the manager;
// transitions it causes are delivered in a following batch.
class VideoResourceManager : public IVideoResourceManager {
 public:
  // Throws std::invalid_argument if `config` does not validate or `backend`
  // is null.  `feed` and `clock` are optional; a SystemTimeSource is used
  // when no clock is given.
  VideoResourceManager(ResourceManagerConfig config,
                       std::shared_ptr<decode::IDecoderBackend> backend,
                       std::shared_ptr<feed::IFeedSource> feed = nullptr,
                       std::shared_ptr<time::ITimeSource> clock = nullptr);
  ~VideoResourceManager() override;

  VideoResourceManager(const VideoResourceManager&) = delete;
  VideoResourceManager& operator=(const VideoResourceManager&) = delete;

  // IVideoResourceManager
  bool Register(const resource::VideoDescriptor& descriptor) override;
  void RequestPreload(const resource::VideoId& id) override;
  bool SetViewportIndex(int64_t index) override;
  bool Play(const resource::VideoId& id) override;
  bool Pause(const resource::VideoId& id) override;
  void PauseAll() override;
  resource::ResourceState GetState(const resource::VideoId& id) const override;
  decode::IPlaybackHandle* GetController(const resource::VideoId& id) const override;
  bool CanLoadMore() const override;
  SubscriptionToken Subscribe(Listener listener) override;
  bool Unsubscribe(SubscriptionToken token) override;

  // Registers a batch in one pass (one notification batch).  Returns the
  // number of descriptors that were new.  Once config.max_descriptors are
  // held, the oldest descriptors behind the window without a slot are
  // forgotten; a descriptor that still finds no room is rejected.
  std::size_t RegisterAll(const std::vector<resource::VideoDescriptor>& descriptors);

  // Pulls one page (config.feed_page_size) from the feed source and
  // registers it.  Returns the number of new descriptors; 0 without a feed
  // or when the descriptor limit leaves no room.
  std::size_t LoadMoreFromFeed();

  // Releases the id's slot (cancelling an in-flight warm-up).  The
  // descriptor is kept.  Returns false if the id held no slot.
  bool Release(const resource::VideoId& id);

  // Releases every slot.  Returns the number released.
  std::size_t StopAll();

  // Releases every slot except the one at the viewport and the playing one,
  // then trims remembered descriptors to 70% of config.max_descriptors.
  // Returns the number of slots released.
  std::size_t HandleMemoryPressure();

  // Clears the id's backoff history and attempts a warm-up now.  Returns
  // false unless the id is Failed.
  bool RetryFailed(const resource::VideoId& id);

  // Applies pending warm-up completions, enforces the warm-up deadline and
  // runs a scheduling pass.  Returns the number of completions consumed.
  std::size_t Pump();

  // Blocks until a completion is pending or the timeout expires.  Does not
  // apply anything; call Pump() afterwards.
  bool WaitForCompletions(std::chrono::milliseconds timeout);

  // Cancels and joins all warm-ups, releases every slot.  Commands after
  // Shutdown() are rejected.  Idempotent; also run by the destructor.
  void Shutdown();

  std::optional<resource::VideoStateSnapshot> GetSnapshot(const resource::VideoId& id) const;
  ManagerMetrics GetMetrics() const;

  const ResourceManagerConfig& config() const { return config_; }
  int64_t viewport_index() const { return scheduler_.viewport_index(); }
  // Feed positions seen so far, forgotten ones included.  Viewport indices
  // and arrival_order refer to these positions.
  std::size_t feed_size() const {
    return static_cast<std::size_t>(feed_base_) + feed_order_.size();
  }

  // Test-only: forwarded to the executor.  Set before the first warm-up.
  void SetWarmupDelayHook(resource::WarmupExecutor::DelayHookFn hook);

 private:
  enum class PendingCommand {
    kNone,
    kPlay,
    kPause,
  };

  struct VideoRecord {
    resource::VideoDescriptor descriptor;
    resource::ResourceState state = resource::ResourceState::kUnregistered;
    resource::ResourceError error = resource::ResourceError::kNone;
    std::string error_message;
    PendingCommand pending = PendingCommand::kNone;  // At most one per id
  };

  enum class AcquireOutcome {
    kStarted,
    kAlreadyHeld,
    kBackoff,
    kDeferred,
  };

  // Batches notifications for one command.  Nested scopes flush once, when
  // the outermost scope exits.
  class PassScope {
   public:
    explicit PassScope(VideoResourceManager& manager);
    ~PassScope();

    PassScope(const PassScope&) = delete;
    PassScope& operator=(const PassScope&) = delete;

   private:
    VideoResourceManager& manager_;
  };

  VideoRecord* FindRecord(const resource::VideoId& id);
  const VideoRecord* FindRecord(const resource::VideoId& id) const;

  bool RegisterInternal(const resource::VideoDescriptor& descriptor);
  std::size_t RankFor(const VideoRecord& record) const;
  const resource::VideoId* IdAtPosition(int64_t position) const;
  bool InKeepRange(int64_t position) const;
  bool BehindKeepRange(int64_t position) const;
  std::size_t TrimDescriptors(std::size_t limit);

  AcquireOutcome TryAcquire(VideoRecord& record, std::size_t rank, const char* reason);
  std::vector<scheduler::EvictionCandidate> BuildEvictionCandidates() const;
  bool EvictInternal(const resource::VideoId& id, const char* reason);
  std::size_t EvictOutsideKeepRange();

  void ApplyCompletion(resource::WarmupCompletion& completion);
  void FailInternal(VideoRecord& record, resource::ResourceError error,
                    const std::string& message);
  void ExpireTimedOutWarmups();
  void RunSchedulingPass();

  bool PlayInternal(VideoRecord& record);
  bool PauseInternal(VideoRecord& record);

  void Transition(VideoRecord& record, resource::ResourceState to,
                  resource::ResourceError error = resource::ResourceError::kNone);
  void FlushNotifications();
  void CheckInvariants() const;

  int64_t NowMs() const { return clock_->NowMs(); }

  ResourceManagerConfig config_;
  std::shared_ptr<decode::IDecoderBackend> backend_;
  std::shared_ptr<feed::IFeedSource> feed_;
  std::shared_ptr<time::ITimeSource> clock_;

  std::unordered_map<resource::VideoId, VideoRecord> records_;
  // feed_order_[i] is at position feed_base_ + i; positions below
  // feed_base_ have been forgotten.
  std::deque<resource::VideoId> feed_order_;
  int64_t feed_base_ = 0;

  resource::SlotPool pool_;
  scheduler::PriorityScheduler scheduler_;
  scheduler::EvictionPolicy eviction_;
  resource::RetryBackoff backoff_;

  // Declared before executor_: the executor's workers post into the channel
  // until they are joined, so the channel must outlive them.
  resource::CompletionChannel channel_;
  resource::WarmupExecutor executor_;

  std::optional<resource::VideoId> playing_id_;

  std::map<SubscriptionToken, Listener> listeners_;
  SubscriptionToken next_token_ = 1;
  std::vector<resource::StateChange> pending_changes_;
  uint64_t next_batch_sequence_ = 1;
  int pass_depth_ = 0;
  bool flushing_ = false;

  bool shut_down_ = false;

  ManagerMetrics counters_;  // Only the counter fields are maintained here
};

}  // namespace vinefeed::manager

#endif  // VINEFEED_MANAGER_VIDEO_RESOURCE_MANAGER_HPP_
