// Repository: Retrovue-vinefeed
// Component: Video Resource Manager Implementation
// Purpose: Slot allocation, priority-driven eviction, warm-up completion and
//          playback routing for the feed.
// Copyright (c) 2025 RetroVue

#include "vinefeed/manager/VideoResourceManager.hpp"

#include <algorithm>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "vinefeed/util/Logger.hpp"

namespace vinefeed::manager {

using resource::ResourceError;
using resource::ResourceSlot;
using resource::ResourceState;
using resource::ResourceStateToString;
using resource::VideoDescriptor;
using resource::VideoId;
using vinefeed::util::Logger;

namespace {

ResourceManagerConfig ValidatedConfig(ResourceManagerConfig config) {
  const std::string problem = config.Validate();
  if (!problem.empty()) {
    throw std::invalid_argument("VideoResourceManager: " + problem);
  }
  return config;
}

std::shared_ptr<decode::IDecoderBackend> RequireBackend(
    std::shared_ptr<decode::IDecoderBackend> backend) {
  if (!backend) {
    throw std::invalid_argument("VideoResourceManager requires a decoder backend");
  }
  return backend;
}

std::shared_ptr<time::ITimeSource> ClockOrDefault(std::shared_ptr<time::ITimeSource> clock) {
  if (clock) return clock;
  return std::make_shared<time::SystemTimeSource>();
}

}  // namespace

// =============================================================================
// PassScope
// =============================================================================

VideoResourceManager::PassScope::PassScope(VideoResourceManager& manager)
    : manager_(manager) {
  ++manager_.pass_depth_;
}

VideoResourceManager::PassScope::~PassScope() {
  if (--manager_.pass_depth_ == 0) {
    manager_.CheckInvariants();
    manager_.FlushNotifications();
  }
}

// =============================================================================
// Construction
// =============================================================================

VideoResourceManager::VideoResourceManager(ResourceManagerConfig config,
                                           std::shared_ptr<decode::IDecoderBackend> backend,
                                           std::shared_ptr<feed::IFeedSource> feed,
                                           std::shared_ptr<time::ITimeSource> clock)
    : config_(ValidatedConfig(std::move(config))),
      backend_(RequireBackend(std::move(backend))),
      feed_(std::move(feed)),
      clock_(ClockOrDefault(std::move(clock))),
      pool_(config_.slot_capacity),
      scheduler_(config_.window),
      backoff_(config_.backoff),
      executor_(backend_, channel_, clock_) {
  std::ostringstream oss;
  oss << "[VideoResourceManager] INIT capacity=" << config_.slot_capacity
      << " ahead=" << config_.window.ahead_radius
      << " behind=" << config_.window.behind_radius
      << " keep_margin=" << config_.keep_margin
      << " warmup_timeout_ms=" << config_.warmup_timeout_ms
      << " max_retries=" << config_.backoff.max_retries;
  Logger::Info(oss.str());
}

VideoResourceManager::~VideoResourceManager() {
  // Nobody may observe a manager that is being destroyed.
  listeners_.clear();
  Shutdown();
}

void VideoResourceManager::SetWarmupDelayHook(resource::WarmupExecutor::DelayHookFn hook) {
  executor_.SetDelayHook(std::move(hook));
}

// =============================================================================
// Lookup helpers
// =============================================================================

VideoResourceManager::VideoRecord* VideoResourceManager::FindRecord(const VideoId& id) {
  auto it = records_.find(id);
  return it == records_.end() ? nullptr : &it->second;
}

const VideoResourceManager::VideoRecord* VideoResourceManager::FindRecord(
    const VideoId& id) const {
  auto it = records_.find(id);
  return it == records_.end() ? nullptr : &it->second;
}

std::size_t VideoResourceManager::RankFor(const VideoRecord& record) const {
  return scheduler_.RankOf(record.descriptor.arrival_order);
}

const VideoId* VideoResourceManager::IdAtPosition(int64_t position) const {
  if (position < feed_base_) return nullptr;
  const auto offset = static_cast<uint64_t>(position - feed_base_);
  if (offset >= feed_order_.size()) return nullptr;
  return &feed_order_[static_cast<std::size_t>(offset)];
}

// Keep range: [v - behind - margin, v + ahead + margin].  Compared as
// distances from the viewport; both operands are non-negative.
bool VideoResourceManager::InKeepRange(int64_t position) const {
  const int64_t viewport = scheduler_.viewport_index();
  if (viewport < 0 || position < 0) return false;
  if (position >= viewport) {
    return position - viewport <=
           static_cast<int64_t>(config_.window.ahead_radius) + config_.keep_margin;
  }
  return !BehindKeepRange(position);
}

bool VideoResourceManager::BehindKeepRange(int64_t position) const {
  const int64_t viewport = scheduler_.viewport_index();
  if (viewport < 0) return true;
  return position < viewport &&
         viewport - position >
             static_cast<int64_t>(config_.window.behind_radius) + config_.keep_margin;
}

// =============================================================================
// Registration
// =============================================================================

bool VideoResourceManager::Register(const VideoDescriptor& descriptor) {
  if (shut_down_) return false;
  PassScope pass(*this);
  const bool added = RegisterInternal(descriptor);
  if (added && scheduler_.has_viewport()) {
    scheduler_.Refresh(static_cast<int64_t>(feed_size()));
  }
  return added;
}

std::size_t VideoResourceManager::RegisterAll(const std::vector<VideoDescriptor>& descriptors) {
  if (shut_down_) return 0;
  PassScope pass(*this);
  std::size_t added = 0;
  for (const auto& descriptor : descriptors) {
    if (RegisterInternal(descriptor)) ++added;
  }
  if (added > 0 && scheduler_.has_viewport()) {
    scheduler_.Refresh(static_cast<int64_t>(feed_size()));
  }
  return added;
}

std::size_t VideoResourceManager::LoadMoreFromFeed() {
  if (shut_down_ || !feed_ || !feed_->CanLoadMore()) return 0;
  PassScope pass(*this);

  const std::size_t page_size = std::min(config_.feed_page_size, config_.max_descriptors);
  TrimDescriptors(config_.max_descriptors - page_size);
  const std::size_t room = config_.max_descriptors - records_.size();
  if (room == 0) {
    std::ostringstream oss;
    oss << "[VideoResourceManager] FEED_PAGE_DEFERRED reason=descriptor_limit retained="
        << records_.size() << " viewport=" << scheduler_.viewport_index();
    Logger::Warn(oss.str());
    return 0;
  }

  const auto page = feed_->LoadMore(std::min(page_size, room));
  const std::size_t added = RegisterAll(page);

  std::ostringstream oss;
  oss << "[VideoResourceManager] FEED_PAGE received=" << page.size()
      << " registered=" << added << " feed_size=" << feed_size()
      << " retained=" << records_.size();
  Logger::Info(oss.str());
  return added;
}

bool VideoResourceManager::RegisterInternal(const VideoDescriptor& descriptor) {
  if (descriptor.id.empty()) {
    Logger::Warn("[VideoResourceManager] REGISTER_REJECTED reason=empty_id");
    return false;
  }
  if (records_.count(descriptor.id) != 0) {
    return false;
  }
  if (records_.size() >= config_.max_descriptors) {
    TrimDescriptors(config_.max_descriptors - 1);
    if (records_.size() >= config_.max_descriptors) {
      Logger::Warn("[VideoResourceManager] REGISTER_REJECTED video_id=" + descriptor.id +
                   " reason=descriptor_limit");
      return false;
    }
  }

  VideoRecord record;
  record.descriptor = descriptor;
  record.descriptor.arrival_order = static_cast<int64_t>(feed_size());
  feed_order_.push_back(descriptor.id);
  auto inserted = records_.emplace(descriptor.id, std::move(record));
  Transition(inserted.first->second, ResourceState::kRegistered);
  return true;
}

// Forgets the oldest descriptors until at most `limit` remain.  Stops at the
// first one that holds a slot or is not behind the keep range, so the
// remembered positions stay contiguous.
std::size_t VideoResourceManager::TrimDescriptors(std::size_t limit) {
  std::size_t trimmed = 0;
  while (records_.size() > limit && !feed_order_.empty()) {
    const VideoId id = feed_order_.front();
    if (VideoRecord* record = FindRecord(id)) {
      if (resource::HoldsSlot(record->state) || !BehindKeepRange(feed_base_)) break;
      Transition(*record, ResourceState::kUnregistered);
      records_.erase(id);
    }
    backoff_.Reset(id);
    feed_order_.pop_front();
    ++feed_base_;
    ++trimmed;
  }
  if (trimmed == 0) return 0;

  counters_.descriptors_trimmed += trimmed;
  std::ostringstream oss;
  oss << "[VideoResourceManager] DESCRIPTORS_TRIMMED count=" << trimmed
      << " first_position=" << feed_base_ << " retained=" << records_.size();
  Logger::Info(oss.str());
  return trimmed;
}

// =============================================================================
// Slot acquisition and eviction
// =============================================================================

VideoResourceManager::AcquireOutcome VideoResourceManager::TryAcquire(VideoRecord& record,
                                                                      std::size_t rank,
                                                                      const char* reason) {
  const VideoId& id = record.descriptor.id;
  const int64_t now = NowMs();

  if (resource::HoldsSlot(record.state)) {
    return AcquireOutcome::kAlreadyHeld;
  }
  const bool is_retry = record.state == ResourceState::kFailed;
  if (is_retry && !backoff_.CanAttempt(id, now)) {
    return AcquireOutcome::kBackoff;
  }

  // Workers of released warm-ups run until the backend returns; they count
  // against the capacity as much as bound ones do.
  executor_.ReapFinished();
  if (executor_.InFlight() >= pool_.capacity()) {
    ++counters_.deferred_acquisitions;
    if (Logger::DebugEnabled()) {
      std::ostringstream oss;
      oss << "[VideoResourceManager] ACQUIRE_DEFERRED video_id=" << id
          << " rank=" << rank << " reason=workers_busy in_flight=" << executor_.InFlight();
      Logger::Debug(oss.str());
    }
    return AcquireOutcome::kDeferred;
  }

  if (pool_.IsFull()) {
    const auto candidates = BuildEvictionCandidates();
    const auto victim = eviction_.SelectVictim(candidates, rank);
    if (!victim) {
      ++counters_.deferred_acquisitions;
      if (Logger::DebugEnabled()) {
        std::ostringstream oss;
        oss << "[VideoResourceManager] ACQUIRE_DEFERRED video_id=" << id
            << " rank=" << rank << " reason="
            << resource::ResourceErrorToString(ResourceError::kCapacityExhausted);
        Logger::Debug(oss.str());
      }
      return AcquireOutcome::kDeferred;
    }
    EvictInternal(candidates[*victim].id, "priority");
  }

  ResourceSlot* slot = pool_.Acquire(id, now);
  if (slot == nullptr) {
    std::ostringstream oss;
    oss << "[VideoResourceManager] ACQUIRE_FAILED video_id=" << id
        << " occupied=" << pool_.occupied() << " capacity=" << pool_.capacity();
    Logger::Error(oss.str());
    return AcquireOutcome::kDeferred;
  }

  if (is_retry) ++counters_.retries;
  ++counters_.preloads_started;
  record.error = ResourceError::kNone;
  record.error_message.clear();
  Transition(record, ResourceState::kPreparing);

  {
    std::ostringstream oss;
    oss << "[VideoResourceManager] WARMUP_START video_id=" << id
        << " slot=" << slot->index() << " generation=" << slot->generation()
        << " rank=";
    if (rank == scheduler::PriorityScheduler::kOutOfWindow) {
      oss << "none";
    } else {
      oss << rank;
    }
    oss << " reason=" << reason;
    Logger::Info(oss.str());
  }

  executor_.Start(record.descriptor, slot->generation(), slot->cancel_token());
  return AcquireOutcome::kStarted;
}

std::vector<scheduler::EvictionCandidate> VideoResourceManager::BuildEvictionCandidates() const {
  std::vector<scheduler::EvictionCandidate> candidates;
  for (const ResourceSlot* slot : pool_.OccupiedSlots()) {
    const VideoRecord* record = FindRecord(slot->owner());
    scheduler::EvictionCandidate candidate;
    candidate.id = slot->owner();
    candidate.rank = record != nullptr ? RankFor(*record)
                                       : scheduler::PriorityScheduler::kOutOfWindow;
    candidate.last_touched_ms = slot->last_touched_ms();
    candidate.playing = slot->state() == ResourceSlot::State::kPlaying;
    candidates.push_back(std::move(candidate));
  }
  return candidates;
}

bool VideoResourceManager::EvictInternal(const VideoId& id, const char* reason) {
  const ResourceSlot* slot = pool_.Find(id);
  if (slot == nullptr) return false;

  const bool was_preparing = slot->state() == ResourceSlot::State::kPreparing;
  const std::size_t slot_index = slot->index();
  const uint64_t generation = slot->generation();

  if (playing_id_ && *playing_id_ == id) {
    playing_id_.reset();
  }
  pool_.Release(id);

  ++counters_.evictions;
  if (was_preparing) ++counters_.cancelled_warmups;

  if (VideoRecord* record = FindRecord(id)) {
    record->pending = PendingCommand::kNone;
    Transition(*record, ResourceState::kUnregistered);
  }

  std::ostringstream oss;
  oss << "[VideoResourceManager] EVICT video_id=" << id << " slot=" << slot_index
      << " generation=" << generation << " reason=" << reason
      << (was_preparing ? " warmup_cancelled=true" : "");
  Logger::Info(oss.str());
  return true;
}

std::size_t VideoResourceManager::EvictOutsideKeepRange() {
  std::vector<VideoId> victims;
  for (const ResourceSlot* slot : pool_.OccupiedSlots()) {
    if (slot->state() == ResourceSlot::State::kPlaying) continue;
    const VideoRecord* record = FindRecord(slot->owner());
    if (record == nullptr) continue;
    if (!InKeepRange(record->descriptor.arrival_order)) {
      victims.push_back(slot->owner());
    }
  }
  for (const auto& id : victims) {
    EvictInternal(id, "out_of_window");
  }
  return victims.size();
}

// =============================================================================
// Commands
// =============================================================================

void VideoResourceManager::RequestPreload(const VideoId& id) {
  if (shut_down_) return;
  PassScope pass(*this);
  VideoRecord* record = FindRecord(id);
  if (record == nullptr) {
    if (Logger::DebugEnabled()) {
      Logger::Debug("[VideoResourceManager] PRELOAD_IGNORED video_id=" + id +
                    " reason=unknown_id");
    }
    return;
  }
  TryAcquire(*record, RankFor(*record), "request");
}

bool VideoResourceManager::SetViewportIndex(int64_t index) {
  if (shut_down_) return false;
  if (index < 0) {
    std::ostringstream oss;
    oss << "[VideoResourceManager] VIEWPORT_REJECTED index=" << index;
    Logger::Warn(oss.str());
    return false;
  }

  PassScope pass(*this);
  scheduler_.Recompute(index, static_cast<int64_t>(feed_size()));
  const std::size_t evicted = EvictOutsideKeepRange();
  RunSchedulingPass();

  std::ostringstream oss;
  oss << "[VideoResourceManager] VIEWPORT index=" << index
      << " direction=" << scheduler_.scroll_direction()
      << " window=" << scheduler_.ordering().size()
      << " evicted=" << evicted
      << " occupied=" << pool_.occupied() << "/" << pool_.capacity();
  Logger::Info(oss.str());
  return true;
}

bool VideoResourceManager::Play(const VideoId& id) {
  if (shut_down_) return false;
  VideoRecord* record = FindRecord(id);
  if (record == nullptr) {
    Logger::Warn("[VideoResourceManager] PLAY_REJECTED video_id=" + id + " reason=unknown_id");
    return false;
  }

  PassScope pass(*this);
  switch (record->state) {
    case ResourceState::kPlaying:
      record->pending = PendingCommand::kNone;
      return true;
    case ResourceState::kReady:
    case ResourceState::kPaused:
      return PlayInternal(*record);
    case ResourceState::kPreparing:
      record->pending = PendingCommand::kPlay;
      return true;
    case ResourceState::kFailed:
      if (backoff_.IsExhausted(id)) {
        Logger::Warn("[VideoResourceManager] PLAY_REJECTED video_id=" + id +
                     " reason=retries_exhausted");
        return false;
      }
      record->pending = PendingCommand::kPlay;
      TryAcquire(*record, RankFor(*record), "play");
      return true;
    case ResourceState::kUnregistered:
    case ResourceState::kRegistered:
      record->pending = PendingCommand::kPlay;
      TryAcquire(*record, RankFor(*record), "play");
      return true;
  }
  return false;
}

bool VideoResourceManager::Pause(const VideoId& id) {
  if (shut_down_) return false;
  VideoRecord* record = FindRecord(id);
  if (record == nullptr) {
    Logger::Warn("[VideoResourceManager] PAUSE_REJECTED video_id=" + id + " reason=unknown_id");
    return false;
  }

  PassScope pass(*this);
  switch (record->state) {
    case ResourceState::kPlaying:
      return PauseInternal(*record);
    case ResourceState::kReady:
    case ResourceState::kPaused:
      record->pending = PendingCommand::kNone;
      return true;
    case ResourceState::kUnregistered:
    case ResourceState::kRegistered:
    case ResourceState::kPreparing:
    case ResourceState::kFailed:
      // Supersedes a pending play.
      record->pending = PendingCommand::kPause;
      return true;
  }
  return false;
}

void VideoResourceManager::PauseAll() {
  if (shut_down_) return;
  PassScope pass(*this);
  if (playing_id_) {
    VideoRecord* record = FindRecord(*playing_id_);
    if (record != nullptr && !PauseInternal(*record)) {
      Logger::Warn("[VideoResourceManager] PAUSE_ALL_REFUSED video_id=" + *playing_id_);
    }
  }
  for (auto& entry : records_) {
    if (entry.second.pending == PendingCommand::kPlay) {
      entry.second.pending = PendingCommand::kNone;
    }
  }
}

bool VideoResourceManager::PlayInternal(VideoRecord& record) {
  const VideoId& id = record.descriptor.id;

  // Single active player.
  if (playing_id_ && *playing_id_ != id) {
    const VideoId previous = *playing_id_;
    VideoRecord* other = FindRecord(previous);
    if (other == nullptr || !PauseInternal(*other)) {
      // A handle that refuses to pause cannot keep its slot while another
      // video plays.
      EvictInternal(previous, "pause_refused");
    }
  }

  ResourceSlot* slot = pool_.Find(id);
  if (slot == nullptr || !slot->Play(NowMs())) {
    Logger::Warn("[VideoResourceManager] PLAY_REFUSED video_id=" + id +
                 " state=" + ResourceStateToString(record.state));
    return false;
  }
  record.pending = PendingCommand::kNone;
  playing_id_ = id;
  Transition(record, ResourceState::kPlaying);
  return true;
}

bool VideoResourceManager::PauseInternal(VideoRecord& record) {
  const VideoId& id = record.descriptor.id;
  ResourceSlot* slot = pool_.Find(id);
  if (slot == nullptr || !slot->Pause(NowMs())) {
    Logger::Warn("[VideoResourceManager] PAUSE_REFUSED video_id=" + id +
                 " state=" + ResourceStateToString(record.state));
    return false;
  }
  record.pending = PendingCommand::kNone;
  if (playing_id_ && *playing_id_ == id) {
    playing_id_.reset();
  }
  Transition(record, ResourceState::kPaused);
  return true;
}

bool VideoResourceManager::Release(const VideoId& id) {
  if (shut_down_) return false;
  PassScope pass(*this);
  return EvictInternal(id, "release");
}

std::size_t VideoResourceManager::StopAll() {
  if (shut_down_) return 0;
  PassScope pass(*this);
  std::vector<VideoId> held;
  for (const ResourceSlot* slot : pool_.OccupiedSlots()) {
    held.push_back(slot->owner());
  }
  for (const auto& id : held) {
    EvictInternal(id, "stop_all");
  }
  for (auto& entry : records_) {
    entry.second.pending = PendingCommand::kNone;
  }
  return held.size();
}

std::size_t VideoResourceManager::HandleMemoryPressure() {
  if (shut_down_) return 0;
  PassScope pass(*this);
  ++counters_.memory_pressure_events;

  std::optional<VideoId> keep;
  if (const VideoId* current = IdAtPosition(scheduler_.viewport_index())) {
    keep = *current;
  }

  std::vector<VideoId> victims;
  for (const ResourceSlot* slot : pool_.OccupiedSlots()) {
    if (slot->state() == ResourceSlot::State::kPlaying) continue;
    if (keep && *keep == slot->owner()) continue;
    victims.push_back(slot->owner());
  }
  for (const auto& id : victims) {
    EvictInternal(id, "memory_pressure");
  }
  const std::size_t trimmed = TrimDescriptors(config_.max_descriptors * 7 / 10);

  std::ostringstream oss;
  oss << "[VideoResourceManager] MEMORY_PRESSURE released=" << victims.size()
      << " occupied=" << pool_.occupied() << " descriptors_trimmed=" << trimmed;
  Logger::Warn(oss.str());
  return victims.size();
}

bool VideoResourceManager::RetryFailed(const VideoId& id) {
  if (shut_down_) return false;
  VideoRecord* record = FindRecord(id);
  if (record == nullptr || record->state != ResourceState::kFailed) return false;

  PassScope pass(*this);
  backoff_.Reset(id);
  TryAcquire(*record, RankFor(*record), "retry");
  return true;
}

// =============================================================================
// Pump: owner-thread application of worker results
// =============================================================================

std::size_t VideoResourceManager::Pump() {
  if (shut_down_) return 0;
  PassScope pass(*this);

  executor_.ReapFinished();
  auto completions = channel_.Drain();
  for (auto& completion : completions) {
    ApplyCompletion(completion);
  }
  ExpireTimedOutWarmups();
  RunSchedulingPass();
  return completions.size();
}

bool VideoResourceManager::WaitForCompletions(std::chrono::milliseconds timeout) {
  return channel_.WaitFor(timeout);
}

void VideoResourceManager::ApplyCompletion(resource::WarmupCompletion& completion) {
  VideoRecord* record = FindRecord(completion.id);
  const ResourceSlot* slot = pool_.Find(completion.id);
  const bool stale = record == nullptr || slot == nullptr ||
                     slot->generation() != completion.generation ||
                     slot->state() != ResourceSlot::State::kPreparing;
  if (stale) {
    ++counters_.stale_completions_discarded;
    if (Logger::DebugEnabled()) {
      std::ostringstream oss;
      oss << "[VideoResourceManager] STALE_COMPLETION video_id=" << completion.id
          << " generation=" << completion.generation
          << " result=" << resource::ResourceErrorToString(completion.result.error);
      Logger::Debug(oss.str());
    }
    completion.result.handle.reset();
    return;
  }

  const VideoId id = completion.id;

  if (completion.result.ok()) {
    const auto applied = pool_.CompleteWarmup(id, completion.generation,
                                              completion.result.handle, NowMs());
    if (applied != resource::SlotPool::WarmupApply::kApplied) {
      ++counters_.stale_completions_discarded;
      completion.result.handle.reset();
      return;
    }
    backoff_.Reset(id);
    ++counters_.preloads_succeeded;
    Transition(*record, ResourceState::kReady);

    std::ostringstream oss;
    oss << "[VideoResourceManager] WARMUP_READY video_id=" << id
        << " generation=" << completion.generation
        << " elapsed_ms=" << completion.elapsed_ms;
    Logger::Info(oss.str());

    const PendingCommand pending = record->pending;
    record->pending = PendingCommand::kNone;
    if (pending == PendingCommand::kPlay) {
      PlayInternal(*record);
    }
    return;
  }

  if (completion.result.error == ResourceError::kCancelled) {
    // The backend gave up on a warm-up we did not cancel.  Not a failure of
    // the source; free the slot and let the scheduler try again.
    pool_.Release(id);
    ++counters_.cancelled_warmups;
    record->pending = PendingCommand::kNone;
    Transition(*record, ResourceState::kUnregistered);
    return;
  }

  FailInternal(*record, completion.result.error, completion.result.message);
}

void VideoResourceManager::FailInternal(VideoRecord& record, ResourceError error,
                                        const std::string& message) {
  const VideoId& id = record.descriptor.id;
  pool_.Release(id);

  record.error = error;
  record.error_message = message;
  const int64_t delay_ms = backoff_.RecordFailure(id, NowMs());
  ++counters_.preloads_failed;
  Transition(record, ResourceState::kFailed, error);

  std::ostringstream oss;
  oss << "[VideoResourceManager] WARMUP_FAILED video_id=" << id
      << " error=" << resource::ResourceErrorToString(error)
      << " attempts=" << backoff_.Failures(id);
  if (delay_ms < 0) {
    oss << " retries_exhausted=true";
  } else {
    oss << " retry_in_ms=" << delay_ms;
  }
  if (!message.empty()) {
    oss << " message=\"" << message << "\"";
  }
  Logger::Warn(oss.str());
}

void VideoResourceManager::ExpireTimedOutWarmups() {
  const int64_t now = NowMs();
  std::vector<VideoId> expired;
  for (const ResourceSlot* slot : pool_.OccupiedSlots()) {
    if (slot->state() == ResourceSlot::State::kPreparing &&
        now - slot->bound_at_ms() >= config_.warmup_timeout_ms) {
      expired.push_back(slot->owner());
    }
  }
  for (const auto& id : expired) {
    VideoRecord* record = FindRecord(id);
    if (record == nullptr) continue;
    ++counters_.timeouts;
    std::ostringstream message;
    message << "warm-up exceeded " << config_.warmup_timeout_ms << " ms";
    FailInternal(*record, ResourceError::kTimedOut, message.str());
  }
}

// Walks the window highest priority first and starts a warm-up for every
// position that holds no slot.  Positions in backoff are skipped; when the
// pool is full and nothing lower-priority is held, the remaining positions
// are deferred to the next pass.
void VideoResourceManager::RunSchedulingPass() {
  if (!scheduler_.has_viewport()) return;

  const std::vector<int64_t> ordering = scheduler_.ordering();
  for (std::size_t rank = 0; rank < ordering.size(); ++rank) {
    const VideoId* id = IdAtPosition(ordering[rank]);
    if (id == nullptr) continue;
    VideoRecord* record = FindRecord(*id);
    if (record == nullptr || resource::HoldsSlot(record->state)) continue;
    if (TryAcquire(*record, rank, "window") == AcquireOutcome::kDeferred) {
      // Every later position has a larger rank; none of them can evict
      // where this one could not.
      break;
    }
  }
}

// =============================================================================
// Queries
// =============================================================================

ResourceState VideoResourceManager::GetState(const VideoId& id) const {
  if (shut_down_) return ResourceState::kUnregistered;
  const VideoRecord* record = FindRecord(id);
  return record == nullptr ? ResourceState::kUnregistered : record->state;
}

decode::IPlaybackHandle* VideoResourceManager::GetController(const VideoId& id) const {
  if (shut_down_) return nullptr;
  const VideoRecord* record = FindRecord(id);
  if (record == nullptr || !resource::IsPlayable(record->state)) return nullptr;
  const ResourceSlot* slot = pool_.Find(id);
  return slot == nullptr ? nullptr : slot->handle();
}

bool VideoResourceManager::CanLoadMore() const {
  return feed_ != nullptr && feed_->CanLoadMore();
}

std::optional<resource::VideoStateSnapshot> VideoResourceManager::GetSnapshot(
    const VideoId& id) const {
  const VideoRecord* record = shut_down_ ? nullptr : FindRecord(id);
  if (record == nullptr) return std::nullopt;

  resource::VideoStateSnapshot snapshot;
  snapshot.descriptor = record->descriptor;
  snapshot.state = record->state;
  snapshot.error = record->error;
  snapshot.error_message = record->error_message;
  snapshot.failed_attempts = backoff_.Failures(id);
  snapshot.next_retry_at_ms = backoff_.NextAttemptAtMs(id);
  snapshot.retries_exhausted = backoff_.IsExhausted(id);
  snapshot.has_slot = pool_.Find(id) != nullptr;
  snapshot.play_pending = record->pending == PendingCommand::kPlay;
  return snapshot;
}

ManagerMetrics VideoResourceManager::GetMetrics() const {
  ManagerMetrics metrics = counters_;
  metrics.feed_size = feed_size();
  metrics.retained_descriptors = records_.size();
  metrics.slot_capacity = pool_.capacity();
  metrics.live_slots = pool_.occupied();
  metrics.estimated_memory_mb = metrics.live_slots * config_.memory_per_slot_mb;
  metrics.memory_utilization_percent =
      100.0 * static_cast<double>(metrics.live_slots) / static_cast<double>(metrics.slot_capacity);
  metrics.in_flight_warmups = executor_.InFlight();
  metrics.viewport_index = scheduler_.viewport_index();
  for (const auto& entry : records_) {
    switch (entry.second.state) {
      case ResourceState::kPreparing: ++metrics.preparing; break;
      case ResourceState::kReady: ++metrics.ready; break;
      case ResourceState::kPlaying: ++metrics.playing; break;
      case ResourceState::kPaused: ++metrics.paused; break;
      case ResourceState::kFailed: ++metrics.failed; break;
      case ResourceState::kRegistered:
      case ResourceState::kUnregistered: ++metrics.unloaded; break;
    }
  }
  return metrics;
}

// =============================================================================
// Notifications
// =============================================================================

VideoResourceManager::SubscriptionToken VideoResourceManager::Subscribe(Listener listener) {
  const SubscriptionToken token = next_token_++;
  listeners_.emplace(token, std::move(listener));
  return token;
}

bool VideoResourceManager::Unsubscribe(SubscriptionToken token) {
  return listeners_.erase(token) != 0;
}

void VideoResourceManager::Transition(VideoRecord& record, ResourceState to,
                                      ResourceError error) {
  const ResourceState from = record.state;
  if (from == to) return;
  record.state = to;
  pending_changes_.push_back(resource::StateChange{record.descriptor.id, from, to, error});

  if (Logger::DebugEnabled()) {
    std::ostringstream oss;
    oss << "[VideoResourceManager] STATE video_id=" << record.descriptor.id
        << " " << ResourceStateToString(from) << "->" << ResourceStateToString(to);
    Logger::Debug(oss.str());
  }
}

// Delivers queued changes one batch at a time.  A listener that issues a
// command re-enters here through that command's PassScope; the flushing_
// guard defers its changes to the next iteration of this loop so batches
// arrive in order.
void VideoResourceManager::FlushNotifications() {
  if (flushing_) return;

  struct FlushingGuard {
    explicit FlushingGuard(bool& flag) : flag_(flag) { flag_ = true; }
    ~FlushingGuard() { flag_ = false; }
    bool& flag_;
  } guard(flushing_);

  while (!pending_changes_.empty()) {
    resource::StateChangeBatch batch;
    batch.sequence = next_batch_sequence_++;
    batch.changes.swap(pending_changes_);
    ++counters_.notification_batches;

    // Copy: a listener may subscribe or unsubscribe during delivery.
    std::vector<Listener> listeners;
    listeners.reserve(listeners_.size());
    for (const auto& entry : listeners_) {
      listeners.push_back(entry.second);
    }
    // Called from ~PassScope, so listener exceptions stop here.
    for (const auto& listener : listeners) {
      try {
        listener(batch);
      } catch (const std::exception& e) {
        std::ostringstream oss;
        oss << "[VideoResourceManager] LISTENER_THREW batch=" << batch.sequence
            << " what=" << e.what();
        Logger::Warn(oss.str());
      }
    }
  }
}

void VideoResourceManager::CheckInvariants() const {
  if (pool_.occupied() > pool_.capacity()) {
    std::ostringstream oss;
    oss << "[VideoResourceManager] INV_CAPACITY_VIOLATED occupied=" << pool_.occupied()
        << " capacity=" << pool_.capacity();
    Logger::Error(oss.str());
  }

  std::size_t playing = 0;
  for (const ResourceSlot* slot : pool_.OccupiedSlots()) {
    const VideoRecord* record = FindRecord(slot->owner());
    if (record == nullptr || !resource::HoldsSlot(record->state)) {
      Logger::Error("[VideoResourceManager] INV_ORPHAN_SLOT video_id=" + slot->owner());
    }
    if (slot->state() == ResourceSlot::State::kPlaying) ++playing;
  }
  if (playing > 1) {
    std::ostringstream oss;
    oss << "[VideoResourceManager] INV_MULTIPLE_PLAYING count=" << playing;
    Logger::Error(oss.str());
  }

  for (const auto& entry : records_) {
    if (resource::HoldsSlot(entry.second.state) && pool_.Find(entry.first) == nullptr) {
      Logger::Error("[VideoResourceManager] INV_UNBOUND_STATE video_id=" + entry.first +
                    " state=" + ResourceStateToString(entry.second.state));
    }
  }

  if (records_.size() > config_.max_descriptors) {
    std::ostringstream oss;
    oss << "[VideoResourceManager] INV_DESCRIPTOR_LIMIT retained=" << records_.size()
        << " max=" << config_.max_descriptors;
    Logger::Error(oss.str());
  }
}

// =============================================================================
// Shutdown
// =============================================================================

void VideoResourceManager::Shutdown() {
  if (shut_down_) return;
  {
    PassScope pass(*this);
    std::vector<VideoId> held;
    for (const ResourceSlot* slot : pool_.OccupiedSlots()) {
      held.push_back(slot->owner());
    }
    for (const auto& id : held) {
      EvictInternal(id, "shutdown");
    }
    executor_.CancelAll();
    // Everything still queued belongs to a binding that no longer exists.
    const auto discarded = channel_.Drain();
    counters_.stale_completions_discarded += discarded.size();
    // Set before the flush so listeners cannot start new work.
    shut_down_ = true;
  }

  const ManagerMetrics metrics = GetMetrics();
  std::ostringstream oss;
  oss << "[VideoResourceManager] SHUTDOWN preloads_started=" << metrics.preloads_started
      << " succeeded=" << metrics.preloads_succeeded
      << " failed=" << metrics.preloads_failed
      << " evictions=" << metrics.evictions
      << " stale_discarded=" << metrics.stale_completions_discarded;
  Logger::Info(oss.str());
}

}  // namespace vinefeed::manager
