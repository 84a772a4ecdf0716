// Repository: Retrovue-vinefeed
// Component: Resource Slot
// Purpose: Implementation of ResourceSlot.
// Copyright (c) 2025 RetroVue

#include "vinefeed/resource/ResourceSlot.hpp"

#include <sstream>

#include "vinefeed/util/Logger.hpp"

namespace vinefeed::resource {

const char* ResourceSlot::StateToString(State state) {
  switch (state) {
    case State::kEmpty:
      return "EMPTY";
    case State::kPreparing:
      return "PREPARING";
    case State::kReady:
      return "READY";
    case State::kPlaying:
      return "PLAYING";
    case State::kPaused:
      return "PAUSED";
  }
  return "UNKNOWN";
}

ResourceSlot::ResourceSlot(std::size_t index) : index_(index) {}

bool ResourceSlot::Play(int64_t now_ms) {
  if (state_ != State::kReady && state_ != State::kPaused) return false;
  if (!handle_ || !handle_->Play()) return false;
  state_ = State::kPlaying;
  last_touched_ms_ = now_ms;
  return true;
}

bool ResourceSlot::Pause(int64_t now_ms) {
  if (state_ != State::kPlaying) return false;
  if (!handle_ || !handle_->Pause()) return false;
  state_ = State::kPaused;
  last_touched_ms_ = now_ms;
  return true;
}

void ResourceSlot::Bind(const VideoId& id, uint64_t generation, int64_t now_ms) {
  owner_ = id;
  generation_ = generation;
  state_ = State::kPreparing;
  bound_at_ms_ = now_ms;
  last_touched_ms_ = now_ms;
  // The previous token stays with whatever worker still holds it.
  cancel_token_ = decode::CancelToken();
  handle_.reset();
}

bool ResourceSlot::AttachHandle(uint64_t generation,
                                std::unique_ptr<decode::IPlaybackHandle>& handle,
                                int64_t now_ms) {
  if (state_ != State::kPreparing || generation != generation_ || !handle) {
    return false;
  }
  handle_ = std::move(handle);
  state_ = State::kReady;
  last_touched_ms_ = now_ms;
  return true;
}

void ResourceSlot::Release() {
  if (state_ == State::kPreparing) {
    cancel_token_.Cancel();
  }
  if (handle_) {
    if (handle_->IsPlaying() && !handle_->Pause()) {
      std::ostringstream oss;
      oss << "[ResourceSlot] RELEASE_PAUSE_REFUSED slot=" << index_
          << " video_id=" << owner_ << " generation=" << generation_;
      util::Logger::Warn(oss.str());
    }
    handle_.reset();
  }
  owner_.clear();
  state_ = State::kEmpty;
  bound_at_ms_ = 0;
}

}  // namespace vinefeed::resource
