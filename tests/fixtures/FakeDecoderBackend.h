#ifndef VINEFEED_TESTS_FIXTURES_FAKE_DECODER_BACKEND_H_
#define VINEFEED_TESTS_FIXTURES_FAKE_DECODER_BACKEND_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>

#include "vinefeed/decode/IDecoderBackend.hpp"

namespace vinefeed::tests
{

// Playback handle that counts itself in a shared live-handle gauge, so tests
// can observe that evicted or stale handles were destroyed.
class FakePlaybackHandle : public decode::IPlaybackHandle
{
public:
  FakePlaybackHandle(std::string id, std::shared_ptr<std::atomic<int>> live,
                     bool refuse_pause)
      : id_(std::move(id)), live_(std::move(live)), refuse_pause_(refuse_pause)
  {
    live_->fetch_add(1);
  }

  ~FakePlaybackHandle() override { live_->fetch_sub(1); }

  bool Play() override
  {
    playing_ = true;
    return true;
  }

  bool Pause() override
  {
    if (refuse_pause_)
    {
      return false;
    }
    playing_ = false;
    return true;
  }

  bool IsPlaying() const override { return playing_; }

  const std::string& id() const { return id_; }

private:
  std::string id_;
  std::shared_ptr<std::atomic<int>> live_;
  bool refuse_pause_;
  bool playing_ = false;
};

// Scripted IDecoderBackend.
//
//   SetOutcome(id, error)   next warm-ups of `id` fail with `error`
//   Hold(id) / HoldAll()    warm-ups block until released or cancelled
//   Release(id)/ReleaseAll  unblock held warm-ups
//
// A held warm-up that observes its cancel token returns kCancelled and
// counts in CancelObserved().
class FakeDecoderBackend : public decode::IDecoderBackend
{
public:
  FakeDecoderBackend() : live_handles_(std::make_shared<std::atomic<int>>(0)) {}

  decode::WarmupResult Warmup(const resource::VideoDescriptor& descriptor,
                              const decode::CancelToken& cancel) override
  {
    std::unique_lock<std::mutex> lock(mutex_);
    ++calls_[descriptor.id];
    ++total_calls_;
    cv_.notify_all();

    while (hold_all_ || held_.count(descriptor.id) != 0)
    {
      if (cancel.IsCancelled())
      {
        ++cancel_observed_;
        return decode::WarmupResult::Failure(resource::ResourceError::kCancelled,
                                             "fake: cancelled while held");
      }
      cv_.wait_for(lock, std::chrono::milliseconds(2));
    }

    auto it = outcomes_.find(descriptor.id);
    if (it != outcomes_.end())
    {
      return decode::WarmupResult::Failure(it->second, "fake: scripted failure");
    }
    const bool refuse_pause = refuse_pause_.count(descriptor.id) != 0;
    return decode::WarmupResult::Success(
        std::make_unique<FakePlaybackHandle>(descriptor.id, live_handles_, refuse_pause));
  }

  void SetOutcome(const resource::VideoId& id, resource::ResourceError error)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes_[id] = error;
  }

  void ClearOutcome(const resource::VideoId& id)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes_.erase(id);
  }

  void RefusePause(const resource::VideoId& id)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    refuse_pause_.insert(id);
  }

  void Hold(const resource::VideoId& id)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    held_.insert(id);
  }

  void HoldAll()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    hold_all_ = true;
  }

  void Release(const resource::VideoId& id)
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      held_.erase(id);
    }
    cv_.notify_all();
  }

  void ReleaseAll()
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      held_.clear();
      hold_all_ = false;
    }
    cv_.notify_all();
  }

  // Blocks until `count` warm-ups have entered the backend.
  bool WaitForWarmupCalls(int count,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds(2000))
  {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return total_calls_ >= count; });
  }

  int WarmupCalls(const resource::VideoId& id) const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(id);
    return it == calls_.end() ? 0 : it->second;
  }

  int TotalWarmupCalls() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_calls_;
  }

  int CancelObserved() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancel_observed_;
  }

  int LiveHandles() const { return live_handles_->load(); }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<resource::VideoId, resource::ResourceError> outcomes_;
  std::set<resource::VideoId> refuse_pause_;
  std::set<resource::VideoId> held_;
  bool hold_all_ = false;
  std::map<resource::VideoId, int> calls_;
  int total_calls_ = 0;
  int cancel_observed_ = 0;
  std::shared_ptr<std::atomic<int>> live_handles_;
};

} // namespace vinefeed::tests

#endif // VINEFEED_TESTS_FIXTURES_FAKE_DECODER_BACKEND_H_
