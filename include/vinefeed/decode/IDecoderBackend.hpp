// Repository: Retrovue-vinefeed
// Component: Decoder Backend Interface
// Purpose: Contract for the network/decoder collaborator that turns a source
//          URI into a playable handle.
// Copyright (c) 2025 RetroVue

#ifndef VINEFEED_DECODE_IDECODER_BACKEND_HPP_
#define VINEFEED_DECODE_IDECODER_BACKEND_HPP_

#include <atomic>
#include <memory>
#include <string>
#include <utility>

#include "vinefeed/resource/ResourceTypes.hpp"

namespace vinefeed::decode {

// IPlaybackHandle is the decoder/controller a slot owns.  Destroying the
// handle releases every native resource behind it (codec contexts, buffers,
// sockets).  Handles are driven from the owner thread only.
class IPlaybackHandle {
 public:
  virtual ~IPlaybackHandle() = default;

  // Returns false if the backend refused the command.
  virtual bool Play() = 0;
  virtual bool Pause() = 0;

  virtual bool IsPlaying() const = 0;
};

// Cooperative cancellation flag shared between the owner thread (which sets
// it on eviction) and the warm-up worker (which polls it).  Copies share the
// same flag.
class CancelToken {
 public:
  CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void Cancel() const { flag_->store(true, std::memory_order_release); }
  bool IsCancelled() const { return flag_->load(std::memory_order_acquire); }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

// Outcome of one warm-up.  Exactly one of {handle, error != kNone} is set.
struct WarmupResult {
  std::unique_ptr<IPlaybackHandle> handle;
  resource::ResourceError error = resource::ResourceError::kNone;
  std::string message;

  bool ok() const { return handle != nullptr && error == resource::ResourceError::kNone; }

  static WarmupResult Success(std::unique_ptr<IPlaybackHandle> handle) {
    WarmupResult result;
    result.handle = std::move(handle);
    return result;
  }

  static WarmupResult Failure(resource::ResourceError error, std::string message) {
    WarmupResult result;
    result.error = error;
    result.message = std::move(message);
    return result;
  }
};

// IDecoderBackend performs the blocking part of a warm-up: fetch, probe,
// open the codec, decode the first frame.  Warmup() runs on a worker thread
// and may be called concurrently for different descriptors, so
// implementations must be thread-safe.  Implementations should poll
// `cancel` at their natural checkpoints and return kCancelled promptly.
class IDecoderBackend {
 public:
  virtual ~IDecoderBackend() = default;

  virtual WarmupResult Warmup(const resource::VideoDescriptor& descriptor,
                              const CancelToken& cancel) = 0;
};

}  // namespace vinefeed::decode

#endif  // VINEFEED_DECODE_IDECODER_BACKEND_HPP_
