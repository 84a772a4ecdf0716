// Repository: Retrovue-vinefeed
// Component: Time Source
// Purpose: Injectable millisecond clock for backoff, LRU and warm-up
//          deadlines.
// Copyright (c) 2025 RetroVue

#ifndef VINEFEED_TIME_ITIME_SOURCE_HPP_
#define VINEFEED_TIME_ITIME_SOURCE_HPP_

#include <chrono>
#include <cstdint>

namespace vinefeed::time {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowMs() const = 0;
};

// Monotonic clock.  Values are only meaningful relative to each other.
class SystemTimeSource : public ITimeSource {
 public:
  int64_t NowMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        steady_clock::now().time_since_epoch()).count();
  }
};

}  // namespace vinefeed::time

#endif  // VINEFEED_TIME_ITIME_SOURCE_HPP_
