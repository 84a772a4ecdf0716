// Repository: Retrovue-vinefeed
// Component: In-Memory Feed Source
// Purpose: IFeedSource over a fixed descriptor list, paged.
// Copyright (c) 2025 RetroVue

#ifndef VINEFEED_FEED_IN_MEMORY_FEED_SOURCE_HPP_
#define VINEFEED_FEED_IN_MEMORY_FEED_SOURCE_HPP_

#include <cstddef>
#include <mutex>
#include <vector>

#include "vinefeed/feed/IFeedSource.hpp"

namespace vinefeed::feed {

class InMemoryFeedSource : public IFeedSource {
 public:
  explicit InMemoryFeedSource(std::vector<resource::VideoDescriptor> descriptors);

  bool CanLoadMore() const override;
  std::vector<resource::VideoDescriptor> LoadMore(std::size_t max_count) override;

  // Appends descriptors to the tail (e.g. a late relay response).
  void Append(std::vector<resource::VideoDescriptor> descriptors);

  std::size_t Remaining() const;

 private:
  mutable std::mutex mutex_;
  std::vector<resource::VideoDescriptor> descriptors_;  // Guarded by mutex_
  std::size_t cursor_ = 0;                              // Guarded by mutex_
};

}  // namespace vinefeed::feed

#endif  // VINEFEED_FEED_IN_MEMORY_FEED_SOURCE_HPP_
