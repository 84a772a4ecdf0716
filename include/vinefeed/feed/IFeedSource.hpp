// Repository: Retrovue-vinefeed
// Component: Feed Source Interface
// Purpose: Pagination collaborator that supplies ordered VideoDescriptors.
// Copyright (c) 2025 RetroVue

#ifndef VINEFEED_FEED_IFEED_SOURCE_HPP_
#define VINEFEED_FEED_IFEED_SOURCE_HPP_

#include <cstddef>
#include <vector>

#include "vinefeed/resource/ResourceTypes.hpp"

namespace vinefeed::feed {

// Ranking and curation live behind this interface; the resource manager
// only consumes pages in the order they are returned.
class IFeedSource {
 public:
  virtual ~IFeedSource() = default;

  // True if LoadMore() may still return descriptors.
  virtual bool CanLoadMore() const = 0;

  // Returns up to `max_count` descriptors following the last page.
  virtual std::vector<resource::VideoDescriptor> LoadMore(std::size_t max_count) = 0;
};

}  // namespace vinefeed::feed

#endif  // VINEFEED_FEED_IFEED_SOURCE_HPP_
