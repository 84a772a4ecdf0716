// Repository: Retrovue-vinefeed
// Component: In-Memory Feed Source Implementation
// Copyright (c) 2025 RetroVue

#include "vinefeed/feed/InMemoryFeedSource.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace vinefeed::feed {

InMemoryFeedSource::InMemoryFeedSource(std::vector<resource::VideoDescriptor> descriptors)
    : descriptors_(std::move(descriptors)) {}

bool InMemoryFeedSource::CanLoadMore() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cursor_ < descriptors_.size();
}

std::vector<resource::VideoDescriptor> InMemoryFeedSource::LoadMore(std::size_t max_count) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t take = std::min(max_count, descriptors_.size() - cursor_);
  std::vector<resource::VideoDescriptor> page(
      descriptors_.begin() + static_cast<std::ptrdiff_t>(cursor_),
      descriptors_.begin() + static_cast<std::ptrdiff_t>(cursor_ + take));
  cursor_ += take;
  return page;
}

void InMemoryFeedSource::Append(std::vector<resource::VideoDescriptor> descriptors) {
  std::lock_guard<std::mutex> lock(mutex_);
  descriptors_.insert(descriptors_.end(),
                      std::make_move_iterator(descriptors.begin()),
                      std::make_move_iterator(descriptors.end()));
}

std::size_t InMemoryFeedSource::Remaining() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return descriptors_.size() - cursor_;
}

}  // namespace vinefeed::feed
