// Repository: Retrovue-vinefeed
// Component: Resource Manager Configuration
// Copyright (c) 2025 RetroVue

#include "vinefeed/manager/ResourceManagerConfig.hpp"

#include <sstream>

namespace vinefeed::manager {

std::string ResourceManagerConfig::Validate() const {
  std::ostringstream oss;
  if (slot_capacity == 0) {
    oss << "slot_capacity must be at least 1";
  } else if (window.ahead_radius < 0 || window.behind_radius < 0) {
    oss << "window radii must be non-negative (ahead=" << window.ahead_radius
        << " behind=" << window.behind_radius << ")";
  } else if (keep_margin < 0) {
    oss << "keep_margin must be non-negative (" << keep_margin << ")";
  } else if (backoff.base_delay_ms < 0 || backoff.max_delay_ms < backoff.base_delay_ms) {
    oss << "backoff delays invalid (base=" << backoff.base_delay_ms
        << " max=" << backoff.max_delay_ms << ")";
  } else if (backoff.factor < 1.0) {
    oss << "backoff factor must be >= 1.0 (" << backoff.factor << ")";
  } else if (backoff.max_retries < 0) {
    oss << "max_retries must be non-negative (" << backoff.max_retries << ")";
  } else if (warmup_timeout_ms <= 0) {
    oss << "warmup_timeout_ms must be positive (" << warmup_timeout_ms << ")";
  } else if (feed_page_size == 0) {
    oss << "feed_page_size must be at least 1";
  } else if (max_descriptors < slot_capacity) {
    oss << "max_descriptors must be at least slot_capacity (max_descriptors="
        << max_descriptors << " slot_capacity=" << slot_capacity << ")";
  }
  return oss.str();
}

ResourceManagerConfig ResourceManagerConfig::Wifi() {
  ResourceManagerConfig config;
  config.slot_capacity = 4;
  config.window.ahead_radius = 2;
  config.window.behind_radius = 1;
  config.backoff.max_retries = 2;
  config.warmup_timeout_ms = 15000;
  config.max_descriptors = 100;
  return config;
}

ResourceManagerConfig ResourceManagerConfig::Cellular() {
  ResourceManagerConfig config;
  config.slot_capacity = 2;
  config.window.ahead_radius = 1;
  config.window.behind_radius = 0;
  config.keep_margin = 0;
  config.backoff.max_retries = 2;
  config.warmup_timeout_ms = 15000;
  config.max_descriptors = 50;
  return config;
}

ResourceManagerConfig ResourceManagerConfig::Testing() {
  ResourceManagerConfig config;
  config.slot_capacity = 3;
  config.window.ahead_radius = 2;
  config.window.behind_radius = 1;
  config.backoff.max_retries = 1;
  config.warmup_timeout_ms = 500;
  config.feed_page_size = 5;
  config.max_descriptors = 10;
  return config;
}

}  // namespace vinefeed::manager
