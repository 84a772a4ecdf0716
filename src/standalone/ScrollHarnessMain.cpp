// Repository: Retrovue-vinefeed
// Component: Standalone Scroll Harness
// Purpose: Drives VideoResourceManager through a scripted scroll session
//          against real media files, for diagnostics.
// Copyright (c) 2025 RetroVue
//
// This binary is for testing and diagnostics only.  It stands in for the
// feed UI: it registers the media as a feed, moves the viewport along the
// scroll script, optionally plays the current video, and prints every
// notification batch plus a final metrics snapshot.

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "vinefeed/decode/FFmpegDecoderBackend.hpp"
#include "vinefeed/feed/InMemoryFeedSource.hpp"
#include "vinefeed/manager/ResourceManagerConfig.hpp"
#include "vinefeed/manager/VideoResourceManager.hpp"
#include "vinefeed/resource/ResourceTypes.hpp"

namespace {

using vinefeed::manager::ResourceManagerConfig;
using vinefeed::manager::VideoResourceManager;
using vinefeed::resource::ResourceStateToString;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::vector<std::string> media_paths;
  std::vector<int64_t> scroll_script;  // Viewport indices, in order
  std::string preset = "wifi";
  int capacity = -1;  // -1 = preset value
  int ahead = -1;
  int behind = -1;
  int64_t dwell_ms = 1000;
  bool play = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " --media A.mp4 [B.mp4 ...] [OPTIONS]\n"
            << "\n"
            << "Scripted feed scroll against real media, for diagnostics.\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --media PATH ...     Media files or URLs, in feed order (required)\n"
            << "  --scroll LIST        Comma-separated viewport indices (default: 0..N-1)\n"
            << "  --dwell-ms MS        Time spent at each position (default: 1000)\n"
            << "  --play               Play the video at each position\n"
            << "  --preset NAME        wifi | cellular | testing (default: wifi)\n"
            << "  --capacity N         Override slot capacity\n"
            << "  --ahead N            Override positions preloaded after the viewport\n"
            << "  --behind N           Override positions preloaded before the viewport\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "EXAMPLE:\n"
            << "  " << program_name << " --media a.mp4 b.mp4 c.mp4 d.mp4 \\\n"
            << "      --scroll 0,1,2,3,1 --dwell-ms 500 --play --preset cellular\n"
            << "\n";
}

bool ParseInt(const std::string& text, int64_t& out) {
  if (text.empty()) return false;
  char* end = nullptr;
  const long long value = std::strtoll(text.c_str(), &end, 10);
  if (end == nullptr || *end != '\0') return false;
  out = static_cast<int64_t>(value);
  return true;
}

bool ParseScroll(const std::string& text, std::vector<int64_t>& out) {
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    int64_t index = 0;
    if (!ParseInt(item, index) || index < 0) return false;
    out.push_back(index);
  }
  return !out.empty();
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    int64_t value = 0;

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--media") {
      // Collect all remaining paths until next flag
      while (i + 1 < argc && argv[i + 1][0] != '-') {
        args.media_paths.push_back(argv[++i]);
      }
    } else if (arg == "--scroll" && i + 1 < argc) {
      if (!ParseScroll(argv[++i], args.scroll_script)) {
        args.error = "--scroll expects non-negative comma-separated indices";
        return args;
      }
    } else if (arg == "--dwell-ms" && i + 1 < argc) {
      if (!ParseInt(argv[++i], value) || value < 0) {
        args.error = "--dwell-ms expects a non-negative integer";
        return args;
      }
      args.dwell_ms = value;
    } else if (arg == "--play") {
      args.play = true;
    } else if (arg == "--preset" && i + 1 < argc) {
      args.preset = argv[++i];
    } else if ((arg == "--capacity" || arg == "--ahead" || arg == "--behind") && i + 1 < argc) {
      if (!ParseInt(argv[++i], value) || value < 0) {
        args.error = arg + " expects a non-negative integer";
        return args;
      }
      if (arg == "--capacity") {
        args.capacity = static_cast<int>(value);
      } else if (arg == "--ahead") {
        args.ahead = static_cast<int>(value);
      } else {
        args.behind = static_cast<int>(value);
      }
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.media_paths.empty()) {
    args.error = "Must specify at least one --media path";
    return args;
  }
  if (args.preset != "wifi" && args.preset != "cellular" && args.preset != "testing") {
    args.error = "Unknown preset: " + args.preset;
    return args;
  }
  if (args.scroll_script.empty()) {
    for (std::size_t i = 0; i < args.media_paths.size(); ++i) {
      args.scroll_script.push_back(static_cast<int64_t>(i));
    }
  }

  args.valid = true;
  return args;
}

ResourceManagerConfig BuildConfig(const CliArgs& args) {
  ResourceManagerConfig config;
  if (args.preset == "cellular") {
    config = ResourceManagerConfig::Cellular();
  } else if (args.preset == "testing") {
    config = ResourceManagerConfig::Testing();
  } else {
    config = ResourceManagerConfig::Wifi();
  }
  if (args.capacity >= 0) config.slot_capacity = static_cast<std::size_t>(args.capacity);
  if (args.ahead >= 0) config.window.ahead_radius = args.ahead;
  if (args.behind >= 0) config.window.behind_radius = args.behind;
  return config;
}

std::vector<vinefeed::resource::VideoDescriptor> BuildFeed(const CliArgs& args) {
  std::vector<vinefeed::resource::VideoDescriptor> feed;
  for (std::size_t i = 0; i < args.media_paths.size(); ++i) {
    vinefeed::resource::VideoDescriptor descriptor;
    descriptor.id = "video-" + std::to_string(i);
    descriptor.source_uri = args.media_paths[i];
    feed.push_back(descriptor);
  }
  return feed;
}

void PrintBatch(const vinefeed::resource::StateChangeBatch& batch) {
  for (const auto& change : batch.changes) {
    std::cout << "[HARNESS] batch=" << batch.sequence << " " << change.id << " "
              << ResourceStateToString(change.from) << " -> "
              << ResourceStateToString(change.to);
    if (change.error != vinefeed::resource::ResourceError::kNone) {
      std::cout << " error=" << vinefeed::resource::ResourceErrorToString(change.error);
    }
    std::cout << "\n";
  }
  std::cout.flush();
}

void PrintMetrics(const vinefeed::manager::ManagerMetrics& m) {
  std::cout << "\n[HARNESS] ===== METRICS =====\n"
            << "  feed_size:                   " << m.feed_size << "\n"
            << "  slots:                       " << m.live_slots << "/" << m.slot_capacity << "\n"
            << "  estimated memory:            " << m.estimated_memory_mb << " MB ("
            << m.memory_utilization_percent << "%)\n"
            << "  descriptors retained/trimmed: " << m.retained_descriptors << "/"
            << m.descriptors_trimmed << "\n"
            << "  ready/playing/paused:        " << m.ready << "/" << m.playing << "/"
            << m.paused << "\n"
            << "  failed:                      " << m.failed << "\n"
            << "  preloads started/ok/failed:  " << m.preloads_started << "/"
            << m.preloads_succeeded << "/" << m.preloads_failed << "\n"
            << "  retries:                     " << m.retries << "\n"
            << "  timeouts:                    " << m.timeouts << "\n"
            << "  evictions:                   " << m.evictions << "\n"
            << "  cancelled warm-ups:          " << m.cancelled_warmups << "\n"
            << "  stale completions discarded: " << m.stale_completions_discarded << "\n"
            << "  deferred acquisitions:       " << m.deferred_acquisitions << "\n"
            << "  notification batches:        " << m.notification_batches << "\n";
}

// Pumps the manager until `dwell_ms` has elapsed or termination is requested.
void Dwell(VideoResourceManager& manager, int64_t dwell_ms) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(dwell_ms);
  do {
    manager.WaitForCompletions(std::chrono::milliseconds(20));
    manager.Pump();
  } while (std::chrono::steady_clock::now() < deadline &&
           !g_termination_requested.load(std::memory_order_acquire));
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  const ResourceManagerConfig config = BuildConfig(args);
  const std::string problem = config.Validate();
  if (!problem.empty()) {
    std::cerr << "Error: " << problem << "\n";
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  try {
    auto feed = std::make_shared<vinefeed::feed::InMemoryFeedSource>(BuildFeed(args));
    auto backend = std::make_shared<vinefeed::decode::FFmpegDecoderBackend>();
    VideoResourceManager manager(config, backend, feed);
    manager.Subscribe(PrintBatch);

    while (manager.CanLoadMore()) {
      manager.LoadMoreFromFeed();
    }

    for (int64_t index : args.scroll_script) {
      if (g_termination_requested.load(std::memory_order_acquire)) break;
      if (index >= static_cast<int64_t>(manager.feed_size())) {
        std::cerr << "[HARNESS] skipping index " << index << " (feed_size="
                  << manager.feed_size() << ")\n";
        continue;
      }
      std::cout << "[HARNESS] ---- viewport " << index << " ----\n";
      manager.SetViewportIndex(index);
      if (args.play) {
        manager.Play("video-" + std::to_string(index));
      }
      Dwell(manager, args.dwell_ms);
    }

    manager.PauseAll();
    PrintMetrics(manager.GetMetrics());
    manager.Shutdown();
  } catch (const std::exception& e) {
    std::cerr << "[HARNESS] fatal: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
