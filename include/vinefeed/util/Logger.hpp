// Repository: Retrovue-vinefeed
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the owner thread and
//          warm-up workers.
// Copyright (c) 2025 RetroVue

#ifndef VINEFEED_UTIL_LOGGER_HPP_
#define VINEFEED_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace vinefeed::util {

// Logger writes one full line per call under a single static mutex, so lines
// from the owner thread and concurrent warm-up workers never interleave.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when VINEFEED_DEBUG env is set
// Warn  → stderr (degraded but recoverable: failed warm-up, rejected command)
// Error → stderr (invariant violations, bugs)
//
// Test-only: the sinks are invoked for every line of their level in addition
// to the stream write.  Contract tests use them to count warnings/violations.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // True when VINEFEED_DEBUG is set.  Callers use it to skip building
  // expensive debug lines.
  static bool DebugEnabled();

  // Test-only.  Call with nullptr to clear.
  static void SetInfoSink(Sink sink);
  static void SetWarnSink(Sink sink);
  static void SetErrorSink(Sink sink);

 private:
  static std::mutex mutex_;
  static Sink info_sink_;
  static Sink warn_sink_;
  static Sink error_sink_;
};

}  // namespace vinefeed::util

#endif  // VINEFEED_UTIL_LOGGER_HPP_
