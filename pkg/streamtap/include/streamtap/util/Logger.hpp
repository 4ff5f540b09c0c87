// Repository: StreamTap
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the loop, streaming and app threads.
// Copyright (c) 2025 RetroVue

#ifndef STREAMTAP_UTIL_LOGGER_HPP_
#define STREAMTAP_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace streamtap::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes. Callers are the GLib loop thread (bus messages), GStreamer
// streaming threads (appsink callbacks) and the application thread.
//
// Info  → stdout
// Debug → stdout only when STREAMTAP_DEBUG env is set
// Warn  → stderr
// Error → stderr
//
// Test-only: the Set*Sink hooks install a callback invoked for every line of
// that level (in addition to the stream). Call with nullptr to clear.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // True when STREAMTAP_DEBUG was set at first use. Lets callers skip building
  // per-buffer debug lines on the streaming thread.
  static bool DebugEnabled();

  static void SetInfoSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetErrorSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> info_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace streamtap::util

#endif  // STREAMTAP_UTIL_LOGGER_HPP_
