// Repository: StreamTap
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the loop, streaming and app threads.
// Copyright (c) 2025 RetroVue

#include "streamtap/util/Logger.hpp"

#include <cstdlib>
#include <iostream>
#include <ostream>
#include <utility>

namespace streamtap::util {

std::mutex Logger::mutex_;
std::function<void(const std::string&)> Logger::info_sink_;
std::function<void(const std::string&)> Logger::warn_sink_;
std::function<void(const std::string&)> Logger::error_sink_;

namespace {

// Caller holds Logger::mutex_. The sink sees the line before the stream so
// a test that fails on it still has the text in its output.
void EmitLocked(const std::function<void(const std::string&)>& sink,
                std::ostream& stream, const std::string& line) {
  if (sink) sink(line);
  stream << line << '\n';
  stream.flush();
}

}  // namespace

bool Logger::DebugEnabled() {
  // Read once; checked per buffer on streaming threads.
  static const bool enabled = std::getenv("STREAMTAP_DEBUG") != nullptr;
  return enabled;
}

void Logger::SetInfoSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

void Logger::SetWarnSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  EmitLocked(info_sink_, std::cout, line);
}

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  std::lock_guard<std::mutex> lock(mutex_);
  EmitLocked(nullptr, std::cout, line);
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  EmitLocked(warn_sink_, std::cerr, line);
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  EmitLocked(error_sink_, std::cerr, line);
}

}  // namespace streamtap::util
