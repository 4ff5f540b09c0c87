// Repository: StreamTap
// Component: Error Taxonomy
// Purpose: Exceptions raised synchronously to the application thread.
// Copyright (c) 2025 RetroVue

#ifndef STREAMTAP_RUNTIME_ERRORS_HPP_
#define STREAMTAP_RUNTIME_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace streamtap {

// Base for every exception StreamTap throws. Engine-side failures (bus error
// messages) are never thrown; they shut the pipeline down and surface as the
// kStopped state instead.
class StreamTapError : public std::runtime_error {
 public:
  explicit StreamTapError(const std::string& what) : std::runtime_error(what) {}
};

// Pipeline/endpoint wiring is wrong: no appsink on Pop(), no appsrc on Push(),
// more than one of either, unparseable description, stopped controller reused.
class ConfigurationError : public StreamTapError {
 public:
  explicit ConfigurationError(const std::string& what) : StreamTapError(what) {}
};

// A format, framerate or array shape cannot be honored.
class FormatError : public StreamTapError {
 public:
  explicit FormatError(const std::string& what) : StreamTapError(what) {}
};

}  // namespace streamtap

#endif  // STREAMTAP_RUNTIME_ERRORS_HPP_
