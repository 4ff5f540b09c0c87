// Repository: StreamTap
// Component: BufferSource
// Purpose: appsrc endpoint. Encodes application arrays into engine buffers
//          and stamps them with frame-exact timing.
// Copyright (c) 2025 RetroVue

#ifndef STREAMTAP_ENDPOINTS_BUFFER_SOURCE_HPP_
#define STREAMTAP_ENDPOINTS_BUFFER_SOURCE_HPP_

#include <gst/app/gstappsrc.h>
#include <gst/gst.h>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "streamtap/buffer/NDArray.hpp"
#include "streamtap/format/FormatDescriptor.hpp"
#include "streamtap/format/RationalFps.hpp"
#include "streamtap/gst/GstPtr.hpp"

namespace streamtap::endpoints {

// Video parameters for an appsrc that carries no caps of its own.
// framerate accepts an integer (30 → 30/1) or RationalFps::Parse("30000/1001").
struct SourceVideoFormat {
  int32_t width = 0;
  int32_t height = 0;
  format::RationalFps framerate;
  std::string format = "RGB";
};

// BufferSource wraps the pipeline's single appsrc.
//
// The format comes from the element's own caps when the pipeline
// description sets them, otherwise from SetVideoFormat() (once). Every
// Push() is stamped from a monotonically increasing frame index:
//   pts      = index * duration (exact rational scaling)
//   duration = 1 / framerate      (video), samples / rate (audio)
//   offset   = index
//   dts      = unset
// With a blocking appsrc a full internal queue stalls Push(); that is the
// engine's backpressure reaching the application.
//
// Thread safety: Push() calls are serialized; the index never repeats.
class BufferSource {
 public:
  // Takes its own reference on `appsrc`, switches it to TIME format and
  // blocking mode, and adopts any caps already set on it.
  // Throws ConfigurationError if the element is not an appsrc.
  explicit BufferSource(GstElement* appsrc);

  BufferSource(const BufferSource&) = delete;
  BufferSource& operator=(const BufferSource&) = delete;

  // Sets caps from explicit video parameters. Returns false (and changes
  // nothing) when the source already has a format. Throws FormatError for
  // an unknown format tag, bad dimensions or a non-positive framerate.
  bool SetVideoFormat(const SourceVideoFormat& video);

  // Encodes and pushes one array. Returns false when the engine refused
  // the buffer (flushing, EOS, not negotiated). Throws FormatError when no
  // format is set or the array does not match it.
  bool Push(buffer::NDArray array);

  // Signals end-of-stream downstream after queued buffers.
  bool EndOfStream();

  std::optional<format::FormatDescriptor> Format() const;
  bool HasFormat() const;
  uint64_t BuffersPushed() const;
  const std::string& name() const { return name_; }

 private:
  gst::ElementPtr element_;
  std::string name_;

  mutable std::mutex mutex_;
  std::optional<format::FormatDescriptor> format_;
  uint64_t buffer_index_ = 0;
  uint64_t samples_pushed_ = 0;  // audio only
};

}  // namespace streamtap::endpoints

#endif  // STREAMTAP_ENDPOINTS_BUFFER_SOURCE_HPP_
