// Repository: StreamTap
// Component: FormatDescriptor
// Purpose: Video/audio buffer format resolved from negotiated caps.
// Copyright (c) 2025 RetroVue

#ifndef STREAMTAP_FORMAT_FORMAT_DESCRIPTOR_HPP_
#define STREAMTAP_FORMAT_FORMAT_DESCRIPTOR_HPP_

#include <gst/gst.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "streamtap/format/ElementType.hpp"
#include "streamtap/format/RationalFps.hpp"
#include "streamtap/gst/GstPtr.hpp"

namespace streamtap::format {

// Raw video frame layout. row_stride is the byte distance between rows in
// engine memory and may exceed width * channels * element size.
struct VideoFormat {
  int32_t width = 0;
  int32_t height = 0;
  int32_t channels = 0;
  std::string format;  // engine tag, e.g. "RGB", "GRAY16_LE"
  ElementType element_type = ElementType::kUInt8;
  size_t row_stride = 0;
  RationalFps framerate;  // 0/1 when the caps carry none

  size_t element_size() const { return ElementSize(element_type); }
  size_t PackedRowBytes() const {
    return static_cast<size_t>(width) * static_cast<size_t>(channels) *
           element_size();
  }
  // Bytes the engine expects for one frame: every row stride-padded.
  size_t FrameBytes() const { return row_stride * static_cast<size_t>(height); }
};

// Interleaved raw audio. samples_per_channel describes the buffer the
// descriptor was resolved from; each decoded buffer derives its own count.
struct AudioFormat {
  int32_t rate = 0;
  int32_t channels = 0;
  std::string format;  // engine tag, e.g. "S16LE"
  ElementType element_type = ElementType::kUInt8;
  size_t samples_per_channel = 0;
};

// Immutable once resolved. Copyable; each endpoint memoizes its own.
class FormatDescriptor {
 public:
  // Resolves from negotiated caps. buffer_size is the byte length of the
  // buffer the caps arrived with (0 when resolving from pad caps alone);
  // audio uses it for samples_per_channel.
  // Throws FormatError for unfixed, non-raw or unsupported caps.
  static FormatDescriptor FromCaps(const GstCaps* caps, size_t buffer_size);

  // Builds a video descriptor from explicit parameters, computing the row
  // stride the engine would use. Throws FormatError on an unknown or
  // unsupported format tag or non-positive dimensions.
  static FormatDescriptor Video(int32_t width, int32_t height,
                                const std::string& format,
                                RationalFps framerate);

  // Throws FormatError on an unknown format tag or non-positive rate or
  // channel count.
  static FormatDescriptor Audio(int32_t rate, int32_t channels,
                                const std::string& format,
                                size_t samples_per_channel = 0);

  bool IsVideo() const { return std::holds_alternative<VideoFormat>(value_); }
  bool IsAudio() const { return std::holds_alternative<AudioFormat>(value_); }

  // Precondition: IsVideo() / IsAudio(). Throws std::bad_variant_access
  // otherwise.
  const VideoFormat& video() const { return std::get<VideoFormat>(value_); }
  const AudioFormat& audio() const { return std::get<AudioFormat>(value_); }

  int32_t Channels() const;
  ElementType element_type() const;
  size_t ElementBytes() const { return ElementSize(element_type()); }
  const std::string& FormatTag() const;

  // Unsqueezed shape: (height, width, channels) or
  // (samples_per_channel, channels).
  Shape GetShape() const;

  // Application-facing shape: the trailing channel dimension is dropped
  // when the format has exactly one channel.
  Shape SqueezedShape() const { return Squeeze(GetShape()); }
  Shape Squeeze(const Shape& shape) const;

  // Caps describing this format, suitable for an appsrc.
  gst::CapsPtr ToCaps() const;

  std::string ToString() const;

 private:
  explicit FormatDescriptor(VideoFormat video) : value_(std::move(video)) {}
  explicit FormatDescriptor(AudioFormat audio) : value_(std::move(audio)) {}

  std::variant<VideoFormat, AudioFormat> value_;
};

// Channel count for a raw video format tag: 4 when the format carries
// alpha (and for BGRx), 3 for other RGB formats, 1 for grayscale, 0 for
// formats that are none of these (YUV and friends).
// Throws FormatError for tags the engine does not know.
int32_t VideoChannelCount(const std::string& format);

// Formats that decode to a (height, width[, channels]) array: single-plane,
// channel count known, and pixel stride equal to channels * element size.
std::vector<std::string> SupportedVideoFormats();

}  // namespace streamtap::format

#endif  // STREAMTAP_FORMAT_FORMAT_DESCRIPTOR_HPP_
