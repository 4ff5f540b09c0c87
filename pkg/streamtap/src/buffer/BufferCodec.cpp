// Repository: StreamTap
// Component: BufferCodec
// Purpose: Stride-aware copies between engine memory and packed arrays.
// Copyright (c) 2025 RetroVue

#include "streamtap/buffer/BufferCodec.hpp"

#include <cstring>
#include <sstream>
#include <utility>
#include <vector>

#include "streamtap/runtime/Errors.hpp"

namespace streamtap::buffer {

namespace {

NDArray DecodeVideo(const uint8_t* data, size_t size,
                    const format::FormatDescriptor& format) {
  const format::VideoFormat& v = format.video();
  const size_t rows = static_cast<size_t>(v.height);
  const size_t row_bytes = v.PackedRowBytes();
  const size_t required = v.row_stride * (rows - 1) + row_bytes;
  if (size < required || v.row_stride < row_bytes) {
    std::ostringstream oss;
    oss << "video buffer of " << size << " bytes is too small for "
        << format.ToString();
    throw FormatError(oss.str());
  }

  std::vector<uint8_t> packed(rows * row_bytes);
  if (v.row_stride == row_bytes) {
    std::memcpy(packed.data(), data, packed.size());
  } else {
    for (size_t row = 0; row < rows; ++row) {
      std::memcpy(packed.data() + row * row_bytes, data + row * v.row_stride,
                  row_bytes);
    }
  }
  return NDArray(format.SqueezedShape(), v.element_type, std::move(packed));
}

NDArray DecodeAudio(const uint8_t* data, size_t size,
                    const format::FormatDescriptor& format) {
  const format::AudioFormat& a = format.audio();
  const size_t channels = static_cast<size_t>(a.channels);
  const size_t frame_bytes = format::ElementSize(a.element_type) * channels;
  const size_t samples = size / frame_bytes;

  std::vector<uint8_t> packed(data, data + samples * frame_bytes);
  return NDArray(format.Squeeze({samples, channels}), a.element_type,
                 std::move(packed));
}

}  // namespace

NDArray DecodeBuffer(const uint8_t* data, size_t size,
                     const format::FormatDescriptor& format) {
  if (!data && size > 0) {
    throw FormatError("buffer has no readable memory");
  }
  return format.IsVideo() ? DecodeVideo(data, size, format)
                          : DecodeAudio(data, size, format);
}

bool ShapeMatches(const NDArray& array, const format::FormatDescriptor& format) {
  if (array.element_type() != format.element_type()) return false;

  const format::Shape& shape = array.shape();
  if (format.IsVideo()) {
    const format::Shape full = format.GetShape();
    return shape == full || shape == format.Squeeze(full);
  }

  const size_t channels = static_cast<size_t>(format.Channels());
  if (shape.size() == 2) return shape[1] == channels;
  return shape.size() == 1 && channels == 1;
}

std::vector<uint8_t> EncodeArray(NDArray array,
                                 const format::FormatDescriptor& format) {
  if (!ShapeMatches(array, format)) {
    std::ostringstream oss;
    oss << "array " << array.Describe() << " does not match "
        << ShapeToString(format.SqueezedShape()) << " "
        << format::ElementTypeName(format.element_type()) << " for "
        << format.ToString();
    throw FormatError(oss.str());
  }

  if (format.IsAudio()) return array.ReleaseBytes();

  const format::VideoFormat& v = format.video();
  const size_t row_bytes = v.PackedRowBytes();
  if (v.row_stride == row_bytes) return array.ReleaseBytes();

  std::vector<uint8_t> padded(v.FrameBytes(), 0);
  const uint8_t* src = array.bytes();
  for (size_t row = 0; row < static_cast<size_t>(v.height); ++row) {
    std::memcpy(padded.data() + row * v.row_stride, src + row * row_bytes,
                row_bytes);
  }
  return padded;
}

}  // namespace streamtap::buffer
