// Repository: StreamTap
// Component: BufferCodec
// Purpose: Engine memory ⇄ NDArray conversion under a FormatDescriptor.
// Copyright (c) 2025 RetroVue

#ifndef STREAMTAP_BUFFER_BUFFER_CODEC_HPP_
#define STREAMTAP_BUFFER_BUFFER_CODEC_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "streamtap/buffer/NDArray.hpp"
#include "streamtap/format/FormatDescriptor.hpp"

namespace streamtap::buffer {

// Copies one engine buffer into a packed array with the descriptor's
// squeezed shape. Video rows are read `row_stride` apart, so padded
// strides decode to the same array as packed ones. Audio derives the
// sample count from `size` (a trailing partial frame is ignored).
// Throws FormatError when `size` is too small for one video frame.
NDArray DecodeBuffer(const uint8_t* data, size_t size,
                     const format::FormatDescriptor& format);

// True when `array` can be pushed under `format`: element type matches and
// the shape is the unsqueezed shape, the squeezed shape, or (for a
// single-channel format) either of those with the channel axis present.
// Audio accepts any sample count.
bool ShapeMatches(const NDArray& array, const format::FormatDescriptor& format);

// Lays `array` out the way the engine expects: video rows padded to
// `row_stride` with zeroes. When no padding is needed the array's storage
// is moved, not copied.
// Throws FormatError when ShapeMatches() is false.
std::vector<uint8_t> EncodeArray(NDArray array,
                                 const format::FormatDescriptor& format);

}  // namespace streamtap::buffer

#endif  // STREAMTAP_BUFFER_BUFFER_CODEC_HPP_
