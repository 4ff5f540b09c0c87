// Repository: StreamTap
// Component: ElementType
// Purpose: Scalar element types an array buffer can carry.
// Copyright (c) 2025 RetroVue

#ifndef STREAMTAP_FORMAT_ELEMENT_TYPE_HPP_
#define STREAMTAP_FORMAT_ELEMENT_TYPE_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace streamtap::format {

enum class ElementType {
  kUInt8,
  kInt8,
  kUInt16,
  kInt16,
};

// Array shape, outermost dimension first: (height, width, channels) for
// video, (samples_per_channel, channels) for audio.
using Shape = std::vector<size_t>;

constexpr size_t ElementSize(ElementType type) {
  switch (type) {
    case ElementType::kUInt8:
    case ElementType::kInt8:
      return 1;
    case ElementType::kUInt16:
    case ElementType::kInt16:
      return 2;
  }
  return 1;
}

constexpr const char* ElementTypeName(ElementType type) {
  switch (type) {
    case ElementType::kUInt8: return "uint8";
    case ElementType::kInt8: return "int8";
    case ElementType::kUInt16: return "uint16";
    case ElementType::kInt16: return "int16";
  }
  return "unknown";
}

// Maps a C++ scalar to its ElementType. Only the four carried types have a
// specialization, so NDArray::Data<float>() fails to compile.
template <typename T>
struct ElementTypeOf;

template <>
struct ElementTypeOf<uint8_t> {
  static constexpr ElementType value = ElementType::kUInt8;
};
template <>
struct ElementTypeOf<int8_t> {
  static constexpr ElementType value = ElementType::kInt8;
};
template <>
struct ElementTypeOf<uint16_t> {
  static constexpr ElementType value = ElementType::kUInt16;
};
template <>
struct ElementTypeOf<int16_t> {
  static constexpr ElementType value = ElementType::kInt16;
};

inline size_t ShapeElementCount(const Shape& shape) {
  if (shape.empty()) return 0;
  size_t count = 1;
  for (size_t dim : shape) count *= dim;
  return count;
}

}  // namespace streamtap::format

#endif  // STREAMTAP_FORMAT_ELEMENT_TYPE_HPP_
