// Repository: StreamTap
// Component: NDArray
// Purpose: Owned, densely packed, shaped array of a single scalar type.
// Copyright (c) 2025 RetroVue

#ifndef STREAMTAP_BUFFER_NDARRAY_HPP_
#define STREAMTAP_BUFFER_NDARRAY_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "streamtap/format/ElementType.hpp"

namespace streamtap::buffer {

// NDArray owns row-major, unpadded element storage. Moves are cheap; the
// bytes travel from the streaming thread to the application thread without
// another copy.
class NDArray {
 public:
  NDArray() = default;

  // Zero-filled array of the given shape.
  NDArray(format::Shape shape, format::ElementType type);

  // Adopts `bytes`. Throws FormatError unless bytes.size() equals the
  // element count times the element size.
  NDArray(format::Shape shape, format::ElementType type,
          std::vector<uint8_t> bytes);

  const format::Shape& shape() const { return shape_; }
  format::ElementType element_type() const { return type_; }
  size_t ndim() const { return shape_.size(); }
  size_t size() const { return format::ShapeElementCount(shape_); }
  size_t nbytes() const { return bytes_.size(); }
  bool empty() const { return bytes_.empty(); }

  const uint8_t* bytes() const { return bytes_.data(); }
  uint8_t* mutable_bytes() { return bytes_.data(); }

  // Typed view. Throws FormatError when T does not match element_type().
  template <typename T>
  T* Data() {
    CheckType(format::ElementTypeOf<T>::value);
    return reinterpret_cast<T*>(bytes_.data());
  }
  template <typename T>
  const T* Data() const {
    CheckType(format::ElementTypeOf<T>::value);
    return reinterpret_cast<const T*>(bytes_.data());
  }

  // Same bytes, new shape. Throws FormatError if the element count differs.
  void Reshape(format::Shape shape);

  // Moves the storage out, leaving the array empty.
  std::vector<uint8_t> ReleaseBytes();

  // "(480, 640, 3) uint8"
  std::string Describe() const;

 private:
  void CheckType(format::ElementType requested) const;

  format::Shape shape_;
  format::ElementType type_ = format::ElementType::kUInt8;
  std::vector<uint8_t> bytes_;
};

std::string ShapeToString(const format::Shape& shape);

}  // namespace streamtap::buffer

#endif  // STREAMTAP_BUFFER_NDARRAY_HPP_
