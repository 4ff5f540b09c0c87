// Repository: StreamTap
// Component: NDArray
// Purpose: Shape/size validation for owned arrays.
// Copyright (c) 2025 RetroVue

#include "streamtap/buffer/NDArray.hpp"

#include <sstream>
#include <utility>

#include "streamtap/runtime/Errors.hpp"

namespace streamtap::buffer {

NDArray::NDArray(format::Shape shape, format::ElementType type)
    : shape_(std::move(shape)), type_(type) {
  bytes_.assign(size() * format::ElementSize(type_), 0);
}

NDArray::NDArray(format::Shape shape, format::ElementType type,
                 std::vector<uint8_t> bytes)
    : shape_(std::move(shape)), type_(type), bytes_(std::move(bytes)) {
  const size_t expected = size() * format::ElementSize(type_);
  if (bytes_.size() != expected) {
    std::ostringstream oss;
    oss << "array " << Describe() << " needs " << expected << " bytes, got "
        << bytes_.size();
    throw FormatError(oss.str());
  }
}

void NDArray::Reshape(format::Shape shape) {
  if (format::ShapeElementCount(shape) != size()) {
    throw FormatError("cannot reshape " + Describe() + " to " +
                      ShapeToString(shape));
  }
  shape_ = std::move(shape);
}

std::vector<uint8_t> NDArray::ReleaseBytes() {
  std::vector<uint8_t> out = std::move(bytes_);
  bytes_.clear();
  shape_.clear();
  return out;
}

std::string NDArray::Describe() const {
  return ShapeToString(shape_) + " " + format::ElementTypeName(type_);
}

void NDArray::CheckType(format::ElementType requested) const {
  if (requested != type_) {
    throw FormatError(std::string("array holds ") +
                      format::ElementTypeName(type_) + ", not " +
                      format::ElementTypeName(requested));
  }
}

std::string ShapeToString(const format::Shape& shape) {
  std::ostringstream oss;
  oss << "(";
  for (size_t i = 0; i < shape.size(); ++i) {
    if (i > 0) oss << ", ";
    oss << shape[i];
  }
  if (shape.size() == 1) oss << ",";
  oss << ")";
  return oss.str();
}

}  // namespace streamtap::buffer
