#pragma once

#include "runtime/device_context.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace decodeflux {

enum class DataType { kFloat16, kFloat32, kInt64 };

std::size_t ElementSize(DataType dtype);
const char *DataTypeName(DataType dtype);

// IEEE 754 binary16 <-> binary32.
float HalfToFloat(uint16_t half);
uint16_t FloatToHalf(float value);

// ---------------------------------------------------------------------------
// Tensor — move-only ownership handle over a DeviceBuffer.
//
// Ownership states:
//   kOwned        holds a live buffer; Release() or the destructor frees it.
//   kTransferred  owns nothing (default-constructed or moved-from).
//                 Release() is a no-op.
//   kReleased     the buffer was freed through Release().  A second
//                 Release() throws std::logic_error.
//
// Move-assigning into an owned tensor releases the previous buffer first, so
// installing a new tensor into a slot never leaks the old one.
// ---------------------------------------------------------------------------
class Tensor {
public:
  enum class State { kOwned, kTransferred, kReleased };

  Tensor() = default;
  ~Tensor();

  Tensor(const Tensor &) = delete;
  Tensor &operator=(const Tensor &) = delete;
  Tensor(Tensor &&other) noexcept;
  Tensor &operator=(Tensor &&other) noexcept;

  // Uninitialised tensor of `shape` allocated from `context`.
  static Tensor Allocate(std::shared_ptr<DeviceContext> context, DataType dtype,
                         std::vector<int64_t> shape);

  // Tensor of `shape` holding a copy of `bytes` bytes at `data`.  `bytes`
  // must equal the element count times ElementSize(dtype).
  static Tensor FromBytes(std::shared_ptr<DeviceContext> context,
                          DataType dtype, std::vector<int64_t> shape,
                          const void *data, std::size_t bytes);

  static Tensor FromInt64(std::shared_ptr<DeviceContext> context,
                          std::vector<int64_t> shape,
                          const std::vector<int64_t> &values);

  static Tensor FromFloat32(std::shared_ptr<DeviceContext> context,
                            std::vector<int64_t> shape,
                            const std::vector<float> &values);

  // Zero-byte host tensor.  `shape` must contain a zero dimension.
  static Tensor Empty(DataType dtype, std::vector<int64_t> shape);

  void Release();

  State state() const { return state_; }
  bool IsOwned() const { return state_ == State::kOwned; }
  bool IsDeviceResident() const {
    return IsOwned() && location_ == MemoryLocation::kDevice;
  }

  DataType dtype() const { return dtype_; }
  MemoryLocation location() const { return location_; }
  const std::vector<int64_t> &shape() const { return shape_; }
  std::size_t ElementCount() const;
  std::size_t ByteSize() const { return ElementCount() * ElementSize(dtype_); }
  const DeviceBuffer *buffer() const { return buffer_.get(); }

  // Copy ByteSize() bytes into host memory at `dst`.
  void CopyTo(void *dst) const;

  // Read `count` elements starting at element `first` as float.  Only valid
  // for float16 / float32 tensors.
  std::vector<float> ReadFloats(std::size_t first, std::size_t count) const;

  // Read every element of an int64 tensor.
  std::vector<int64_t> ReadInt64() const;

private:
  Tensor(std::shared_ptr<DeviceContext> context, DataType dtype,
         std::vector<int64_t> shape, std::unique_ptr<DeviceBuffer> buffer);

  void RequireOwned(const char *op) const;
  void FreeBuffer() noexcept;

  DataType dtype_{DataType::kFloat32};
  MemoryLocation location_{MemoryLocation::kHost};
  std::vector<int64_t> shape_;
  std::shared_ptr<DeviceContext> context_;
  std::unique_ptr<DeviceBuffer> buffer_;
  State state_{State::kTransferred};
};

// Named tensors returned by an inference call.  Entries own their tensors
// until moved out.
using TensorMap = std::map<std::string, Tensor>;

// Non-owning (name, tensor) pairs handed to an inference call.
using TensorBinding = std::vector<std::pair<std::string, const Tensor *>>;

std::string ShapeString(const std::vector<int64_t> &shape);

} // namespace decodeflux
