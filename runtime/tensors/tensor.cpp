#include "runtime/tensors/tensor.h"

#include "runtime/backends/host/host_device_context.h"

#include <cstring>
#include <stdexcept>
#include <utility>

namespace decodeflux {

std::size_t ElementSize(DataType dtype) {
  switch (dtype) {
  case DataType::kFloat16:
    return 2;
  case DataType::kFloat32:
    return 4;
  case DataType::kInt64:
    return 8;
  }
  return 0;
}

const char *DataTypeName(DataType dtype) {
  switch (dtype) {
  case DataType::kFloat16:
    return "float16";
  case DataType::kFloat32:
    return "float32";
  case DataType::kInt64:
    return "int64";
  }
  return "unknown";
}

float HalfToFloat(uint16_t half) {
  const uint32_t sign = static_cast<uint32_t>(half & 0x8000u) << 16;
  uint32_t exponent = (half >> 10) & 0x1Fu;
  uint32_t mantissa = half & 0x3FFu;
  uint32_t bits = 0;

  if (exponent == 0) {
    if (mantissa == 0) {
      bits = sign;
    } else {
      // Subnormal: normalise the mantissa.
      exponent = 127 - 15 + 1;
      while ((mantissa & 0x400u) == 0) {
        mantissa <<= 1;
        --exponent;
      }
      mantissa &= 0x3FFu;
      bits = sign | (exponent << 23) | (mantissa << 13);
    }
  } else if (exponent == 0x1F) {
    bits = sign | 0x7F800000u | (mantissa << 13); // inf / NaN
  } else {
    bits = sign | ((exponent + 127 - 15) << 23) | (mantissa << 13);
  }

  float out;
  std::memcpy(&out, &bits, sizeof(out));
  return out;
}

uint16_t FloatToHalf(float value) {
  uint32_t bits;
  std::memcpy(&bits, &value, sizeof(bits));
  const uint16_t sign = static_cast<uint16_t>((bits >> 16) & 0x8000u);
  const uint32_t exponent = (bits >> 23) & 0xFFu;
  uint32_t mantissa = bits & 0x7FFFFFu;

  if (exponent == 0xFF) {
    return static_cast<uint16_t>(sign | 0x7C00u | (mantissa ? 0x200u : 0u));
  }
  const int32_t half_exp = static_cast<int32_t>(exponent) - 127 + 15;
  if (half_exp >= 0x1F) {
    return static_cast<uint16_t>(sign | 0x7C00u); // overflow -> inf
  }
  if (half_exp <= 0) {
    if (half_exp < -10) {
      return sign; // underflow -> signed zero
    }
    mantissa |= 0x800000u;
    const uint32_t shift = static_cast<uint32_t>(14 - half_exp);
    uint32_t half_mant = mantissa >> shift;
    if ((mantissa >> (shift - 1)) & 1u) {
      ++half_mant;
    }
    return static_cast<uint16_t>(sign | half_mant);
  }
  uint16_t out = static_cast<uint16_t>(
      sign | (static_cast<uint32_t>(half_exp) << 10) | (mantissa >> 13));
  if (mantissa & 0x1000u) {
    ++out; // round half up; may carry into the exponent
  }
  return out;
}

std::string ShapeString(const std::vector<int64_t> &shape) {
  std::string out = "[";
  for (std::size_t i = 0; i < shape.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += std::to_string(shape[i]);
  }
  out += "]";
  return out;
}

namespace {

std::size_t CountElements(const std::vector<int64_t> &shape) {
  std::size_t count = 1;
  for (int64_t dim : shape) {
    if (dim < 0) {
      throw std::invalid_argument("negative tensor dimension in " +
                                  ShapeString(shape));
    }
    count *= static_cast<std::size_t>(dim);
  }
  return count;
}

} // namespace

Tensor::Tensor(std::shared_ptr<DeviceContext> context, DataType dtype,
               std::vector<int64_t> shape,
               std::unique_ptr<DeviceBuffer> buffer)
    : dtype_(dtype), location_(context->Location()), shape_(std::move(shape)),
      context_(std::move(context)), buffer_(std::move(buffer)),
      state_(State::kOwned) {}

Tensor::~Tensor() {
  if (state_ == State::kOwned) {
    FreeBuffer();
  }
}

Tensor::Tensor(Tensor &&other) noexcept
    : dtype_(other.dtype_), location_(other.location_),
      shape_(std::move(other.shape_)), context_(std::move(other.context_)),
      buffer_(std::move(other.buffer_)), state_(other.state_) {
  other.state_ = State::kTransferred;
}

Tensor &Tensor::operator=(Tensor &&other) noexcept {
  if (this != &other) {
    if (state_ == State::kOwned) {
      FreeBuffer();
    }
    dtype_ = other.dtype_;
    location_ = other.location_;
    shape_ = std::move(other.shape_);
    context_ = std::move(other.context_);
    buffer_ = std::move(other.buffer_);
    state_ = other.state_;
    other.state_ = State::kTransferred;
  }
  return *this;
}

Tensor Tensor::Allocate(std::shared_ptr<DeviceContext> context, DataType dtype,
                        std::vector<int64_t> shape) {
  if (!context) {
    throw std::invalid_argument("Tensor::Allocate requires a device context");
  }
  const std::size_t bytes = CountElements(shape) * ElementSize(dtype);
  auto buffer = context->Allocate(bytes);
  return Tensor(std::move(context), dtype, std::move(shape),
                std::move(buffer));
}

Tensor Tensor::FromBytes(std::shared_ptr<DeviceContext> context,
                         DataType dtype, std::vector<int64_t> shape,
                         const void *data, std::size_t bytes) {
  const std::size_t expected = CountElements(shape) * ElementSize(dtype);
  if (bytes != expected) {
    throw std::invalid_argument(
        "tensor data size mismatch: shape " + ShapeString(shape) + " needs " +
        std::to_string(expected) + " bytes, got " + std::to_string(bytes));
  }
  Tensor t = Allocate(std::move(context), dtype, std::move(shape));
  t.context_->CopyFromHost(*t.buffer_, 0, data, bytes);
  return t;
}

Tensor Tensor::FromInt64(std::shared_ptr<DeviceContext> context,
                         std::vector<int64_t> shape,
                         const std::vector<int64_t> &values) {
  return FromBytes(std::move(context), DataType::kInt64, std::move(shape),
                   values.data(), values.size() * sizeof(int64_t));
}

Tensor Tensor::FromFloat32(std::shared_ptr<DeviceContext> context,
                           std::vector<int64_t> shape,
                           const std::vector<float> &values) {
  return FromBytes(std::move(context), DataType::kFloat32, std::move(shape),
                   values.data(), values.size() * sizeof(float));
}

Tensor Tensor::Empty(DataType dtype, std::vector<int64_t> shape) {
  if (CountElements(shape) != 0) {
    throw std::invalid_argument("Tensor::Empty shape " + ShapeString(shape) +
                                " is not empty");
  }
  return Allocate(SharedHostContext(), dtype, std::move(shape));
}

void Tensor::Release() {
  switch (state_) {
  case State::kTransferred:
    return;
  case State::kReleased:
    throw std::logic_error("tensor " + ShapeString(shape_) +
                           " released twice");
  case State::kOwned:
    FreeBuffer();
    state_ = State::kReleased;
    return;
  }
}

void Tensor::FreeBuffer() noexcept {
  if (context_) {
    context_->Free(std::move(buffer_));
  }
  buffer_.reset();
}

std::size_t Tensor::ElementCount() const { return CountElements(shape_); }

void Tensor::RequireOwned(const char *op) const {
  if (state_ != State::kOwned) {
    throw std::logic_error(std::string(op) +
                           " on a tensor that does not own its buffer");
  }
}

void Tensor::CopyTo(void *dst) const {
  RequireOwned("CopyTo");
  context_->CopyToHost(*buffer_, 0, dst, ByteSize());
}

std::vector<float> Tensor::ReadFloats(std::size_t first,
                                      std::size_t count) const {
  RequireOwned("ReadFloats");
  if (first > ElementCount() || count > ElementCount() - first) {
    throw std::out_of_range("ReadFloats range exceeds tensor " +
                            ShapeString(shape_));
  }
  std::vector<float> out(count);
  if (dtype_ == DataType::kFloat32) {
    context_->CopyToHost(*buffer_, first * sizeof(float), out.data(),
                         count * sizeof(float));
  } else if (dtype_ == DataType::kFloat16) {
    std::vector<uint16_t> halves(count);
    context_->CopyToHost(*buffer_, first * sizeof(uint16_t), halves.data(),
                         count * sizeof(uint16_t));
    for (std::size_t i = 0; i < count; ++i) {
      out[i] = HalfToFloat(halves[i]);
    }
  } else {
    throw std::invalid_argument(std::string("ReadFloats on ") +
                                DataTypeName(dtype_) + " tensor");
  }
  return out;
}

std::vector<int64_t> Tensor::ReadInt64() const {
  RequireOwned("ReadInt64");
  if (dtype_ != DataType::kInt64) {
    throw std::invalid_argument(std::string("ReadInt64 on ") +
                                DataTypeName(dtype_) + " tensor");
  }
  std::vector<int64_t> out(ElementCount());
  context_->CopyToHost(*buffer_, 0, out.data(), ByteSize());
  return out;
}

} // namespace decodeflux
