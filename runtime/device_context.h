#pragma once

#include <cstddef>
#include <memory>
#include <string>

namespace decodeflux {

enum class MemoryLocation { kHost, kDevice };

class DeviceBuffer {
public:
  DeviceBuffer() = default;
  DeviceBuffer(void *ptr, std::size_t bytes) : ptr_(ptr), bytes_(bytes) {}
  void *data() const { return ptr_; }
  std::size_t size() const { return bytes_; }

private:
  void *ptr_{nullptr};
  std::size_t bytes_{0};
};

// Allocator seam for tensor memory.  Buffers handed out by Allocate() must be
// returned through Free() exactly once.
class DeviceContext {
public:
  virtual ~DeviceContext() = default;
  virtual std::string Name() const = 0;
  virtual bool IsAvailable() const = 0;
  virtual MemoryLocation Location() const = 0;
  virtual std::unique_ptr<DeviceBuffer> Allocate(std::size_t bytes) = 0;
  virtual void Free(std::unique_ptr<DeviceBuffer> buffer) = 0;

  // Copy `bytes` starting at `offset` of `buffer` into host memory at `dst`.
  virtual void CopyToHost(const DeviceBuffer &buffer, std::size_t offset,
                          void *dst, std::size_t bytes) const = 0;
  // Copy host memory at `src` into `buffer` starting at `offset`.
  virtual void CopyFromHost(DeviceBuffer &buffer, std::size_t offset,
                            const void *src, std::size_t bytes) = 0;

  // Best-effort hint to return cached allocations to the system.
  virtual void Trim() {}
};

} // namespace decodeflux
