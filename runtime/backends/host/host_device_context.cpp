#include "runtime/backends/host/host_device_context.h"

#include <cstdlib>
#include <cstring>
#include <new>
#include <stdexcept>

namespace decodeflux {

namespace {

void CheckRange(const DeviceBuffer &buffer, std::size_t offset,
                std::size_t bytes) {
  if (offset > buffer.size() || bytes > buffer.size() - offset) {
    throw std::out_of_range("host buffer access out of range");
  }
}

} // namespace

std::unique_ptr<DeviceBuffer> HostDeviceContext::Allocate(std::size_t bytes) {
  if (bytes == 0) {
    return std::make_unique<DeviceBuffer>(nullptr, 0);
  }
  void *ptr = std::malloc(bytes);
  if (!ptr) {
    throw std::bad_alloc();
  }
  return std::make_unique<DeviceBuffer>(ptr, bytes);
}

void HostDeviceContext::Free(std::unique_ptr<DeviceBuffer> buffer) {
  if (!buffer) {
    return;
  }
  std::free(buffer->data());
}

void HostDeviceContext::CopyToHost(const DeviceBuffer &buffer,
                                   std::size_t offset, void *dst,
                                   std::size_t bytes) const {
  if (bytes == 0) {
    return;
  }
  CheckRange(buffer, offset, bytes);
  std::memcpy(dst, static_cast<const char *>(buffer.data()) + offset, bytes);
}

void HostDeviceContext::CopyFromHost(DeviceBuffer &buffer, std::size_t offset,
                                     const void *src, std::size_t bytes) {
  if (bytes == 0) {
    return;
  }
  CheckRange(buffer, offset, bytes);
  std::memcpy(static_cast<char *>(buffer.data()) + offset, src, bytes);
}

std::shared_ptr<DeviceContext> SharedHostContext() {
  static std::shared_ptr<DeviceContext> ctx =
      std::make_shared<HostDeviceContext>();
  return ctx;
}

} // namespace decodeflux
