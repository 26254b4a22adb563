#pragma once

#include "runtime/device_context.h"

#include <cstddef>
#include <memory>
#include <string>

namespace decodeflux {

// DeviceContext backed by plain host memory.  Used for session inputs when
// the execution provider reads from host buffers (CPU, or any provider that
// copies inputs itself).
class HostDeviceContext : public DeviceContext {
public:
  HostDeviceContext() = default;
  ~HostDeviceContext() override = default;

  std::string Name() const override { return "host"; }
  bool IsAvailable() const override { return true; }
  MemoryLocation Location() const override { return MemoryLocation::kHost; }

  std::unique_ptr<DeviceBuffer> Allocate(std::size_t bytes) override;
  void Free(std::unique_ptr<DeviceBuffer> buffer) override;

  void CopyToHost(const DeviceBuffer &buffer, std::size_t offset, void *dst,
                  std::size_t bytes) const override;
  void CopyFromHost(DeviceBuffer &buffer, std::size_t offset, const void *src,
                    std::size_t bytes) override;
};

// Process-wide host context shared by tensors that are not tied to a session.
std::shared_ptr<DeviceContext> SharedHostContext();

} // namespace decodeflux
