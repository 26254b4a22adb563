#pragma once

#include "runtime/device_context.h"
#include "runtime/tensors/tensor.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace decodeflux {

// Per-call execution hints.  Engines are free to ignore them.
struct RunOptions {
  // Devices whose memory arena may shrink after the call, e.g. "cpu:0".
  std::string memory_arena_shrinkage{"cpu:0"};
  std::string arena_extend_strategy{"kNextPowerOfTwo"};
};

// Opaque stateful inference engine.  Run() consumes the bound feed and
// returns freshly owned output tensors; it may throw, in which case no
// output ownership has been handed out.
class InferenceSession {
public:
  virtual ~InferenceSession() = default;

  virtual TensorMap Run(const TensorBinding &feed,
                        const RunOptions &options) = 0;

  // Free the native session.  Run() must not be called afterwards.
  virtual void Release() = 0;

  // Context step inputs (input_ids, attention_mask, position_ids) are
  // allocated from.
  virtual std::shared_ptr<DeviceContext> InputContext() const = 0;
};

// Everything needed to construct a session for one model.
struct SessionSpec {
  std::filesystem::path weights_path;
  std::vector<std::filesystem::path> external_data_paths;
  std::vector<std::string> execution_providers{"cpu"};
  std::string graph_optimization_level{"all"};
  bool verbose{false};
};

class SessionFactory {
public:
  virtual ~SessionFactory() = default;
  virtual std::string Name() const = 0;
  virtual std::unique_ptr<InferenceSession> Create(const SessionSpec &spec) = 0;
};

} // namespace decodeflux
