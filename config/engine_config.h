#pragma once

#include "model/model_config.h"
#include "runtime/generation/session_state.h"
#include "runtime/generation/text_generation.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace decodeflux {

struct EngineConfig {
  // model:
  std::string model_id;
  std::filesystem::path model_root;
  LoadOptions load;

  // runtime:
  std::size_t max_tokens{256};
  TextGenerationOptions generation;

  // logging:
  bool verbose{false};
  bool json_logs{false};
};

// Defaults with model_root under $DECODEFLUX_HOME (or ~/.cache/decodeflux).
EngineConfig DefaultEngineConfig();

// Parse YAML text on top of DefaultEngineConfig().  Throws
// std::runtime_error naming `origin` on malformed YAML or mistyped values.
EngineConfig ParseEngineConfig(const std::string &yaml_text,
                               const std::string &origin = "<string>");

EngineConfig LoadEngineConfig(const std::filesystem::path &path);

// DECODEFLUX_MODEL_ROOT and DECODEFLUX_LOG_FORMAT override file values.
void ApplyEnvOverrides(EngineConfig &config);

} // namespace decodeflux
