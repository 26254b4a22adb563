#pragma once

#include "runtime/tensors/tensor.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace decodeflux {

enum class Precision { kFloat16, kFloat32 };

// Which precision the KV cache placeholders use.  kAuto follows the
// checkpoint's torch_dtype.
enum class PrecisionPreference { kAuto, kFloat16, kFloat32 };

const char *PrecisionName(Precision precision);
bool ParsePrecisionPreference(const std::string &name,
                              PrecisionPreference &out);

// Model architecture parameters parsed from config.json.
struct ModelMetadata {
  std::string model_type; // e.g. "phi3", "llama", "qwen2"
  // Every id listed under eos_token_id (scalar or array), in file order.
  std::vector<int64_t> eos_token_ids;
  int hidden_size{0};
  int num_hidden_layers{0};
  int num_attention_heads{0};
  int num_key_value_heads{0}; // GQA; defaults to num_attention_heads if absent
  int head_dim{0};            // explicit head_dim or hidden / heads
  int vocab_size{0};
  std::string torch_dtype;
  Precision precision{Precision::kFloat32};
  bool valid{false};

  int64_t StopTokenId() const {
    return eos_token_ids.empty() ? -1 : eos_token_ids.front();
  }

  // [batch=1, num_kv_heads, cache_len=0, head_dim]
  std::vector<int64_t> KVShape() const;

  DataType CacheDataType() const {
    return precision == Precision::kFloat16 ? DataType::kFloat16
                                            : DataType::kFloat32;
  }
};

// Parse config.json text.  Returns metadata.valid=false on any error.
ModelMetadata ParseModelConfig(
    const std::string &json_text,
    PrecisionPreference preference = PrecisionPreference::kAuto);

ModelMetadata
ParseModelConfigFile(const std::filesystem::path &config_path,
                     PrecisionPreference preference = PrecisionPreference::kAuto);

} // namespace decodeflux
