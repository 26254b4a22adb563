#include "model/model_config.h"
#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace decodeflux {

const char *PrecisionName(Precision precision) {
  return precision == Precision::kFloat16 ? "float16" : "float32";
}

bool ParsePrecisionPreference(const std::string &name,
                              PrecisionPreference &out) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "auto") {
    out = PrecisionPreference::kAuto;
  } else if (lower == "float16" || lower == "fp16") {
    out = PrecisionPreference::kFloat16;
  } else if (lower == "float32" || lower == "fp32") {
    out = PrecisionPreference::kFloat32;
  } else {
    return false;
  }
  return true;
}

std::vector<int64_t> ModelMetadata::KVShape() const {
  return {1, num_key_value_heads, 0, head_dim};
}

ModelMetadata ParseModelConfig(const std::string &json_text,
                               PrecisionPreference preference) {
  ModelMetadata md;

  json j;
  try {
    j = json::parse(json_text);
  } catch (const std::exception &e) {
    log::Error("model_config",
               std::string("config.json parse error: ") + e.what());
    return md;
  }
  if (!j.is_object()) {
    log::Error("model_config", "config.json is not a JSON object");
    return md;
  }

  auto get_str = [&](const char *key, std::string &out) {
    if (j.contains(key) && j[key].is_string())
      out = j[key].get<std::string>();
  };
  auto get_int = [&](const char *key, int &out) {
    if (j.contains(key) && j[key].is_number_integer())
      out = j[key].get<int>();
  };

  get_str("model_type", md.model_type);
  get_str("torch_dtype", md.torch_dtype);
  get_int("hidden_size", md.hidden_size);
  get_int("num_hidden_layers", md.num_hidden_layers);
  get_int("num_attention_heads", md.num_attention_heads);
  get_int("num_key_value_heads", md.num_key_value_heads);
  get_int("head_dim", md.head_dim);
  get_int("vocab_size", md.vocab_size);

  // eos_token_id is a scalar for most checkpoints and a list for some
  // (Llama 3, Phi-3.5).
  if (j.contains("eos_token_id")) {
    const auto &eos = j["eos_token_id"];
    if (eos.is_number_integer()) {
      md.eos_token_ids.push_back(eos.get<int64_t>());
    } else if (eos.is_array()) {
      for (const auto &id : eos) {
        if (id.is_number_integer())
          md.eos_token_ids.push_back(id.get<int64_t>());
      }
    }
  }

  // GQA fallback: if num_key_value_heads is absent, MHA applies (KV heads == Q
  // heads).
  if (md.num_key_value_heads == 0 && md.num_attention_heads > 0)
    md.num_key_value_heads = md.num_attention_heads;

  if (md.head_dim == 0 && md.num_attention_heads > 0)
    md.head_dim = md.hidden_size / md.num_attention_heads;

  switch (preference) {
  case PrecisionPreference::kFloat16:
    md.precision = Precision::kFloat16;
    break;
  case PrecisionPreference::kFloat32:
    md.precision = Precision::kFloat32;
    break;
  case PrecisionPreference::kAuto:
    md.precision = md.torch_dtype == "float16" ? Precision::kFloat16
                                               : Precision::kFloat32;
    break;
  }

  std::string missing;
  if (md.eos_token_ids.empty())
    missing += " eos_token_id";
  if (md.num_hidden_layers <= 0)
    missing += " num_hidden_layers";
  if (md.num_key_value_heads <= 0)
    missing += " num_key_value_heads";
  if (md.head_dim <= 0)
    missing += " head_dim";
  if (!missing.empty()) {
    log::Error("model_config", "config.json lacks usable fields:" + missing);
    return md;
  }

  md.valid = true;
  return md;
}

ModelMetadata ParseModelConfigFile(const std::filesystem::path &config_path,
                                   PrecisionPreference preference) {
  std::ifstream f(config_path);
  if (!f.is_open()) {
    log::Error("model_config", "Cannot open " + config_path.string());
    return ModelMetadata{};
  }
  std::stringstream ss;
  ss << f.rdbuf();
  return ParseModelConfig(ss.str(), preference);
}

} // namespace decodeflux
