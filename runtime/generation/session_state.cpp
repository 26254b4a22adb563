#include "runtime/generation/session_state.h"

#include "logging/logger.h"
#include "runtime/errors.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace decodeflux {

namespace {

constexpr const char *kPresentPrefix = "present.";

// "present.<layer>.key" -> (layer, true); "present.<layer>.value" ->
// (layer, false).
bool ParsePresentName(const std::string &name, std::size_t &layer,
                      bool &is_key) {
  const std::string rest = name.substr(std::string(kPresentPrefix).size());
  const auto dot = rest.find('.');
  if (dot == std::string::npos || dot == 0) {
    return false;
  }
  const std::string index = rest.substr(0, dot);
  if (!std::all_of(index.begin(), index.end(),
                   [](unsigned char c) { return std::isdigit(c); })) {
    return false;
  }
  const std::string slot = rest.substr(dot + 1);
  if (slot == "key") {
    is_key = true;
  } else if (slot == "value") {
    is_key = false;
  } else {
    return false;
  }
  try {
    layer = static_cast<std::size_t>(std::stoull(index));
  } catch (const std::out_of_range &) {
    return false;
  }
  return true;
}

} // namespace

SessionState::SessionState(std::shared_ptr<ModelSource> source,
                           std::shared_ptr<SessionFactory> factory)
    : source_(std::move(source)), factory_(std::move(factory)) {
  if (!source_ || !factory_) {
    throw std::invalid_argument(
        "SessionState requires a model source and a session factory");
  }
}

SessionState::~SessionState() { Release(); }

void SessionState::Load(const std::string &model, const LoadOptions &options) {
  Release();
  try {
    LoadLocked(model, options);
  } catch (const LoadError &e) {
    Release();
    log::Error("session_state", e.what(), "model=" + model);
    throw;
  } catch (const std::exception &e) {
    Release();
    log::Error("session_state", e.what(), "model=" + model);
    throw LoadError("failed to load " + model + ": " + e.what());
  }
}

void SessionState::LoadLocked(const std::string &model,
                              const LoadOptions &options) {
  const auto config_path = source_->Resolve(model, "config.json");
  ModelMetadata metadata =
      ParseModelConfig(source_->ReadText(config_path), options.precision);
  if (!metadata.valid) {
    throw LoadError("invalid config.json for " + model);
  }

  SessionSpec spec;
  spec.weights_path = source_->Resolve(model, options.onnx_file);
  if (options.external_data) {
    const std::string data_file = options.data_file_name.empty()
                                      ? options.onnx_file + "_data"
                                      : options.data_file_name;
    spec.external_data_paths.push_back(source_->Resolve(model, data_file));
  }
  spec.execution_providers = options.execution_providers;
  spec.graph_optimization_level = "all";
  spec.verbose = options.verbose;

  log::Info("session_state", "Creating session for " + model,
            "factory=" + factory_->Name() +
                " weights=" + spec.weights_path.string());
  auto session = factory_->Create(spec);
  if (!session) {
    throw LoadError("session factory " + factory_->Name() +
                    " returned no session for " + model);
  }

  session_ = std::move(session);
  input_context_ = session_->InputContext();
  metadata_ = std::move(metadata);

  stop_token_ids_ = metadata_.eos_token_ids;
  for (int64_t id : options.extra_stop_token_ids) {
    if (std::find(stop_token_ids_.begin(), stop_token_ids_.end(), id) ==
        stop_token_ids_.end()) {
      stop_token_ids_.push_back(id);
    }
  }

  InitializeFeed();

  log::Info("session_state", "Loaded " + model,
            "layers=" + std::to_string(metadata_.num_hidden_layers) +
                " kv_heads=" + std::to_string(metadata_.num_key_value_heads) +
                " head_dim=" + std::to_string(metadata_.head_dim) +
                " precision=" + PrecisionName(metadata_.precision));
}

void SessionState::InitializeFeed() {
  feed_.Clear();

  const auto layers = static_cast<std::size_t>(
      std::max(metadata_.num_hidden_layers, 0));
  const DataType dtype = metadata_.CacheDataType();
  const auto shape = metadata_.KVShape();

  feed_.past_key_values.resize(layers);
  for (auto &entry : feed_.past_key_values) {
    entry.key = Tensor::Empty(dtype, shape);
    entry.value = Tensor::Empty(dtype, shape);
  }
}

int64_t SessionState::Argmax(const Tensor &logits) {
  const auto &dims = logits.shape();
  if (dims.size() != 3) {
    throw InvalidOutputError("logits must be [batch, sequence, vocab], got " +
                             ShapeString(dims));
  }
  if (dims[0] <= 0 || dims[1] <= 0 || dims[2] <= 0) {
    throw InvalidOutputError("logits tensor is empty: " + ShapeString(dims));
  }
  if (logits.dtype() != DataType::kFloat32 &&
      logits.dtype() != DataType::kFloat16) {
    throw InvalidOutputError(std::string("logits have dtype ") +
                             DataTypeName(logits.dtype()));
  }

  const auto vocab = static_cast<std::size_t>(dims[2]);
  const auto start = vocab * static_cast<std::size_t>(dims[1] - 1);
  const std::vector<float> row = logits.ReadFloats(start, vocab);

  float max = row[0];
  int64_t max_idx = 0;
  for (std::size_t i = 0; i < vocab; ++i) {
    const float val = row[i];
    if (!std::isfinite(val)) {
      throw InvalidOutputError("found non-finite value in logits at index " +
                               std::to_string(i));
    }
    if (val > max) {
      max = val;
      max_idx = static_cast<int64_t>(i);
    }
  }
  return max_idx;
}

void SessionState::UpdateKVCache(Feed &feed, TensorMap &outputs) {
  struct PresentOutput {
    TensorMap::iterator it;
    std::size_t layer;
    bool is_key;
  };

  // Validate every cache output before the current cache is touched, so a
  // rejected update leaves the feed as it was.
  std::vector<PresentOutput> present;
  for (auto it = outputs.begin(); it != outputs.end(); ++it) {
    if (it->first.compare(0, std::string(kPresentPrefix).size(),
                          kPresentPrefix) != 0) {
      continue;
    }
    std::size_t layer = 0;
    bool is_key = false;
    if (!ParsePresentName(it->first, layer, is_key)) {
      throw InvalidOutputError("unrecognised cache output " + it->first);
    }
    if (layer >= feed.past_key_values.size()) {
      throw InvalidOutputError(
          "cache output " + it->first + " exceeds " +
          std::to_string(feed.past_key_values.size()) + " layers");
    }
    present.push_back({it, layer, is_key});
  }

  feed.ReleaseDeviceCache();
  for (auto &out : present) {
    auto &entry = feed.past_key_values[out.layer];
    (out.is_key ? entry.key : entry.value) = std::move(out.it->second);
    outputs.erase(out.it);
  }
}

void SessionState::Release() {
  if (!session_) {
    return;
  }
  feed_.Clear();

  try {
    session_->Release();
  } catch (const std::exception &e) {
    log::Error("session_state",
               std::string("session release failed: ") + e.what());
  }
  session_.reset();
  metadata_ = ModelMetadata{};
  stop_token_ids_.clear();

  if (input_context_) {
    input_context_->Trim();
    input_context_.reset();
  }
  log::Debug("session_state", "Session released");
}

std::shared_ptr<DeviceContext> SessionState::InputContext() const {
  return input_context_;
}

bool SessionState::IsStopToken(int64_t token) const {
  return std::find(stop_token_ids_.begin(), stop_token_ids_.end(), token) !=
         stop_token_ids_.end();
}

} // namespace decodeflux
