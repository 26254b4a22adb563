#pragma once

#include "model/model_config.h"
#include "model/model_source.h"
#include "runtime/generation/feed.h"
#include "runtime/session/inference_session.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace decodeflux {

struct LoadOptions {
  // Weights file relative to the model root.
  std::string onnx_file{"onnx/model.onnx"};
  // Load an external data file next to the weights.
  bool external_data{false};
  // External data file; "<onnx_file>_data" when empty.
  std::string data_file_name;
  std::vector<std::string> execution_providers{"cpu"};
  bool verbose{false};
  // kAuto takes the cache precision from config.json's torch_dtype.
  PrecisionPreference precision{PrecisionPreference::kAuto};
  // Stop ids honoured in addition to the model's eos ids.  32007 is the
  // <|end|> marker of the Phi-3 family.
  std::vector<int64_t> extra_stop_token_ids{32007};
};

// ---------------------------------------------------------------------------
// SessionState
//
// Owns the inference session, the persistent feed (per-layer KV cache) and
// the model metadata read at load time.
//
//   Load(model, opts)   — release any previous session, parse config.json,
//                         create a session, reset the feed
//   InitializeFeed()    — empty [1, kv_heads, 0, head_dim] cache per layer
//   Argmax(logits)      — greedy pick over the final position
//   UpdateKVCache(...)  — move present.* outputs into the cache slots
//   Release()           — free cache tensors and the session
// ---------------------------------------------------------------------------
class SessionState {
public:
  SessionState(std::shared_ptr<ModelSource> source,
               std::shared_ptr<SessionFactory> factory);
  ~SessionState();

  SessionState(const SessionState &) = delete;
  SessionState &operator=(const SessionState &) = delete;

  // Throws LoadError.  On failure the state is fully released.
  void Load(const std::string &model, const LoadOptions &options = {});

  void InitializeFeed();

  // Index of the largest logit at the last sequence position of a
  // [batch, sequence, vocab] tensor.  Ties resolve to the lowest index.
  // Throws InvalidOutputError on non-finite values or a malformed tensor.
  static int64_t Argmax(const Tensor &logits);

  // Release the device-resident cache tensors in `feed`, then move every
  // "present.<layer>.key|value" output into the matching cache slot.  Other
  // outputs stay in `outputs`.  Malformed or out-of-range cache outputs
  // throw InvalidOutputError before the feed is modified.
  static void UpdateKVCache(Feed &feed, TensorMap &outputs);

  void Release();

  bool IsReady() const { return session_ != nullptr; }
  const ModelMetadata &Metadata() const { return metadata_; }
  Feed &feed() { return feed_; }
  const Feed &feed() const { return feed_; }
  InferenceSession *session() const { return session_.get(); }
  std::shared_ptr<DeviceContext> InputContext() const;

  const std::vector<int64_t> &StopTokenIds() const { return stop_token_ids_; }
  bool IsStopToken(int64_t token) const;

private:
  void LoadLocked(const std::string &model, const LoadOptions &options);

  std::shared_ptr<ModelSource> source_;
  std::shared_ptr<SessionFactory> factory_;
  std::unique_ptr<InferenceSession> session_;
  std::shared_ptr<DeviceContext> input_context_;
  Feed feed_;
  ModelMetadata metadata_;
  std::vector<int64_t> stop_token_ids_;
};

} // namespace decodeflux
