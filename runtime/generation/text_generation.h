#pragma once

#include "runtime/generation/session_state.h"
#include "runtime/session/inference_session.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace decodeflux {

// Receives a snapshot of the full token sequence (prompt + generated so far).
// Must not throw.
using ProgressCallback = std::function<void(const std::vector<int64_t> &)>;

struct TextGenerationOptions {
  // Feed position_ids alongside input_ids (required by most decoder-only
  // exports; some stateful models compute positions internally).
  bool need_position_ids{true};
  // The progress callback fires whenever the sequence length is a multiple
  // of this value.
  std::size_t progress_interval{32};
  RunOptions run_options;
};

enum class FinishReason {
  kNone,
  kStopToken,
  kMaxTokens,
  kCancelled,
  kDecodeError,
};

const char *FinishReasonName(FinishReason reason);

// ---------------------------------------------------------------------------
// TextGeneration — greedy autoregressive decode loop over a SessionState.
//
// Generate() runs the prompt through the session once, then feeds back one
// token per step until a stop id is produced, the sequence reaches
// max_tokens, or Stop() is called.  Per-step tensors (input_ids,
// attention_mask, position_ids) live in the feed's transient slots and are
// released on every exit path.
//
// Not safe for concurrent Generate() calls on one instance.  Stop() may be
// called from any thread or from inside the progress callback.
// ---------------------------------------------------------------------------
class TextGeneration {
public:
  TextGeneration(std::shared_ptr<ModelSource> source,
                 std::shared_ptr<SessionFactory> factory,
                 TextGenerationOptions options = {});

  TextGeneration(const TextGeneration &) = delete;
  TextGeneration &operator=(const TextGeneration &) = delete;

  // Forwards to SessionState::Load() and clears the previous output.
  void Load(const std::string &model, const LoadOptions &options = {});

  // Reset the KV cache to empty placeholders and clear the output.
  void InitializeFeed();

  // Returns prompt + generated continuation.  `max_tokens` bounds the total
  // length including the prompt.  Throws SessionNotReadyError,
  // MissingOutputError, std::invalid_argument (empty prompt), or whatever the
  // session throws; transient tensors are released first in every case.
  std::vector<int64_t> Generate(const std::vector<int64_t> &prompt,
                                const ProgressCallback &callback,
                                std::size_t max_tokens);

  // Cooperative cancellation, observed at the next loop check.
  void Stop() { stop_requested_.store(true); }
  bool StopRequested() const { return stop_requested_.load(); }

  // Clear the output, release the attention mask and tear down the session.
  void Dispose();

  const std::vector<int64_t> &OutputTokens() const { return output_tokens_; }
  FinishReason LastFinishReason() const { return finish_reason_; }

  SessionState &state() { return state_; }
  const SessionState &state() const { return state_; }
  const TextGenerationOptions &options() const { return options_; }

private:
  // Argmax over the final position, checked against the vocabulary.
  int64_t NextToken(const Tensor &logits) const;

  SessionState state_;
  TextGenerationOptions options_;
  std::vector<int64_t> output_tokens_;
  std::atomic<bool> stop_requested_{false};
  FinishReason finish_reason_{FinishReason::kNone};
};

} // namespace decodeflux
