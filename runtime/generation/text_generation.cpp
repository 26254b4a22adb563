#include "runtime/generation/text_generation.h"

#include "logging/logger.h"
#include "runtime/errors.h"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace decodeflux {

namespace {

// Never a valid token id, so the first step always runs.
constexpr int64_t kNoToken = -1;

// Releases the feed's per-step slots when the decode loop exits, whichever
// way it exits.
class TransientSlotGuard {
public:
  explicit TransientSlotGuard(Feed &feed) : feed_(feed) {}
  ~TransientSlotGuard() { feed_.ReleaseTransient(); }

  TransientSlotGuard(const TransientSlotGuard &) = delete;
  TransientSlotGuard &operator=(const TransientSlotGuard &) = delete;

private:
  Feed &feed_;
};

} // namespace

const char *FinishReasonName(FinishReason reason) {
  switch (reason) {
  case FinishReason::kNone:
    return "none";
  case FinishReason::kStopToken:
    return "stop_token";
  case FinishReason::kMaxTokens:
    return "max_tokens";
  case FinishReason::kCancelled:
    return "cancelled";
  case FinishReason::kDecodeError:
    return "decode_error";
  }
  return "unknown";
}

TextGeneration::TextGeneration(std::shared_ptr<ModelSource> source,
                               std::shared_ptr<SessionFactory> factory,
                               TextGenerationOptions options)
    : state_(std::move(source), std::move(factory)),
      options_(std::move(options)) {
  if (options_.progress_interval == 0) {
    throw std::invalid_argument("progress_interval must be positive");
  }
}

void TextGeneration::Load(const std::string &model,
                          const LoadOptions &options) {
  output_tokens_.clear();
  state_.Load(model, options);
}

void TextGeneration::InitializeFeed() {
  state_.InitializeFeed();
  output_tokens_.clear();
}

int64_t TextGeneration::NextToken(const Tensor &logits) const {
  const int64_t index = SessionState::Argmax(logits);
  const int vocab = state_.Metadata().vocab_size;
  if (index < 0 || (vocab > 0 && index >= vocab)) {
    throw TokenDecodeError("argmax index " + std::to_string(index) +
                           " outside vocabulary of " + std::to_string(vocab));
  }
  return index;
}

std::vector<int64_t>
TextGeneration::Generate(const std::vector<int64_t> &prompt,
                         const ProgressCallback &callback,
                         std::size_t max_tokens) {
  if (!state_.IsReady()) {
    throw SessionNotReadyError("Generate called without a loaded session");
  }
  if (prompt.empty()) {
    throw std::invalid_argument("prompt must contain at least one token");
  }

  stop_requested_.store(false);
  finish_reason_ = FinishReason::kNone;
  output_tokens_ = prompt;

  Feed &feed = state_.feed();
  InferenceSession *session = state_.session();
  const auto ctx = state_.InputContext();
  TransientSlotGuard guard(feed);

  const auto prompt_len = static_cast<int64_t>(prompt.size());
  feed.input_ids = Tensor::FromInt64(ctx, {1, prompt_len}, prompt);

  if (options_.need_position_ids) {
    const auto sequence_length = static_cast<int64_t>(output_tokens_.size());
    std::vector<int64_t> positions(prompt.size());
    for (int64_t i = 0; i < prompt_len; ++i) {
      positions[i] = sequence_length - prompt_len + i;
    }
    feed.position_ids = Tensor::FromInt64(ctx, {1, prompt_len}, positions);
  }

  const auto started = std::chrono::steady_clock::now();
  int64_t last_token = kNoToken;
  while (true) {
    if (state_.IsStopToken(last_token)) {
      finish_reason_ = FinishReason::kStopToken;
      break;
    }
    if (output_tokens_.size() >= max_tokens) {
      finish_reason_ = FinishReason::kMaxTokens;
      break;
    }
    if (stop_requested_.load()) {
      finish_reason_ = FinishReason::kCancelled;
      break;
    }

    const auto sequence_length = static_cast<int64_t>(output_tokens_.size());
    feed.attention_mask = Tensor::FromInt64(
        ctx, {1, sequence_length},
        std::vector<int64_t>(static_cast<std::size_t>(sequence_length), 1));

    TensorMap outputs = session->Run(feed.Bind(), options_.run_options);

    auto logits = outputs.find("logits");
    if (logits == outputs.end()) {
      throw MissingOutputError("no logits in model output");
    }

    try {
      last_token = NextToken(logits->second);
    } catch (const InvalidOutputError &e) {
      log::Warn("text_generation", "Token conversion error", e.what());
      finish_reason_ = FinishReason::kDecodeError;
      break;
    } catch (const TokenDecodeError &e) {
      log::Warn("text_generation", "Token conversion error", e.what());
      finish_reason_ = FinishReason::kDecodeError;
      break;
    }
    output_tokens_.push_back(last_token);

    if (callback && output_tokens_.size() % options_.progress_interval == 0) {
      callback(output_tokens_);
    }

    // Remaining outputs (logits) are released when `outputs` goes out of
    // scope at the end of the step.
    SessionState::UpdateKVCache(feed, outputs);

    feed.input_ids = Tensor::FromInt64(ctx, {1, 1}, {last_token});
    if (options_.need_position_ids) {
      feed.position_ids = Tensor::FromInt64(ctx, {1, 1}, {sequence_length});
    }
  }

  if (callback) {
    callback(output_tokens_);
  }

  const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - started)
                              .count();
  log::Debug("text_generation", "Generation finished",
             "reason=" + std::string(FinishReasonName(finish_reason_)) +
                 " prompt=" + std::to_string(prompt.size()) +
                 " generated=" +
                 std::to_string(output_tokens_.size() - prompt.size()) +
                 " elapsed_ms=" + std::to_string(elapsed_ms));
  return output_tokens_;
}

void TextGeneration::Dispose() {
  output_tokens_.clear();
  Tensor &mask = state_.feed().attention_mask;
  if (mask.IsOwned()) {
    mask.Release();
  }
  state_.Release();
}

} // namespace decodeflux
