#pragma once

#include "model/model_source.h"
#include "runtime/device_context.h"
#include "runtime/session/inference_session.h"
#include "runtime/tensors/tensor.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace decodeflux {
namespace testing {

// Device-resident allocator that records every allocation so tests can check
// that each buffer is freed exactly once.
class CountingDeviceContext : public DeviceContext {
public:
  ~CountingDeviceContext() override {
    for (void *p : live_) {
      std::free(p);
    }
  }

  std::string Name() const override { return "counting"; }
  bool IsAvailable() const override { return true; }
  MemoryLocation Location() const override { return MemoryLocation::kDevice; }

  std::unique_ptr<DeviceBuffer> Allocate(std::size_t bytes) override {
    void *ptr = std::malloc(bytes == 0 ? 1 : bytes);
    if (!ptr) {
      throw std::bad_alloc();
    }
    live_.insert(ptr);
    ++allocations;
    return std::make_unique<DeviceBuffer>(ptr, bytes);
  }

  void Free(std::unique_ptr<DeviceBuffer> buffer) override {
    if (!buffer) {
      return;
    }
    auto it = live_.find(buffer->data());
    if (it == live_.end()) {
      ++double_frees;
      return;
    }
    live_.erase(it);
    std::free(buffer->data());
    ++frees;
  }

  void CopyToHost(const DeviceBuffer &buffer, std::size_t offset, void *dst,
                  std::size_t bytes) const override {
    if (bytes > 0) {
      std::memcpy(dst, static_cast<const char *>(buffer.data()) + offset,
                  bytes);
    }
  }

  void CopyFromHost(DeviceBuffer &buffer, std::size_t offset, const void *src,
                    std::size_t bytes) override {
    if (bytes > 0) {
      std::memcpy(static_cast<char *>(buffer.data()) + offset, src, bytes);
    }
  }

  void Trim() override { ++trims; }

  std::size_t LiveCount() const { return live_.size(); }

  std::size_t allocations{0};
  std::size_t frees{0};
  std::size_t double_frees{0};
  std::size_t trims{0};

private:
  std::set<void *> live_;
};

// What the fake session saw on one Run() call.
struct RecordedCall {
  std::vector<std::string> names;
  std::vector<int64_t> input_ids;
  std::vector<int64_t> position_ids;
  int64_t attention_mask_length{0};
  int64_t past_length{0};
};

// Scripted decoder: emits logits that peak at next_token(call_index) and
// grows a [1, kv_heads, len, head_dim] cache per layer.
class FakeSession : public InferenceSession {
public:
  FakeSession(std::shared_ptr<CountingDeviceContext> ctx, int layers,
              int kv_heads, int head_dim, int vocab)
      : ctx_(std::move(ctx)), layers_(layers), kv_heads_(kv_heads),
        head_dim_(head_dim), vocab_(vocab) {}

  TensorMap Run(const TensorBinding &feed,
                const RunOptions &options) override {
    if (released) {
      throw std::logic_error("Run on released FakeSession");
    }
    ++run_calls;
    last_options = options;
    if (fail_on_call == run_calls) {
      throw std::runtime_error("simulated inference failure");
    }

    RecordedCall call;
    int64_t seq = 0;
    for (const auto &[name, tensor] : feed) {
      call.names.push_back(name);
      if (name == "input_ids") {
        call.input_ids = tensor->ReadInt64();
        seq = tensor->shape()[1];
      } else if (name == "position_ids") {
        call.position_ids = tensor->ReadInt64();
      } else if (name == "attention_mask") {
        call.attention_mask_length = tensor->shape()[1];
      } else if (name == "past_key_values.0.key") {
        call.past_length = tensor->shape()[2];
      }
    }
    calls.push_back(call);

    TensorMap out;
    const std::size_t step = run_calls - 1;
    std::vector<float> logits(static_cast<std::size_t>(seq * vocab_), 0.0f);
    if (seq > 0) {
      const int64_t token = next_token ? next_token(step) : 10;
      float *last = logits.data() + (seq - 1) * vocab_;
      if (nan_on_call == run_calls) {
        last[0] = std::nanf("");
      } else if (token >= 0 && token < vocab_) {
        last[token] = 1.0f;
      }
    }
    if (emit_logits) {
      out.emplace("logits", Tensor::FromFloat32(ctx_, {1, seq, vocab_}, logits));
    }

    const int64_t total = call.past_length + seq;
    for (int i = 0; i < layers_; ++i) {
      const std::string base = "present." + std::to_string(i);
      out.emplace(base + ".key",
                  Tensor::Allocate(ctx_, DataType::kFloat32,
                                   {1, kv_heads_, total, head_dim_}));
      out.emplace(base + ".value",
                  Tensor::Allocate(ctx_, DataType::kFloat32,
                                   {1, kv_heads_, total, head_dim_}));
    }
    return out;
  }

  void Release() override {
    released = true;
    ++release_calls;
    if (release_sink) {
      ++*release_sink;
    }
  }

  std::shared_ptr<DeviceContext> InputContext() const override { return ctx_; }

  std::function<int64_t(std::size_t)> next_token;
  std::size_t fail_on_call{0}; // 1-based; 0 = never
  std::size_t nan_on_call{0};  // 1-based; 0 = never
  bool emit_logits{true};
  std::size_t *release_sink{nullptr}; // survives the session

  std::size_t run_calls{0};
  std::size_t release_calls{0};
  bool released{false};
  std::vector<RecordedCall> calls;
  RunOptions last_options;

private:
  std::shared_ptr<CountingDeviceContext> ctx_;
  int layers_;
  int64_t kv_heads_;
  int64_t head_dim_;
  int64_t vocab_;
};

// Hands out FakeSessions sharing one CountingDeviceContext.  `configure`
// runs on every new session before it is returned.
class FakeSessionFactory : public SessionFactory {
public:
  FakeSessionFactory(int layers, int kv_heads, int head_dim, int vocab)
      : ctx(std::make_shared<CountingDeviceContext>()), layers_(layers),
        kv_heads_(kv_heads), head_dim_(head_dim), vocab_(vocab) {}

  std::string Name() const override { return "fake"; }

  std::unique_ptr<InferenceSession> Create(const SessionSpec &spec) override {
    last_spec = spec;
    ++create_calls;
    if (fail_create) {
      throw std::runtime_error("simulated session construction failure");
    }
    auto session = std::make_unique<FakeSession>(ctx, layers_, kv_heads_,
                                                 head_dim_, vocab_);
    session->release_sink = &sessions_released;
    if (configure) {
      configure(*session);
    }
    last_session = session.get();
    return session;
  }

  std::shared_ptr<CountingDeviceContext> ctx;
  std::function<void(FakeSession &)> configure;
  bool fail_create{false};
  std::size_t create_calls{0};
  std::size_t sessions_released{0};
  SessionSpec last_spec;
  FakeSession *last_session{nullptr}; // owned by the SessionState

private:
  int layers_;
  int kv_heads_;
  int head_dim_;
  int vocab_;
};

// Model files served from memory under a virtual root.
class InMemoryModelSource : public ModelSource {
public:
  void Put(const std::string &model, const std::string &file,
           const std::string &contents) {
    files_[(Root() / model / file).string()] = contents;
  }

  std::filesystem::path Resolve(const std::string &model,
                                const std::string &file) override {
    auto path = Root() / model / file;
    if (files_.count(path.string()) == 0) {
      throw std::runtime_error("model file not found: " + path.string());
    }
    return path;
  }

  std::string ReadText(const std::filesystem::path &path) override {
    auto it = files_.find(path.string());
    if (it == files_.end()) {
      throw std::runtime_error("cannot open " + path.string());
    }
    return it->second;
  }

private:
  static std::filesystem::path Root() { return "/virtual/models"; }
  std::map<std::string, std::string> files_;
};

inline std::string MakeConfigJson(int layers, int kv_heads, int heads,
                                  int hidden, int vocab, int64_t eos) {
  nlohmann::json j;
  j["model_type"] = "phi3";
  j["hidden_size"] = hidden;
  j["num_hidden_layers"] = layers;
  j["num_attention_heads"] = heads;
  j["num_key_value_heads"] = kv_heads;
  j["vocab_size"] = vocab;
  j["eos_token_id"] = eos;
  j["torch_dtype"] = "float32";
  return j.dump();
}

// Registers config.json and onnx/model.onnx for `model`.
inline std::shared_ptr<InMemoryModelSource>
MakeModelSource(const std::string &model, int layers, int kv_heads,
                int head_dim, int vocab, int64_t eos) {
  auto source = std::make_shared<InMemoryModelSource>();
  source->Put(model, "config.json",
              MakeConfigJson(layers, kv_heads, kv_heads, kv_heads * head_dim,
                             vocab, eos));
  source->Put(model, "onnx/model.onnx", "onnx");
  return source;
}

} // namespace testing
} // namespace decodeflux
