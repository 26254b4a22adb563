#pragma once

#include "runtime/session/inference_session.h"

#include <memory>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

namespace decodeflux {

// InferenceSession over an Ort::Session.  Inputs are read straight from host
// tensors; outputs are copied into host tensors owned by the returned map.
class OrtSession : public InferenceSession {
public:
  OrtSession(Ort::Env &env, const SessionSpec &spec);
  ~OrtSession() override;

  TensorMap Run(const TensorBinding &feed, const RunOptions &options) override;
  void Release() override;
  std::shared_ptr<DeviceContext> InputContext() const override;

  const std::vector<std::string> &InputNames() const { return input_names_; }
  const std::vector<std::string> &OutputNames() const { return output_names_; }

private:
  // External data registered in memory; declared first so it outlives
  // session_.
  std::vector<std::vector<char>> external_data_;
  std::unique_ptr<Ort::Session> session_;
  std::shared_ptr<DeviceContext> context_;
  std::vector<std::string> input_names_;
  std::vector<std::string> output_names_;
};

class OrtSessionFactory : public SessionFactory {
public:
  OrtSessionFactory();

  std::string Name() const override { return "onnxruntime"; }
  std::unique_ptr<InferenceSession> Create(const SessionSpec &spec) override;

private:
  std::unique_ptr<Ort::Env> env_;
};

} // namespace decodeflux
