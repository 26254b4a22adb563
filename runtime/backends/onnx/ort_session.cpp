#include "runtime/backends/onnx/ort_session.h"

#include "logging/logger.h"
#include "runtime/backends/host/host_device_context.h"
#include "runtime/backends/onnx/external_data.h"

#include <cstdint>
#include <stdexcept>
#include <utility>

namespace decodeflux {

namespace {

ONNXTensorElementDataType ToOrtType(DataType dtype) {
  switch (dtype) {
  case DataType::kFloat16:
    return ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT16;
  case DataType::kFloat32:
    return ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT;
  case DataType::kInt64:
    return ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64;
  }
  return ONNX_TENSOR_ELEMENT_DATA_TYPE_UNDEFINED;
}

bool FromOrtType(ONNXTensorElementDataType type, DataType &out) {
  switch (type) {
  case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT16:
    out = DataType::kFloat16;
    return true;
  case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT:
    out = DataType::kFloat32;
    return true;
  case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64:
    out = DataType::kInt64;
    return true;
  default:
    return false;
  }
}

void AppendProviders(Ort::SessionOptions &so,
                     const std::vector<std::string> &providers) {
  for (const auto &name : providers) {
    if (name == "cpu") {
      continue; // always registered last by onnxruntime
    }
    if (name == "cuda") {
      OrtCUDAProviderOptions cuda_options{};
      so.AppendExecutionProvider_CUDA(cuda_options);
      continue;
    }
    throw std::invalid_argument("unsupported execution provider '" + name +
                                "'");
  }
}

} // namespace

OrtSession::OrtSession(Ort::Env &env, const SessionSpec &spec)
    : context_(SharedHostContext()) {
  Ort::SessionOptions so;
  so.SetGraphOptimizationLevel(spec.graph_optimization_level == "all"
                                   ? GraphOptimizationLevel::ORT_ENABLE_ALL
                                   : GraphOptimizationLevel::ORT_ENABLE_BASIC);
  if (spec.verbose) {
    so.SetLogSeverityLevel(0);
    so.SetLogId("decodeflux");
  }
  AppendProviders(so, spec.execution_providers);

  // onnxruntime resolves external data by the location recorded in the
  // model.  Files under any other name are registered in memory under that
  // location; the buffers stay alive as long as the session.
  const auto overrides = ExternalDataOverrides(spec);
  if (!overrides.empty()) {
    std::vector<std::basic_string<ORTCHAR_T>> names;
    std::vector<char *> buffers;
    std::vector<std::size_t> lengths;
    for (const auto &file : overrides) {
      external_data_.push_back(ReadExternalData(file.path));
      names.emplace_back(file.location.begin(), file.location.end());
      buffers.push_back(external_data_.back().data());
      lengths.push_back(external_data_.back().size());
      log::Info("ort_session", "External data mapped in memory",
                "location=" + file.location + " path=" + file.path.string());
    }
    so.AddExternalInitializersFromFilesInMemory(names, buffers, lengths);
  }

  session_ = std::make_unique<Ort::Session>(env, spec.weights_path.c_str(), so);

  Ort::AllocatorWithDefaultOptions allocator;
  for (std::size_t i = 0; i < session_->GetInputCount(); ++i) {
    input_names_.push_back(
        session_->GetInputNameAllocated(i, allocator).get());
  }
  for (std::size_t i = 0; i < session_->GetOutputCount(); ++i) {
    output_names_.push_back(
        session_->GetOutputNameAllocated(i, allocator).get());
  }
  log::Info("ort_session", "Session created",
            "inputs=" + std::to_string(input_names_.size()) +
                " outputs=" + std::to_string(output_names_.size()));
}

OrtSession::~OrtSession() = default;

TensorMap OrtSession::Run(const TensorBinding &feed,
                          const RunOptions &options) {
  if (!session_) {
    throw std::logic_error("OrtSession::Run after Release");
  }

  auto mem = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

  std::vector<const char *> in_names;
  std::vector<Ort::Value> in_values;
  // Host copies of inputs that live in device memory.
  std::vector<std::vector<uint8_t>> staging;
  in_names.reserve(feed.size());
  in_values.reserve(feed.size());
  staging.reserve(feed.size());

  for (const auto &[name, tensor] : feed) {
    void *data = nullptr;
    const std::size_t bytes = tensor->ByteSize();
    if (tensor->location() == MemoryLocation::kHost) {
      data = tensor->buffer() ? tensor->buffer()->data() : nullptr;
    } else {
      staging.emplace_back(bytes);
      tensor->CopyTo(staging.back().data());
      data = staging.back().data();
    }
    if (!data) {
      // Zero-length cache placeholders still need a non-null pointer.
      static int64_t empty_placeholder = 0;
      data = &empty_placeholder;
    }
    const auto &shape = tensor->shape();
    in_values.push_back(Ort::Value::CreateTensor(
        mem, data, bytes, shape.data(), shape.size(),
        ToOrtType(tensor->dtype())));
    in_names.push_back(name.c_str());
  }

  std::vector<const char *> out_names;
  out_names.reserve(output_names_.size());
  for (const auto &name : output_names_) {
    out_names.push_back(name.c_str());
  }

  Ort::RunOptions run_options;
  if (!options.memory_arena_shrinkage.empty()) {
    run_options.AddConfigEntry("memory.enable_memory_arena_shrinkage",
                               options.memory_arena_shrinkage.c_str());
  }

  auto results =
      session_->Run(run_options, in_names.data(), in_values.data(),
                    in_values.size(), out_names.data(), out_names.size());

  TensorMap outputs;
  for (std::size_t i = 0; i < results.size(); ++i) {
    auto info = results[i].GetTensorTypeAndShapeInfo();
    DataType dtype;
    if (!FromOrtType(info.GetElementType(), dtype)) {
      log::Warn("ort_session", "Skipping output with unsupported type",
                "name=" + output_names_[i]);
      continue;
    }
    std::vector<int64_t> shape = info.GetShape();
    const std::size_t bytes = info.GetElementCount() * ElementSize(dtype);
    const void *data = results[i].GetTensorData<uint8_t>();
    outputs.emplace(output_names_[i],
                    Tensor::FromBytes(context_, dtype, std::move(shape), data,
                                      bytes));
  }
  return outputs;
}

void OrtSession::Release() {
  session_.reset();
  external_data_.clear();
  input_names_.clear();
  output_names_.clear();
}

std::shared_ptr<DeviceContext> OrtSession::InputContext() const {
  return context_;
}

OrtSessionFactory::OrtSessionFactory()
    : env_(std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING,
                                      "decodeflux")) {}

std::unique_ptr<InferenceSession>
OrtSessionFactory::Create(const SessionSpec &spec) {
  try {
    return std::make_unique<OrtSession>(*env_, spec);
  } catch (const Ort::Exception &e) {
    throw std::runtime_error(std::string("onnxruntime: ") + e.what());
  }
}

} // namespace decodeflux
