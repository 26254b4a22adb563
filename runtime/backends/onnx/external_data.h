#pragma once

#include "runtime/session/inference_session.h"

#include <filesystem>
#include <string>
#include <vector>

namespace decodeflux {

// An external data file that has to be handed to onnxruntime in memory
// because the runtime would not find it beside the weights under the name
// the model references.
struct ExternalDataFile {
  // Location recorded in the model's initializers, "<weights file>_data".
  std::string location;
  std::filesystem::path path;
};

// Files in `spec.external_data_paths` onnxruntime cannot resolve itself.
// A file named "<weights file>_data" in the weights' directory needs nothing;
// any other name or directory is mapped onto that location.  Throws
// std::invalid_argument when more than one file would claim the location.
std::vector<ExternalDataFile> ExternalDataOverrides(const SessionSpec &spec);

// Whole-file binary read.  Throws std::runtime_error on I/O failure.
std::vector<char> ReadExternalData(const std::filesystem::path &path);

} // namespace decodeflux
