#include "runtime/backends/onnx/external_data.h"

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace decodeflux {

std::vector<ExternalDataFile> ExternalDataOverrides(const SessionSpec &spec) {
  const std::string location = spec.weights_path.filename().string() + "_data";
  const auto weights_dir = spec.weights_path.parent_path();

  std::vector<ExternalDataFile> overrides;
  for (const auto &path : spec.external_data_paths) {
    if (path.filename() == location && path.parent_path() == weights_dir) {
      continue;
    }
    overrides.push_back({location, path});
  }
  if (overrides.size() > 1 ||
      (!overrides.empty() && spec.external_data_paths.size() > 1)) {
    throw std::invalid_argument("only one external data file can back " +
                                location);
  }
  return overrides;
}

std::vector<char> ReadExternalData(const std::filesystem::path &path) {
  std::ifstream f(path, std::ios::binary);
  if (!f.is_open()) {
    throw std::runtime_error("cannot open external data " + path.string());
  }
  std::vector<char> bytes((std::istreambuf_iterator<char>(f)),
                          std::istreambuf_iterator<char>());
  if (f.bad()) {
    throw std::runtime_error("read failed for " + path.string());
  }
  return bytes;
}

} // namespace decodeflux
