#include "model/model_source.h"
#include "logging/logger.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace decodeflux {

bool IsSafeRelativePath(const std::string &path) {
  if (path.empty()) {
    return false;
  }
  std::filesystem::path p(path);
  if (p.is_absolute() || p.has_root_name()) {
    return false;
  }
  for (const auto &part : p) {
    if (part == "..") {
      return false;
    }
  }
  return true;
}

std::string ModelSource::ReadText(const std::filesystem::path &path) {
  std::ifstream f(path, std::ios::binary);
  if (!f.is_open()) {
    throw std::runtime_error("cannot open " + path.string());
  }
  std::stringstream ss;
  ss << f.rdbuf();
  if (f.bad()) {
    throw std::runtime_error("read failed for " + path.string());
  }
  return ss.str();
}

LocalModelSource::LocalModelSource(std::filesystem::path root)
    : root_(std::move(root)) {}

std::filesystem::path LocalModelSource::Resolve(const std::string &model,
                                                const std::string &file) {
  if (!IsSafeRelativePath(model)) {
    throw std::runtime_error("invalid model id '" + model + "'");
  }
  if (!IsSafeRelativePath(file)) {
    throw std::runtime_error("invalid model file '" + file + "'");
  }
  auto path = root_ / model / file;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw std::runtime_error("model file not found: " + path.string());
  }
  log::Debug("model_source", "Resolved " + model + "/" + file,
             "path=" + path.string());
  return path;
}

} // namespace decodeflux
