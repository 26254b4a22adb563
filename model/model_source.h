#pragma once

#include <filesystem>
#include <string>

namespace decodeflux {

// Resolves the files that make up a model checkpoint.  Remote hubs live
// behind this interface; the runtime only ever sees local paths.
class ModelSource {
public:
  virtual ~ModelSource() = default;

  // Local path of `file` (relative to the model root, e.g. "config.json" or
  // "onnx/model.onnx") for `model`.  Throws std::runtime_error when the file
  // is unavailable.
  virtual std::filesystem::path Resolve(const std::string &model,
                                        const std::string &file) = 0;

  // Whole-file read.  Throws std::runtime_error on I/O failure.
  virtual std::string ReadText(const std::filesystem::path &path);
};

// Hub-style cache laid out as <root>/<owner>/<name>/<file>.
class LocalModelSource : public ModelSource {
public:
  explicit LocalModelSource(std::filesystem::path root);

  std::filesystem::path Resolve(const std::string &model,
                                const std::string &file) override;

  const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path root_;
};

// Rejects empty ids, absolute paths and ".." components.
bool IsSafeRelativePath(const std::string &path);

} // namespace decodeflux
