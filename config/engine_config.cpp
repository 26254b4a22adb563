#include "config/engine_config.h"

#include "logging/logger.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace decodeflux {

namespace {

std::filesystem::path DecodefluxHome() {
  if (const char *env = std::getenv("DECODEFLUX_HOME")) {
    return std::filesystem::path(env);
  }
  if (const char *home = std::getenv("HOME")) {
    return std::filesystem::path(home) / ".cache" / "decodeflux";
  }
  return std::filesystem::current_path() / ".decodeflux";
}

std::filesystem::path ExpandHome(const std::string &path) {
  if (path.size() >= 1 && path[0] == '~') {
    if (const char *home = std::getenv("HOME")) {
      return std::filesystem::path(home + path.substr(1));
    }
  }
  return std::filesystem::path(path);
}

void ApplyModel(const YAML::Node &node, EngineConfig &cfg) {
  if (node["id"]) cfg.model_id = node["id"].as<std::string>();
  if (node["root"]) cfg.model_root = ExpandHome(node["root"].as<std::string>());
  if (node["onnx_file"]) cfg.load.onnx_file = node["onnx_file"].as<std::string>();
  if (node["external_data"]) cfg.load.external_data = node["external_data"].as<bool>();
  if (node["data_file_name"]) cfg.load.data_file_name = node["data_file_name"].as<std::string>();
  if (node["precision"]) {
    const auto name = node["precision"].as<std::string>();
    if (!ParsePrecisionPreference(name, cfg.load.precision)) {
      throw std::runtime_error("unknown model.precision '" + name + "'");
    }
  }
}

void ApplyRuntime(const YAML::Node &node, EngineConfig &cfg) {
  if (node["execution_providers"]) {
    if (!node["execution_providers"].IsSequence()) {
      throw std::runtime_error("runtime.execution_providers must be a list");
    }
    cfg.load.execution_providers.clear();
    for (const auto &ep : node["execution_providers"]) {
      cfg.load.execution_providers.push_back(ep.as<std::string>());
    }
  }
  if (node["max_tokens"]) cfg.max_tokens = node["max_tokens"].as<std::size_t>();
  if (node["need_position_ids"]) cfg.generation.need_position_ids = node["need_position_ids"].as<bool>();
  if (node["progress_interval"]) cfg.generation.progress_interval = node["progress_interval"].as<std::size_t>();
  if (node["stop_token_ids"]) {
    if (!node["stop_token_ids"].IsSequence()) {
      throw std::runtime_error("runtime.stop_token_ids must be a list");
    }
    cfg.load.extra_stop_token_ids.clear();
    for (const auto &id : node["stop_token_ids"]) {
      cfg.load.extra_stop_token_ids.push_back(id.as<int64_t>());
    }
  }
  if (node["memory_arena_shrinkage"]) cfg.generation.run_options.memory_arena_shrinkage = node["memory_arena_shrinkage"].as<std::string>();
}

void ApplyLogging(const YAML::Node &node, EngineConfig &cfg) {
  if (node["verbose"]) cfg.verbose = node["verbose"].as<bool>();
  if (node["format"]) {
    const auto format = node["format"].as<std::string>();
    if (format != "text" && format != "json") {
      throw std::runtime_error("logging.format must be 'text' or 'json'");
    }
    cfg.json_logs = format == "json";
  }
}

} // namespace

EngineConfig DefaultEngineConfig() {
  EngineConfig cfg;
  cfg.model_root = DecodefluxHome() / "models";
  return cfg;
}

EngineConfig ParseEngineConfig(const std::string &yaml_text,
                               const std::string &origin) {
  EngineConfig cfg = DefaultEngineConfig();
  try {
    YAML::Node config = YAML::Load(yaml_text);
    if (config["model"]) ApplyModel(config["model"], cfg);
    if (config["runtime"]) ApplyRuntime(config["runtime"], cfg);
    if (config["logging"]) ApplyLogging(config["logging"], cfg);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error(origin + ": " + e.what());
  } catch (const std::runtime_error &e) {
    throw std::runtime_error(origin + ": " + e.what());
  }
  if (cfg.generation.progress_interval == 0) {
    throw std::runtime_error(origin +
                             ": runtime.progress_interval must be positive");
  }
  cfg.load.verbose = cfg.verbose;
  return cfg;
}

EngineConfig LoadEngineConfig(const std::filesystem::path &path) {
  std::ifstream f(path);
  if (!f.is_open()) {
    throw std::runtime_error("cannot open config " + path.string());
  }
  std::stringstream ss;
  ss << f.rdbuf();
  EngineConfig cfg = ParseEngineConfig(ss.str(), path.string());
  log::Debug("engine_config", "Loaded " + path.string());
  return cfg;
}

void ApplyEnvOverrides(EngineConfig &config) {
  if (const char *root = std::getenv("DECODEFLUX_MODEL_ROOT")) {
    config.model_root = ExpandHome(root);
  }
  if (const char *format = std::getenv("DECODEFLUX_LOG_FORMAT")) {
    config.json_logs = std::string(format) == "json";
  }
}

} // namespace decodeflux
