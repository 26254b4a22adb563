#include "config/engine_config.h"
#include "logging/logger.h"
#include "model/model_source.h"
#include "runtime/errors.h"
#include "runtime/generation/text_generation.h"

#ifdef DECODEFLUX_HAS_ONNXRUNTIME
#include "runtime/backends/onnx/ort_session.h"
#endif

#include <nlohmann/json.hpp>

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

decodeflux::TextGeneration *g_engine = nullptr;

void HandleSigint(int) {
  if (g_engine) {
    g_engine->Stop();
  }
}

void PrintUsage() {
  std::cout
      << "Usage:\n"
      << "  decodeflux-cli --tokens 1,2,3 [--config decodeflux.yaml] "
         "[--model OWNER/NAME]\n"
      << "                 [--max-tokens N] [--json]\n"
      << "      Greedy-decode from the given prompt token ids and print the "
         "full sequence.\n"
      << "      --json prints progress snapshots and the result as JSON "
         "lines.\n";
}

bool ParseTokenList(const std::string &text, std::vector<int64_t> &out) {
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (item.empty()) {
      continue;
    }
    try {
      std::size_t used = 0;
      const long long value = std::stoll(item, &used);
      if (used != item.size()) {
        return false;
      }
      out.push_back(static_cast<int64_t>(value));
    } catch (const std::exception &) {
      return false;
    }
  }
  return !out.empty();
}

std::string JoinTokens(const std::vector<int64_t> &tokens) {
  std::string out;
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    if (i > 0) {
      out += ' ';
    }
    out += std::to_string(tokens[i]);
  }
  return out;
}

std::shared_ptr<decodeflux::SessionFactory> MakeSessionFactory() {
#ifdef DECODEFLUX_HAS_ONNXRUNTIME
  return std::make_shared<decodeflux::OrtSessionFactory>();
#else
  return nullptr;
#endif
}

} // namespace

int main(int argc, char **argv) {
  namespace dfx = decodeflux;

  std::string config_path;
  std::string model_override;
  std::string token_arg;
  long long max_tokens_override = -1;
  bool json_output = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--model" && i + 1 < argc) {
      model_override = argv[++i];
    } else if (arg == "--tokens" && i + 1 < argc) {
      token_arg = argv[++i];
    } else if (arg == "--max-tokens" && i + 1 < argc) {
      try {
        max_tokens_override = std::stoll(argv[++i]);
      } catch (const std::exception &) {
        std::cerr << "--max-tokens expects an integer\n";
        return 2;
      }
    } else if (arg == "--json") {
      json_output = true;
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage();
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      PrintUsage();
      return 2;
    }
  }

  dfx::EngineConfig config;
  try {
    config = config_path.empty() ? dfx::DefaultEngineConfig()
                                 : dfx::LoadEngineConfig(config_path);
  } catch (const std::exception &e) {
    std::cerr << e.what() << "\n";
    return 2;
  }
  dfx::ApplyEnvOverrides(config);
  if (!model_override.empty()) {
    config.model_id = model_override;
  }
  if (max_tokens_override > 0) {
    config.max_tokens = static_cast<std::size_t>(max_tokens_override);
  }

  dfx::log::SetJsonMode(config.json_logs);
  dfx::log::SetMinLevel(config.verbose ? dfx::log::Level::DEBUG
                                       : dfx::log::Level::INFO);

  std::vector<int64_t> prompt;
  if (!ParseTokenList(token_arg, prompt)) {
    std::cerr << "--tokens expects a comma-separated list of token ids\n";
    PrintUsage();
    return 2;
  }
  if (config.model_id.empty()) {
    std::cerr << "No model id: set model.id in the config or pass --model\n";
    return 2;
  }

  auto factory = MakeSessionFactory();
  if (!factory) {
    dfx::log::Error("cli", "No session backend available",
                    "rebuild with onnxruntime installed");
    return 1;
  }

  auto source = std::make_shared<dfx::LocalModelSource>(config.model_root);
  dfx::TextGeneration engine(source, factory, config.generation);
  g_engine = &engine;
  std::signal(SIGINT, HandleSigint);

  int status = 0;
  try {
    engine.Load(config.model_id, config.load);
    engine.InitializeFeed();

    auto on_progress = [&](const std::vector<int64_t> &tokens) {
      if (json_output) {
        std::cout << json{{"event", "progress"}, {"tokens", tokens}}.dump()
                  << "\n";
      } else {
        dfx::log::Info("cli", "Progress",
                       "length=" + std::to_string(tokens.size()));
      }
    };
    auto result = engine.Generate(prompt, on_progress, config.max_tokens);

    const char *reason = dfx::FinishReasonName(engine.LastFinishReason());
    if (json_output) {
      std::cout << json{{"event", "done"},
                        {"finish_reason", reason},
                        {"tokens", result}}
                       .dump()
                << "\n";
    } else {
      std::cout << JoinTokens(result) << "\n";
      dfx::log::Info("cli", "Done",
                     std::string("finish_reason=") + reason +
                         " length=" + std::to_string(result.size()));
    }
  } catch (const dfx::LoadError &e) {
    dfx::log::Error("cli", "Load failed", e.what());
    status = 1;
  } catch (const std::exception &e) {
    dfx::log::Error("cli", "Generation failed", e.what());
    status = 1;
  }

  engine.Dispose();
  g_engine = nullptr;
  return status;
}
