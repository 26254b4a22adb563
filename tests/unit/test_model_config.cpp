#include <catch2/catch_test_macros.hpp>

#include "model/model_config.h"
#include "model/model_source.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

using namespace decodeflux;
namespace fs = std::filesystem;

namespace {

nlohmann::json Phi3Config() {
  nlohmann::json j;
  j["model_type"] = "phi3";
  j["hidden_size"] = 3072;
  j["num_hidden_layers"] = 32;
  j["num_attention_heads"] = 32;
  j["num_key_value_heads"] = 32;
  j["vocab_size"] = 32064;
  j["eos_token_id"] = 32000;
  j["torch_dtype"] = "bfloat16";
  return j;
}

} // namespace

// ---------------------------------------------------------------------------
// ParseModelConfig
// ---------------------------------------------------------------------------

TEST_CASE("ModelMetadata defaults", "[model_config]") {
  ModelMetadata md;
  REQUIRE_FALSE(md.valid);
  REQUIRE(md.eos_token_ids.empty());
  REQUIRE(md.StopTokenId() == -1);
  REQUIRE(md.precision == Precision::kFloat32);
}

TEST_CASE("ParseModelConfig reads a Phi-3 style config", "[model_config]") {
  auto md = ParseModelConfig(Phi3Config().dump());
  REQUIRE(md.valid);
  REQUIRE(md.model_type == "phi3");
  REQUIRE(md.StopTokenId() == 32000);
  REQUIRE(md.num_hidden_layers == 32);
  REQUIRE(md.num_key_value_heads == 32);
  REQUIRE(md.head_dim == 96);
  REQUIRE(md.vocab_size == 32064);
  REQUIRE(md.KVShape() == std::vector<int64_t>{1, 32, 0, 96});
  REQUIRE(md.CacheDataType() == DataType::kFloat32);
}

TEST_CASE("ParseModelConfig accepts an eos_token_id list", "[model_config]") {
  auto j = Phi3Config();
  j["eos_token_id"] = {128001, 128008, 128009};
  auto md = ParseModelConfig(j.dump());
  REQUIRE(md.valid);
  REQUIRE(md.eos_token_ids == std::vector<int64_t>{128001, 128008, 128009});
  REQUIRE(md.StopTokenId() == 128001);
}

TEST_CASE("ParseModelConfig GQA fallback and explicit head_dim",
          "[model_config]") {
  SECTION("num_key_value_heads absent falls back to attention heads") {
    auto j = Phi3Config();
    j.erase("num_key_value_heads");
    auto md = ParseModelConfig(j.dump());
    REQUIRE(md.valid);
    REQUIRE(md.num_key_value_heads == 32);
  }
  SECTION("explicit head_dim wins over hidden / heads") {
    auto j = Phi3Config();
    j["num_key_value_heads"] = 8;
    j["head_dim"] = 128;
    auto md = ParseModelConfig(j.dump());
    REQUIRE(md.valid);
    REQUIRE(md.KVShape() == std::vector<int64_t>{1, 8, 0, 128});
  }
}

TEST_CASE("ParseModelConfig precision preference", "[model_config]") {
  auto j = Phi3Config();
  SECTION("auto follows torch_dtype float16") {
    j["torch_dtype"] = "float16";
    auto md = ParseModelConfig(j.dump(), PrecisionPreference::kAuto);
    REQUIRE(md.precision == Precision::kFloat16);
    REQUIRE(md.CacheDataType() == DataType::kFloat16);
  }
  SECTION("auto maps other dtypes to float32") {
    auto md = ParseModelConfig(j.dump(), PrecisionPreference::kAuto);
    REQUIRE(md.precision == Precision::kFloat32);
  }
  SECTION("default preference follows torch_dtype") {
    j["torch_dtype"] = "float16";
    REQUIRE(ParseModelConfig(j.dump()).precision == Precision::kFloat16);
  }
  SECTION("explicit preference overrides torch_dtype") {
    auto md = ParseModelConfig(j.dump(), PrecisionPreference::kFloat16);
    REQUIRE(md.precision == Precision::kFloat16);
  }
}

TEST_CASE("ParseModelConfig rejects bad input", "[model_config]") {
  REQUIRE_FALSE(ParseModelConfig("{ not valid json !!!").valid);
  REQUIRE_FALSE(ParseModelConfig("[1, 2, 3]").valid);

  auto no_eos = Phi3Config();
  no_eos.erase("eos_token_id");
  REQUIRE_FALSE(ParseModelConfig(no_eos.dump()).valid);

  auto no_layers = Phi3Config();
  no_layers.erase("num_hidden_layers");
  REQUIRE_FALSE(ParseModelConfig(no_layers.dump()).valid);
}

TEST_CASE("ParsePrecisionPreference", "[model_config]") {
  PrecisionPreference p = PrecisionPreference::kFloat32;
  REQUIRE(ParsePrecisionPreference("AUTO", p));
  REQUIRE(p == PrecisionPreference::kAuto);
  REQUIRE(ParsePrecisionPreference("fp16", p));
  REQUIRE(p == PrecisionPreference::kFloat16);
  REQUIRE_FALSE(ParsePrecisionPreference("int8", p));
  REQUIRE(p == PrecisionPreference::kFloat16);
}

TEST_CASE("ParseModelConfigFile missing file returns invalid",
          "[model_config]") {
  auto md = ParseModelConfigFile("/tmp/decodeflux_nonexistent_config.json");
  REQUIRE_FALSE(md.valid);
}

// ---------------------------------------------------------------------------
// LocalModelSource
// ---------------------------------------------------------------------------

TEST_CASE("LocalModelSource resolves files under the root", "[model_source]") {
  const auto root = fs::temp_directory_path() / "dfx_model_source";
  fs::remove_all(root);
  fs::create_directories(root / "acme" / "tiny" / "onnx");
  {
    std::ofstream f(root / "acme" / "tiny" / "config.json");
    f << Phi3Config().dump();
  }

  LocalModelSource source(root);
  auto path = source.Resolve("acme/tiny", "config.json");
  REQUIRE(path == root / "acme" / "tiny" / "config.json");
  REQUIRE(ParseModelConfig(source.ReadText(path)).valid);

  REQUIRE_THROWS_AS(source.Resolve("acme/tiny", "onnx/model.onnx"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(source.Resolve("../etc", "config.json"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(source.Resolve("acme/tiny", "/etc/passwd"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(source.ReadText(root / "missing.json"),
                    std::runtime_error);
  fs::remove_all(root);
}

TEST_CASE("IsSafeRelativePath", "[model_source]") {
  REQUIRE(IsSafeRelativePath("microsoft/Phi-3-mini-4k-instruct-onnx-web"));
  REQUIRE(IsSafeRelativePath("onnx/model.onnx"));
  REQUIRE_FALSE(IsSafeRelativePath(""));
  REQUIRE_FALSE(IsSafeRelativePath("/abs/path"));
  REQUIRE_FALSE(IsSafeRelativePath("a/../../b"));
}
