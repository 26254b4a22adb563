#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "generation_fakes.h"
#include "runtime/backends/host/host_device_context.h"
#include "runtime/tensors/tensor.h"

#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace decodeflux;
using decodeflux::testing::CountingDeviceContext;

// ---------------------------------------------------------------------------
// float16 conversion
// ---------------------------------------------------------------------------

TEST_CASE("HalfToFloat decodes common values", "[tensor]") {
  REQUIRE(HalfToFloat(0x0000) == 0.0f);
  REQUIRE(HalfToFloat(0x3C00) == 1.0f);
  REQUIRE(HalfToFloat(0xC000) == -2.0f);
  REQUIRE(HalfToFloat(0x3800) == 0.5f);
  REQUIRE(HalfToFloat(0x7BFF) == 65504.0f);
  REQUIRE(HalfToFloat(0x0001) == Catch::Approx(5.9604645e-8f));
  REQUIRE(std::isinf(HalfToFloat(0x7C00)));
  REQUIRE(std::isnan(HalfToFloat(0x7E00)));
}

TEST_CASE("FloatToHalf round-trips representable values", "[tensor]") {
  for (float v : {0.0f, 1.0f, -2.0f, 0.5f, 3.0f, 1024.0f, -0.25f}) {
    REQUIRE(HalfToFloat(FloatToHalf(v)) == v);
  }
  REQUIRE(std::isinf(HalfToFloat(FloatToHalf(1e6f))));
  REQUIRE(std::isnan(HalfToFloat(FloatToHalf(std::nanf("")))));
}

// ---------------------------------------------------------------------------
// Construction and reads
// ---------------------------------------------------------------------------

TEST_CASE("FromInt64 stores shape, dtype and values", "[tensor]") {
  auto t = Tensor::FromInt64(SharedHostContext(), {1, 3}, {5, 6, 7});
  REQUIRE(t.IsOwned());
  REQUIRE(t.dtype() == DataType::kInt64);
  REQUIRE(t.location() == MemoryLocation::kHost);
  REQUIRE(t.shape() == std::vector<int64_t>{1, 3});
  REQUIRE(t.ElementCount() == 3);
  REQUIRE(t.ByteSize() == 24);
  REQUIRE(t.ReadInt64() == std::vector<int64_t>{5, 6, 7});
}

TEST_CASE("FromBytes rejects a size mismatch", "[tensor]") {
  std::vector<float> values{1.0f, 2.0f};
  REQUIRE_THROWS_AS(Tensor::FromBytes(SharedHostContext(), DataType::kFloat32,
                                      {1, 3}, values.data(),
                                      values.size() * sizeof(float)),
                    std::invalid_argument);
}

TEST_CASE("ReadFloats converts float16 storage", "[tensor]") {
  std::vector<uint16_t> halves{FloatToHalf(1.5f), FloatToHalf(-4.0f),
                               FloatToHalf(2.0f)};
  auto t = Tensor::FromBytes(SharedHostContext(), DataType::kFloat16, {1, 1, 3},
                             halves.data(), halves.size() * sizeof(uint16_t));
  auto row = t.ReadFloats(1, 2);
  REQUIRE(row == std::vector<float>{-4.0f, 2.0f});
  REQUIRE_THROWS_AS(t.ReadFloats(2, 2), std::out_of_range);
}

TEST_CASE("ReadFloats rejects int64 tensors", "[tensor]") {
  auto t = Tensor::FromInt64(SharedHostContext(), {2}, {1, 2});
  REQUIRE_THROWS_AS(t.ReadFloats(0, 2), std::invalid_argument);
}

TEST_CASE("Empty requires a zero dimension", "[tensor]") {
  auto t = Tensor::Empty(DataType::kFloat16, {1, 4, 0, 8});
  REQUIRE(t.IsOwned());
  REQUIRE(t.ElementCount() == 0);
  REQUIRE(t.shape()[2] == 0);
  REQUIRE_THROWS_AS(Tensor::Empty(DataType::kFloat32, {1, 2}),
                    std::invalid_argument);
}

// ---------------------------------------------------------------------------
// Ownership states
// ---------------------------------------------------------------------------

TEST_CASE("Release frees a device buffer exactly once", "[tensor]") {
  auto ctx = std::make_shared<CountingDeviceContext>();
  auto t = Tensor::Allocate(ctx, DataType::kFloat32, {2, 2});
  REQUIRE(t.IsDeviceResident());
  REQUIRE(ctx->LiveCount() == 1);

  t.Release();
  REQUIRE(t.state() == Tensor::State::kReleased);
  REQUIRE_FALSE(t.IsDeviceResident());
  REQUIRE(ctx->LiveCount() == 0);
  REQUIRE(ctx->frees == 1);

  SECTION("second release is detected") {
    REQUIRE_THROWS_AS(t.Release(), std::logic_error);
    REQUIRE(ctx->frees == 1);
    REQUIRE(ctx->double_frees == 0);
  }
  SECTION("reads after release are rejected") {
    REQUIRE_THROWS_AS(t.ReadFloats(0, 1), std::logic_error);
  }
}

TEST_CASE("Destructor releases owned tensors", "[tensor]") {
  auto ctx = std::make_shared<CountingDeviceContext>();
  {
    auto t = Tensor::Allocate(ctx, DataType::kInt64, {4});
    REQUIRE(ctx->LiveCount() == 1);
  }
  REQUIRE(ctx->LiveCount() == 0);
  REQUIRE(ctx->frees == 1);
}

TEST_CASE("Moving transfers ownership", "[tensor]") {
  auto ctx = std::make_shared<CountingDeviceContext>();
  auto a = Tensor::Allocate(ctx, DataType::kFloat32, {3});
  Tensor b = std::move(a);

  REQUIRE(a.state() == Tensor::State::kTransferred);
  REQUIRE(b.IsOwned());
  REQUIRE_NOTHROW(a.Release()); // moved-from owns nothing
  REQUIRE(ctx->LiveCount() == 1);

  b.Release();
  REQUIRE(ctx->LiveCount() == 0);
  REQUIRE(ctx->frees == 1);
}

TEST_CASE("Move-assigning into an owned slot releases the occupant",
          "[tensor]") {
  auto ctx = std::make_shared<CountingDeviceContext>();
  Tensor slot = Tensor::FromInt64(ctx, {1, 1}, {1});
  slot = Tensor::FromInt64(ctx, {1, 1}, {2});
  REQUIRE(ctx->allocations == 2);
  REQUIRE(ctx->frees == 1);
  REQUIRE(ctx->LiveCount() == 1);
  REQUIRE(slot.ReadInt64() == std::vector<int64_t>{2});

  slot.Release();
  slot = Tensor::FromInt64(ctx, {1, 1}, {3}); // released slot: nothing to free
  REQUIRE(ctx->frees == 2);
  REQUIRE(ctx->double_frees == 0);
}

TEST_CASE("Default tensor owns nothing", "[tensor]") {
  Tensor t;
  REQUIRE(t.state() == Tensor::State::kTransferred);
  REQUIRE_FALSE(t.IsOwned());
  REQUIRE_NOTHROW(t.Release());
}

TEST_CASE("ShapeString formats dimensions", "[tensor]") {
  REQUIRE(ShapeString({}) == "[]");
  REQUIRE(ShapeString({1, 32, 0, 96}) == "[1, 32, 0, 96]");
}
