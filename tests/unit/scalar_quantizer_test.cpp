#include <catch2/catch_all.hpp>
#include <sqvec/quant/scalar_quantizer.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <random>
#include <vector>

using namespace sqvec::quant;
using sqvec::core::error_code;

TEST_CASE("QuantizationRange validation", "[quant]") {
  REQUIRE(QuantizationRange{}.validate().has_value());
  REQUIRE(QuantizationRange{-3.0f, 7.5f}.validate().has_value());

  const QuantizationRange bad[] = {
    {1.0f, 1.0f},
    {2.0f, -2.0f},
    {std::numeric_limits<float>::quiet_NaN(), 1.0f},
    {-1.0f, std::numeric_limits<float>::infinity()},
    {-std::numeric_limits<float>::max(), std::numeric_limits<float>::max()},
  };
  for (const auto& r : bad) {
    auto v = r.validate();
    REQUIRE_FALSE(v.has_value());
    REQUIRE(v.error().code == error_code::config_invalid);
  }
}

TEST_CASE("quantize_value endpoints and midpoint", "[quant]") {
  const QuantizationRange r{};
  REQUIRE(quantize_value(-1.0f, r) == -128);
  REQUIRE(quantize_value(1.0f, r) == 127);
  REQUIRE(quantize_value(0.0f, r) == 0);
}

TEST_CASE("quantize_value rounds exact halves away from zero", "[quant]") {
  // normalized 127.5 -> 128 -> code 0
  REQUIRE(quantize_value(0.0f, QuantizationRange{}) == 0);
  // normalized 0.5 -> 1 -> code -127
  REQUIRE(quantize_value(1.0f / 255.0f, QuantizationRange{0.0f, 2.0f}) == -127);
}

TEST_CASE("quantize_value saturates outside the range", "[quant]") {
  const QuantizationRange r{};
  REQUIRE(quantize_value(5.0f, r) == 127);
  REQUIRE(quantize_value(-5.0f, r) == -128);
  REQUIRE(quantize_value(std::numeric_limits<float>::infinity(), r) == 127);
  REQUIRE(quantize_value(-std::numeric_limits<float>::infinity(), r) == -128);
  REQUIRE(quantize_value(std::numeric_limits<float>::quiet_NaN(), r) == -128);
}

TEST_CASE("dequantize_value inverts the code grid", "[quant]") {
  const QuantizationRange r{};
  REQUIRE(dequantize_value(-128, r) == Catch::Approx(-1.0f));
  REQUIRE(dequantize_value(127, r) == Catch::Approx(1.0f));
  REQUIRE(max_reconstruction_error(r) == Catch::Approx(2.0f / 255.0f));
}

TEST_CASE("quantize produces header plus one code per element", "[quant]") {
  const QuantizationRange r{};
  const float vec[3]{-1.0f, 1.0f, 5.0f};
  const auto blob = quantize(vec, r);
  REQUIRE(blob.size() == 5);
  REQUIRE(blob[0] == 0x00);
  REQUIRE(blob[1] == 0x01);
  REQUIRE(static_cast<std::int8_t>(blob[2]) == -128);
  REQUIRE(static_cast<std::int8_t>(blob[3]) == 127);
  REQUIRE(static_cast<std::int8_t>(blob[4]) == 127);

  const auto empty = quantize(std::span<const float>{}, r);
  REQUIRE(empty == std::vector<std::uint8_t>{0x00, 0x01});
}

TEST_CASE("dequantize validates header and length", "[quant]") {
  const QuantizationRange r{};
  const std::vector<std::uint8_t> ok{0x00, 0x01, 0x00, 0xff};
  auto v = dequantize(ok, r, 2);
  REQUIRE(v.has_value());
  REQUIRE(v->size() == 2);

  auto short_len = dequantize(ok, r, 3);
  REQUIRE_FALSE(short_len.has_value());
  REQUIRE(short_len.error().code == error_code::format_invalid);

  const std::vector<std::uint8_t> no_header{0x01, 0x00, 0x00, 0xff};
  auto bad = dequantize(no_header, r, 2);
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().code == error_code::format_invalid);

  auto tiny = dequantize(std::vector<std::uint8_t>{0x00}, r, 0);
  REQUIRE_FALSE(tiny.has_value());
}

TEST_CASE("reconstruction error stays within (max - min) / 255", "[quant][property]") {
  std::mt19937 rng(1234);
  const QuantizationRange ranges[] = {{-1.0f, 1.0f}, {0.0f, 10.0f}, {-0.25f, 0.75f}};
  for (const auto& r : ranges) {
    std::uniform_real_distribution<float> dist(r.min, r.max);
    std::vector<float> vec(1000);
    for (auto& x : vec) x = dist(rng);
    const auto bound = max_reconstruction_error(r);
    const auto blob = quantize(vec, r);
    auto back = dequantize(blob, r, vec.size());
    REQUIRE(back.has_value());
    for (std::size_t i = 0; i < vec.size(); ++i) {
      REQUIRE(std::fabs((*back)[i] - vec[i]) <= bound * 1.0001f);
    }
  }
}

TEST_CASE("measure_error separates clamped elements", "[quant]") {
  const QuantizationRange r{};
  const float vec[4]{0.5f, -0.5f, 3.0f, -9.0f};
  const auto stats = measure_error(vec, r);
  REQUIRE(stats.in_range == 2);
  REQUIRE(stats.clamped == 2);
  REQUIRE(stats.max_error <= max_reconstruction_error(r) * 1.0001f);
  REQUIRE(stats.mean_squared_error >= 0.0f);
}
