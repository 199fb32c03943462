#include "sqvec/vector_functions.hpp"
#include "sqvec/codec/blob_codec.hpp"
#include "sqvec/codec/json_array.hpp"
#include "sqvec/distance/distance_engine.hpp"
#include "sqvec/quant/scalar_quantizer.hpp"

#include <limits>
#include <string>

namespace sqvec {

using core::error;
using core::error_code;

namespace {

// double -> float with IEEE overflow semantics (saturate to +/-inf).
inline float narrow_to_float(double v) noexcept {
    constexpr double fmax = static_cast<double>(std::numeric_limits<float>::max());
    if (v > fmax) return std::numeric_limits<float>::infinity();
    if (v < -fmax) return -std::numeric_limits<float>::infinity();
    return static_cast<float>(v);
}

} // namespace

auto encode_json(const VectorConfig& config, std::string_view json)
    -> std::expected<Blob, core::error> {
    auto nums = codec::parse_number_array(json);
    if (!nums) return std::unexpected(nums.error());
    if (nums->size() != config.dim()) {
        return std::unexpected(error{error_code::dimension_mismatch,
            "expected dimension " + std::to_string(config.dim()) + ", got " + std::to_string(nums->size()),
            "functions.encode"});
    }
    std::vector<float> floats(nums->size());
    for (std::size_t i = 0; i < floats.size(); ++i) floats[i] = narrow_to_float((*nums)[i]);
    return codec::encode_raw(floats);
}

auto raw_distance(const VectorConfig& config,
              std::span<const std::uint8_t> a, std::span<const std::uint8_t> b)
    -> std::expected<double, core::error> {
    return distance::distance_raw(a, b, config.dim());
}

auto quantize_raw(const VectorConfig& config, std::span<const std::uint8_t> blob)
    -> std::expected<Blob, core::error> {
    const auto& range = config.quant_range();
    if (!range) {
        return std::unexpected(error{error_code::config_invalid,
            "quantization not configured", "functions.quantize"});
    }
    const std::size_t expected = codec::raw_blob_size(config.dim());
    if (blob.size() != expected) {
        return std::unexpected(error{error_code::dimension_mismatch,
            "expected " + std::to_string(expected) + " bytes (dim=" + std::to_string(config.dim())
                + "), got " + std::to_string(blob.size()),
            "functions.quantize"});
    }
    std::vector<float> floats(config.dim());
    codec::decode_raw_into(blob, floats);
    return quant::quantize(floats, *range);
}

auto quantized_distance(const VectorConfig& config,
                        std::span<const std::uint8_t> a, std::span<const std::uint8_t> b)
    -> std::expected<double, core::error> {
    return distance::distance_quantized(a, b, config.dim(), config.quant_range());
}

auto embed(const VectorConfig& config, std::string_view text)
    -> std::expected<Blob, core::error> {
    const auto& embedder = config.embedder();
    if (!embedder) {
        return std::unexpected(error{error_code::config_invalid,
            "no embedder configured", "functions.embed"});
    }
    auto floats = embedder->embed(text);
    if (!floats) {
        return std::unexpected(error{error_code::embedder_failed,
            floats.error().message,
            floats.error().component.empty() ? "embedder" : floats.error().component});
    }
    if (floats->size() != config.dim()) {
        return std::unexpected(error{error_code::dimension_mismatch,
            "embedder returned dimension " + std::to_string(floats->size())
                + ", expected " + std::to_string(config.dim()),
            "functions.embed"});
    }
    return codec::encode_raw(*floats);
}

} // namespace sqvec
