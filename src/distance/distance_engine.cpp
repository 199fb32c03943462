#include "sqvec/distance/distance_engine.hpp"
#include "sqvec/codec/blob_codec.hpp"
#include "sqvec/kernels/distance.hpp"

#include <string>
#include <vector>

namespace sqvec::distance {

using core::error;
using core::error_code;

namespace {

auto length_error(char arg, std::size_t expected, std::size_t dim, std::size_t got) -> error {
    return error{error_code::dimension_mismatch,
        std::string("input ") + arg + ": expected " + std::to_string(expected)
            + " bytes (dim=" + std::to_string(dim) + "), got " + std::to_string(got),
        "distance"};
}

} // namespace

auto squared_l2(std::span<const float> a, std::span<const float> b)
    -> std::expected<double, core::error> {
    if (a.size() != b.size()) {
        return std::unexpected(error{error_code::dimension_mismatch,
            "vector lengths differ: " + std::to_string(a.size()) + " vs " + std::to_string(b.size()),
            "distance"});
    }
    return kernels::l2_sq_f64(a, b);
}

auto distance_raw(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b,
                  std::size_t dim) -> std::expected<double, core::error> {
    if (codec::is_quantized_format(a) || codec::is_quantized_format(b)) {
        return std::unexpected(error{error_code::format_invalid,
            "input is quantized, use vector_distance_q", "distance"});
    }
    const std::size_t expected = codec::raw_blob_size(dim);
    if (a.size() != expected) return std::unexpected(length_error('a', expected, dim, a.size()));
    if (b.size() != expected) return std::unexpected(length_error('b', expected, dim, b.size()));

    std::vector<float> va(dim), vb(dim);
    codec::decode_raw_into(a, va);
    codec::decode_raw_into(b, vb);
    return kernels::l2_sq_f64(va, vb);
}

auto distance_quantized(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b,
                        std::size_t dim,
                        const std::optional<quant::QuantizationRange>& range)
    -> std::expected<double, core::error> {
    if (!range.has_value()) {
        return std::unexpected(error{error_code::config_invalid,
            "quantization not configured", "distance"});
    }
    if (!codec::is_quantized_format(a)) {
        return std::unexpected(error{error_code::format_invalid,
            "input a is not quantized (missing magic bytes)", "distance"});
    }
    if (!codec::is_quantized_format(b)) {
        return std::unexpected(error{error_code::format_invalid,
            "input b is not quantized (missing magic bytes)", "distance"});
    }
    const std::size_t expected = codec::quantized_blob_size(dim);
    if (a.size() != expected) return std::unexpected(length_error('a', expected, dim, a.size()));
    if (b.size() != expected) return std::unexpected(length_error('b', expected, dim, b.size()));

    auto va = quant::dequantize(a, *range, dim);
    if (!va) return std::unexpected(va.error());
    auto vb = quant::dequantize(b, *range, dim);
    if (!vb) return std::unexpected(vb.error());
    return kernels::l2_sq_f64(*va, *vb);
}

} // namespace sqvec::distance
