#include "sqvec/quant/scalar_quantizer.hpp"
#include "sqvec/codec/blob_codec.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace sqvec::quant {

auto QuantizationRange::validate() const -> std::expected<void, core::error> {
    using core::error;
    using core::error_code;
    if (!std::isfinite(min) || !std::isfinite(max)) {
        return std::unexpected(error{error_code::config_invalid,
            "quantization range bounds must be finite", "quant.range"});
    }
    if (!(max > min)) {
        return std::unexpected(error{error_code::config_invalid,
            "quantization range requires max > min, got min=" + std::to_string(min)
                + " max=" + std::to_string(max),
            "quant.range"});
    }
    if (!std::isfinite(max - min)) {
        return std::unexpected(error{error_code::config_invalid,
            "quantization range width overflows float", "quant.range"});
    }
    return {};
}

auto quantize_value(float v, const QuantizationRange& range) noexcept -> std::int8_t {
    // normalized is computed in float; rounding happens in double
    const float normalized = (v - range.min) / range.span() * CODE_LEVELS;
    if (std::isnan(normalized)) return static_cast<std::int8_t>(CODE_MIN);
    const double q = std::round(static_cast<double>(normalized)) - 128.0;
    if (q < CODE_MIN) return static_cast<std::int8_t>(CODE_MIN);
    if (q > CODE_MAX) return static_cast<std::int8_t>(CODE_MAX);
    return static_cast<std::int8_t>(q);
}

auto dequantize_value(std::int8_t code, const QuantizationRange& range) noexcept -> float {
    const double r = static_cast<double>(range.span());
    return static_cast<float>((static_cast<double>(code) + 128.0) / 255.0 * r
                              + static_cast<double>(range.min));
}

auto quantize(std::span<const float> vec, const QuantizationRange& range)
    -> std::vector<std::uint8_t> {
    std::vector<std::uint8_t> out(codec::quantized_blob_size(vec.size()));
    out[0] = codec::QUANTIZED_FORMAT_ID;
    out[1] = codec::QUANTIZED_FORMAT_VERSION;
    std::uint8_t* p = out.data() + codec::QUANTIZED_HEADER_SIZE;
    for (const float f : vec) {
        *p++ = static_cast<std::uint8_t>(quantize_value(f, range));
    }
    return out;
}

auto dequantize(std::span<const std::uint8_t> blob, const QuantizationRange& range,
                std::size_t dim) -> std::expected<std::vector<float>, core::error> {
    using core::error;
    using core::error_code;
    if (!codec::is_quantized_format(blob)) {
        return std::unexpected(error{error_code::format_invalid,
            "missing quantized format magic bytes", "quant.scalar"});
    }
    const auto codes = blob.subspan(codec::QUANTIZED_HEADER_SIZE);
    if (codes.size() != dim) {
        return std::unexpected(error{error_code::format_invalid,
            "quantized payload holds " + std::to_string(codes.size())
                + " codes, expected " + std::to_string(dim),
            "quant.scalar"});
    }
    std::vector<float> out(dim);
    for (std::size_t i = 0; i < dim; ++i) {
        out[i] = dequantize_value(static_cast<std::int8_t>(codes[i]), range);
    }
    return out;
}

auto max_reconstruction_error(const QuantizationRange& range) noexcept -> float {
    return range.span() / CODE_LEVELS;
}

auto measure_error(std::span<const float> vec, const QuantizationRange& range)
    -> QuantizationStats {
    QuantizationStats st{};
    double sq_sum = 0.0;
    for (const float v : vec) {
        const std::int8_t code = quantize_value(v, range);
        if (!(v >= range.min && v <= range.max)) {
            ++st.clamped;
            continue;
        }
        const float err = std::fabs(dequantize_value(code, range) - v);
        st.max_error = std::max(st.max_error, err);
        sq_sum += static_cast<double>(err) * static_cast<double>(err);
        ++st.in_range;
    }
    if (st.in_range > 0) {
        st.mean_squared_error = static_cast<float>(sq_sum / static_cast<double>(st.in_range));
    }
    return st;
}

} // namespace sqvec::quant
