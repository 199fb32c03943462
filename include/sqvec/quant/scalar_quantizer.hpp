#pragma once

/** \file scalar_quantizer.hpp
 *  \brief Affine scalar quantization between a float range and signed 8-bit codes.
 *
 * Mapping (per element v, range [min, max]):
 *   code = clamp(round((v - min) / (max - min) * 255) - 128, -128, 127)
 *   v'   = (code + 128) / 255 * (max - min) + min
 *
 * Rounding is half away from zero (std::round). Out-of-range and infinite inputs
 * saturate silently; NaN saturates to -128. The reconstruction error of in-range
 * elements is bounded by (max - min) / 255.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "sqvec/error.hpp"

namespace sqvec::quant {

constexpr int CODE_MIN = -128;
constexpr int CODE_MAX = 127;
constexpr float CODE_LEVELS = 255.0f;

/** \brief Session-wide quantization range. */
struct QuantizationRange {
  float min{-1.0f};
  float max{1.0f};

  /** \brief config_invalid unless both bounds and max - min are finite and max > min. */
  auto validate() const -> std::expected<void, core::error>;

  auto span() const noexcept -> float { return max - min; }
};

/** \brief Reconstruction quality of one quantize/dequantize round trip. */
struct QuantizationStats {
  float max_error{0.0f};            /**< max |v' - v| over in-range elements */
  float mean_squared_error{0.0f};   /**< mean (v' - v)^2 over in-range elements */
  std::size_t in_range{0};          /**< elements with min <= v <= max */
  std::size_t clamped{0};           /**< elements outside [min, max], saturated */
};

/** \brief Code for a single element. */
auto quantize_value(float v, const QuantizationRange& range) noexcept -> std::int8_t;

/** \brief Value reconstructed from a single code. */
auto dequantize_value(std::int8_t code, const QuantizationRange& range) noexcept -> float;

/** \brief Quantize a vector into a QuantizedBlob (header + one code per element).
 *
 * Never fails; the caller checks vec.size() against the session dimension.
 */
auto quantize(std::span<const float> vec, const QuantizationRange& range)
    -> std::vector<std::uint8_t>;

/** \brief Reconstruct a vector from a QuantizedBlob.
 *
 * \return format_invalid if the header is not {0x00, 0x01} or the payload does not
 *         hold exactly dim codes.
 */
auto dequantize(std::span<const std::uint8_t> blob, const QuantizationRange& range,
                std::size_t dim) -> std::expected<std::vector<float>, core::error>;

/** \brief Upper bound of |v' - v| for in-range inputs: (max - min) / 255. */
auto max_reconstruction_error(const QuantizationRange& range) noexcept -> float;

/** \brief Quantize then dequantize vec and report the observed error. */
auto measure_error(std::span<const float> vec, const QuantizationRange& range)
    -> QuantizationStats;

} // namespace sqvec::quant
