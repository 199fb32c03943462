#pragma once

/** \file distance_engine.hpp
 *  \brief Squared L2 over RawBlobs or QuantizedBlobs, gated by format and dimension checks.
 *
 * Check order is fixed: configuration, then format, then dimension; argument a is
 * checked before argument b. Cross-format input is rejected, never coerced.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>

#include "sqvec/error.hpp"
#include "sqvec/quant/scalar_quantizer.hpp"

namespace sqvec::distance {

/** \brief Squared L2 of two equal-length vectors; dimension_mismatch otherwise. */
auto squared_l2(std::span<const float> a, std::span<const float> b)
    -> std::expected<double, core::error>;

/** \brief Squared L2 between two RawBlobs of the given dimension.
 *
 * \return format_invalid if either blob carries the quantized header,
 *         dimension_mismatch if either length != dim * 4.
 */
auto distance_raw(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b,
                  std::size_t dim) -> std::expected<double, core::error>;

/** \brief Squared L2 between two QuantizedBlobs after dequantization.
 *
 * \return config_invalid if no range is configured, format_invalid if either blob
 *         lacks the quantized header, dimension_mismatch if either length != dim + 2.
 */
auto distance_quantized(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b,
                        std::size_t dim,
                        const std::optional<quant::QuantizationRange>& range)
    -> std::expected<double, core::error>;

} // namespace sqvec::distance
