#pragma once

/** \file vector_functions.hpp
 *  \brief SQL function semantics, independent of the SQLite binding.
 *
 * Each function validates its input against the session configuration and returns
 * the blob or scalar the SQL function produces. NULL handling stays with the
 * binding: these functions are only called with non-NULL arguments.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string_view>
#include <vector>

#include "sqvec/config.hpp"
#include "sqvec/error.hpp"

namespace sqvec {

using Blob = std::vector<std::uint8_t>;

/** \brief vector_encode: JSON number array -> RawBlob.
 *  invalid_argument on malformed JSON, dimension_mismatch when the count != dim.
 */
auto encode_json(const VectorConfig& config, std::string_view json)
    -> std::expected<Blob, core::error>;

/** \brief vector_distance: squared L2 between two RawBlobs. */
auto raw_distance(const VectorConfig& config,
              std::span<const std::uint8_t> a, std::span<const std::uint8_t> b)
    -> std::expected<double, core::error>;

/** \brief vector_quantize: RawBlob -> QuantizedBlob.
 *  config_invalid without a range, dimension_mismatch when the length != dim * 4.
 *  A QuantizedBlob (dim + 2 bytes) never has the RawBlob length, so it is
 *  rejected by the length check.
 */
auto quantize_raw(const VectorConfig& config, std::span<const std::uint8_t> blob)
    -> std::expected<Blob, core::error>;

/** \brief vector_distance_q: squared L2 between two QuantizedBlobs. */
auto quantized_distance(const VectorConfig& config,
                        std::span<const std::uint8_t> a, std::span<const std::uint8_t> b)
    -> std::expected<double, core::error>;

/** \brief vector_embed: text -> RawBlob through the configured embedder.
 *  config_invalid without an embedder, embedder_failed when it fails,
 *  dimension_mismatch when it returns the wrong length.
 */
auto embed(const VectorConfig& config, std::string_view text)
    -> std::expected<Blob, core::error>;

} // namespace sqvec
