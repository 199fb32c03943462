#pragma once

/** \file blob_codec.hpp
 *  \brief RawBlob encode/decode and QuantizedBlob format discrimination (pure, in-memory).
 *
 * RawBlob:       dim x float32, little-endian IEEE-754, no header (dim*4 bytes).
 * QuantizedBlob: {0x00, 0x01} header, then dim x int8 codes (dim+2 bytes).
 *
 * Endianness: little-endian on all platforms.
 * Thread-safety: functions are stateless and thread-safe.
 * Errors: returned via std::expected with sqvec::core::error.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "sqvec/error.hpp"

namespace sqvec::codec {

constexpr std::uint8_t QUANTIZED_FORMAT_ID = 0x00;
constexpr std::uint8_t QUANTIZED_FORMAT_VERSION = 0x01;
constexpr std::size_t QUANTIZED_HEADER_SIZE = 2;
constexpr std::size_t RAW_ELEMENT_SIZE = 4;

/** \brief Byte length of a RawBlob holding dim elements. */
constexpr auto raw_blob_size(std::size_t dim) noexcept -> std::size_t {
  return dim * RAW_ELEMENT_SIZE;
}

/** \brief Byte length of a QuantizedBlob holding dim codes. */
constexpr auto quantized_blob_size(std::size_t dim) noexcept -> std::size_t {
  return dim + QUANTIZED_HEADER_SIZE;
}

/** \brief Encode floats as consecutive little-endian float32 bit patterns. Never fails. */
auto encode_raw(std::span<const float> vec) -> std::vector<std::uint8_t>;

/** \brief Decode a RawBlob; format_invalid if the length is not a multiple of 4. */
auto decode_raw(std::span<const std::uint8_t> bytes)
    -> std::expected<std::vector<float>, core::error>;

/** \brief Decode into a caller-provided buffer of exactly bytes.size()/4 floats. */
void decode_raw_into(std::span<const std::uint8_t> bytes, std::span<float> out) noexcept;

/** \brief True iff bytes start with the QuantizedBlob header {0x00, 0x01}. */
auto is_quantized_format(std::span<const std::uint8_t> bytes) noexcept -> bool;

} // namespace sqvec::codec
