#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling; the C ABI mirrors them 1:1.
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <string>

namespace sqvec::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  config_invalid = 2001,      /**< missing collaborator/range, invalid dimension */
  format_invalid = 3001,      /**< blob header or byte length does not match its format */
  dimension_mismatch = 4001,  /**< vector/blob length differs from the session dimension */
  precondition_failed = 4002, /**< illegal cursor transition */
  chunker_failed = 7001,      /**< external chunker reported a failure */
  embedder_failed = 7002,     /**< external embedder reported a failure */
  internal = 9001,
  invalid_argument = 9002,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "codec.blob" */
};

} // namespace sqvec::core
