#pragma once

#include "sqvec/error.hpp"
#include "sqvec/c/sqvec.h"

namespace sqvec::core {

constexpr sqvec_status_t to_c_status(error_code ec) {
  switch (ec) {
    case error_code::ok: return SQVEC_OK;
    case error_code::config_invalid: return SQVEC_E_CONFIG_INVALID;
    case error_code::format_invalid: return SQVEC_E_FORMAT_INVALID;
    case error_code::dimension_mismatch: return SQVEC_E_DIMENSION_MISMATCH;
    case error_code::precondition_failed: return SQVEC_E_PRECONDITION_FAILED;
    case error_code::chunker_failed: return SQVEC_E_CHUNKER_FAILED;
    case error_code::embedder_failed: return SQVEC_E_EMBEDDER_FAILED;
    case error_code::internal: return SQVEC_E_INTERNAL;
    case error_code::invalid_argument: return SQVEC_E_INVALID_ARGUMENT;
  }
  return SQVEC_E_INTERNAL;
}

constexpr error_code from_c_status(sqvec_status_t st) {
  switch (st) {
    case SQVEC_OK: return error_code::ok;
    case SQVEC_E_CONFIG_INVALID: return error_code::config_invalid;
    case SQVEC_E_FORMAT_INVALID: return error_code::format_invalid;
    case SQVEC_E_DIMENSION_MISMATCH: return error_code::dimension_mismatch;
    case SQVEC_E_PRECONDITION_FAILED: return error_code::precondition_failed;
    case SQVEC_E_CHUNKER_FAILED: return error_code::chunker_failed;
    case SQVEC_E_EMBEDDER_FAILED: return error_code::embedder_failed;
    case SQVEC_E_INTERNAL: return error_code::internal;
    case SQVEC_E_INVALID_ARGUMENT: return error_code::invalid_argument;
    default: return error_code::internal;
  }
}

} // namespace sqvec::core
