#pragma once

/** \file extension.hpp
 *  \brief Registers the sqvec SQL surface on a SQLite connection.
 *
 * Scalar functions
 *   vector_encode(json)        -> RawBlob
 *   vector_distance(a, b)      -> REAL, squared L2 of two RawBlobs
 *   vector_quantize(blob)      -> QuantizedBlob        (requires a quantization range)
 *   vector_distance_q(a, b)    -> REAL                 (requires a quantization range)
 *   vector_embed(text)         -> RawBlob              (requires an embedder)
 * Table-valued function
 *   vector_chunk(text)         -> rows (value TEXT, chunk_index INTEGER)  (requires a chunker)
 *
 * Every scalar function returns NULL for a NULL argument. Errors abort the statement
 * with the message "<function>: <detail>" (visible through sqlite3_errmsg).
 *
 * The configuration is shared read-only by all functions of the connection and
 * released when the functions are dropped or the connection is closed.
 */

#include <cstddef>
#include <expected>
#include <memory>

#include <sqlite3.h>

#include "sqvec/config.hpp"
#include "sqvec/error.hpp"

namespace sqvec::sqlite {

/** \brief Register all functions using an already validated configuration. */
auto register_functions(sqlite3* db, std::shared_ptr<const VectorConfig> config)
    -> std::expected<void, core::error>;

/** \brief Validate (dim, options) and register all functions.
 *
 * \return config_invalid for an invalid dimension or range (the connection is left
 *         untouched), internal if SQLite rejects a registration. Functions
 *         registered before the rejected one stay on the connection.
 */
auto register_functions(sqlite3* db, std::size_t dim, ExtensionOptions options = {})
    -> std::expected<void, core::error>;

} // namespace sqvec::sqlite
