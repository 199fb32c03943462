#pragma once

// vector_chunk: eponymous-only virtual table driving chunk::ChunkCursor.

#include <sqlite3.h>

namespace sqvec::sqlite::detail {

inline constexpr const char* CHUNK_MODULE_NAME = "vector_chunk";

/** \brief Module vtable; pAux of the registration must be a heap ConfigHandle*. */
auto chunk_module() noexcept -> const sqlite3_module&;

} // namespace sqvec::sqlite::detail
