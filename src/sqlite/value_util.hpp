#pragma once

// Internal helpers shared by the scalar functions and the vector_chunk module.

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

#include <sqlite3.h>

#include "sqvec/config.hpp"
#include "sqvec/core/diagnostics.hpp"
#include "sqvec/error.hpp"

namespace sqvec::sqlite::detail {

using ConfigHandle = std::shared_ptr<const VectorConfig>;

inline void destroy_config_handle(void* p) {
    delete static_cast<ConfigHandle*>(p);
}

inline auto value_is_null(sqlite3_value* v) noexcept -> bool {
    return sqlite3_value_type(v) == SQLITE_NULL;
}

// Text must be fetched before its byte count (sqlite3_value_bytes after the conversion).
inline auto value_text(sqlite3_value* v, std::string_view& out) noexcept -> bool {
    const unsigned char* p = sqlite3_value_text(v);
    const int n = sqlite3_value_bytes(v);
    if (p == nullptr) {
        if (n != 0) return false; // conversion ran out of memory
        out = std::string_view{};
        return true;
    }
    out = std::string_view(reinterpret_cast<const char*>(p), static_cast<std::size_t>(n));
    return true;
}

// A zero-length blob comes back as a null pointer; report it as an empty span.
inline auto value_blob(sqlite3_value* v) noexcept -> std::span<const std::uint8_t> {
    const void* p = sqlite3_value_blob(v);
    const int n = sqlite3_value_bytes(v);
    if (p == nullptr || n <= 0) return {};
    return {static_cast<const std::uint8_t*>(p), static_cast<std::size_t>(n)};
}

inline auto error_message(std::string_view sql_name, const core::error& err) -> std::string {
    std::string msg;
    msg.reserve(sql_name.size() + 2 + err.message.size());
    msg.append(sql_name).append(": ").append(err.message);
    return msg;
}

inline void result_error(sqlite3_context* ctx, std::string_view sql_name, const core::error& err) {
    core::debug_log_error(sql_name, err);
    const std::string msg = error_message(sql_name, err);
    sqlite3_result_error(ctx, msg.c_str(), static_cast<int>(msg.size()));
}

// Replace any previous virtual-table error message.
inline void set_vtab_error(sqlite3_vtab* vtab, std::string_view sql_name, const core::error& err) {
    core::debug_log_error(sql_name, err);
    const std::string msg = error_message(sql_name, err);
    sqlite3_free(vtab->zErrMsg);
    vtab->zErrMsg = sqlite3_mprintf("%s", msg.c_str());
}

} // namespace sqvec::sqlite::detail
