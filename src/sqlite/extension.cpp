#include "sqvec/sqlite/extension.hpp"
#include "sqvec/vector_functions.hpp"

#include "chunk_vtab.hpp"
#include "value_util.hpp"

#include <exception>
#include <new>
#include <string>
#include <type_traits>
#include <utility>

namespace sqvec::sqlite {

using detail::ConfigHandle;

namespace {

auto config_of(sqlite3_context* ctx) -> const VectorConfig& {
    return **static_cast<ConfigHandle*>(sqlite3_user_data(ctx));
}

// Runs body with exceptions converted to SQL errors; nothing may unwind into SQLite.
template <typename Body>
void guarded(sqlite3_context* ctx, const char* sql_name, Body&& body) {
    try {
        body();
    } catch (const std::bad_alloc&) {
        sqlite3_result_error_nomem(ctx);
    } catch (const std::exception& e) {
        detail::result_error(ctx, sql_name,
                             core::error{core::error_code::internal, e.what(), "sqlite"});
    }
}

void result_blob(sqlite3_context* ctx, const sqvec::Blob& blob) {
    sqlite3_result_blob64(ctx, blob.data(), static_cast<sqlite3_uint64>(blob.size()), SQLITE_TRANSIENT);
}

template <typename T>
void report(sqlite3_context* ctx, const char* sql_name, const std::expected<T, core::error>& r) {
    if (!r) {
        detail::result_error(ctx, sql_name, r.error());
        return;
    }
    if constexpr (std::is_same_v<T, double>) {
        sqlite3_result_double(ctx, *r);
    } else {
        result_blob(ctx, *r);
    }
}

void vector_encode_fn(sqlite3_context* ctx, int /*argc*/, sqlite3_value** argv) {
    if (detail::value_is_null(argv[0])) { sqlite3_result_null(ctx); return; }
    guarded(ctx, "vector_encode", [&] {
        std::string_view json;
        if (!detail::value_text(argv[0], json)) { sqlite3_result_error_nomem(ctx); return; }
        report(ctx, "vector_encode", encode_json(config_of(ctx), json));
    });
}

void vector_distance_fn(sqlite3_context* ctx, int /*argc*/, sqlite3_value** argv) {
    if (detail::value_is_null(argv[0]) || detail::value_is_null(argv[1])) {
        sqlite3_result_null(ctx);
        return;
    }
    guarded(ctx, "vector_distance", [&] {
        report(ctx, "vector_distance",
               raw_distance(config_of(ctx), detail::value_blob(argv[0]), detail::value_blob(argv[1])));
    });
}

void vector_quantize_fn(sqlite3_context* ctx, int /*argc*/, sqlite3_value** argv) {
    if (detail::value_is_null(argv[0])) { sqlite3_result_null(ctx); return; }
    guarded(ctx, "vector_quantize", [&] {
        report(ctx, "vector_quantize", quantize_raw(config_of(ctx), detail::value_blob(argv[0])));
    });
}

void vector_distance_q_fn(sqlite3_context* ctx, int /*argc*/, sqlite3_value** argv) {
    if (detail::value_is_null(argv[0]) || detail::value_is_null(argv[1])) {
        sqlite3_result_null(ctx);
        return;
    }
    guarded(ctx, "vector_distance_q", [&] {
        report(ctx, "vector_distance_q",
               quantized_distance(config_of(ctx), detail::value_blob(argv[0]), detail::value_blob(argv[1])));
    });
}

void vector_embed_fn(sqlite3_context* ctx, int /*argc*/, sqlite3_value** argv) {
    if (detail::value_is_null(argv[0])) { sqlite3_result_null(ctx); return; }
    guarded(ctx, "vector_embed", [&] {
        std::string_view text;
        if (!detail::value_text(argv[0], text)) { sqlite3_result_error_nomem(ctx); return; }
        report(ctx, "vector_embed", embed(config_of(ctx), text));
    });
}

struct ScalarSpec {
    const char* name;
    int nargs;
    bool deterministic;
    void (*fn)(sqlite3_context*, int, sqlite3_value**);
};

constexpr ScalarSpec SCALAR_FUNCTIONS[] = {
    {"vector_encode", 1, true, &vector_encode_fn},
    {"vector_distance", 2, true, &vector_distance_fn},
    {"vector_quantize", 1, true, &vector_quantize_fn},
    {"vector_distance_q", 2, true, &vector_distance_q_fn},
    {"vector_embed", 1, false, &vector_embed_fn},
};

auto registration_error(sqlite3* db, const char* what, int rc) -> core::error {
    return core::error{core::error_code::internal,
        std::string("registering ") + what + " failed: " + sqlite3_errstr(rc)
            + " (" + sqlite3_errmsg(db) + ")",
        "sqlite.register"};
}

} // namespace

auto register_functions(sqlite3* db, std::shared_ptr<const VectorConfig> config)
    -> std::expected<void, core::error> {
    using core::error;
    using core::error_code;
    if (db == nullptr) {
        return std::unexpected(error{error_code::invalid_argument, "null connection", "sqlite.register"});
    }
    if (!config) {
        return std::unexpected(error{error_code::config_invalid, "null configuration", "sqlite.register"});
    }

    for (const auto& f : SCALAR_FUNCTIONS) {
        const int flags = SQLITE_UTF8 | (f.deterministic ? SQLITE_DETERMINISTIC : 0);
        // SQLite owns the handle from here on and frees it through the destructor,
        // including when registration fails.
        auto* handle = new ConfigHandle(config);
        const int rc = sqlite3_create_function_v2(db, f.name, f.nargs, flags, handle,
                                                  f.fn, nullptr, nullptr,
                                                  &detail::destroy_config_handle);
        if (rc != SQLITE_OK) return std::unexpected(registration_error(db, f.name, rc));
    }

    auto* handle = new ConfigHandle(config);
    const int rc = sqlite3_create_module_v2(db, detail::CHUNK_MODULE_NAME, &detail::chunk_module(),
                                            handle, &detail::destroy_config_handle);
    if (rc != SQLITE_OK) return std::unexpected(registration_error(db, detail::CHUNK_MODULE_NAME, rc));

    if (core::debug_enabled()) {
        core::debug_log("sqlite", "registered vector functions dim=" + std::to_string(config->dim())
            + " quantization=" + (config->quant_range() ? "on" : "off")
            + " embedder=" + (config->embedder() ? "on" : "off")
            + " chunker=" + (config->chunker() ? "on" : "off"));
    }
    return {};
}

auto register_functions(sqlite3* db, std::size_t dim, ExtensionOptions options)
    -> std::expected<void, core::error> {
    auto config = VectorConfig::create(dim, std::move(options));
    if (!config) return std::unexpected(config.error());
    return register_functions(db, std::move(*config));
}

} // namespace sqvec::sqlite
