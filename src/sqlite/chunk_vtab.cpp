#include "chunk_vtab.hpp"
#include "value_util.hpp"

#include "sqvec/chunk/chunk_cursor.hpp"
#include "sqvec/chunk/chunk_plan.hpp"

#include <new>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace sqvec::sqlite::detail {

namespace {

struct ChunkVtab : sqlite3_vtab {
    ConfigHandle config;
};

struct ChunkVtabCursor : sqlite3_vtab_cursor {
    explicit ChunkVtabCursor(std::shared_ptr<Chunker> chunker)
        : sqlite3_vtab_cursor{}, cursor(std::move(chunker)) {}
    chunk::ChunkCursor cursor;
};

auto vtab_of(sqlite3_vtab_cursor* cur) -> sqlite3_vtab* { return cur->pVtab; }
auto cursor_of(sqlite3_vtab_cursor* cur) -> chunk::ChunkCursor& {
    return static_cast<ChunkVtabCursor*>(cur)->cursor;
}

auto to_constraint_op(unsigned char op) noexcept -> chunk::ConstraintOp {
    using chunk::ConstraintOp;
    switch (op) {
        case SQLITE_INDEX_CONSTRAINT_EQ: return ConstraintOp::eq;
        case SQLITE_INDEX_CONSTRAINT_NE: return ConstraintOp::ne;
        case SQLITE_INDEX_CONSTRAINT_LT: return ConstraintOp::lt;
        case SQLITE_INDEX_CONSTRAINT_LE: return ConstraintOp::le;
        case SQLITE_INDEX_CONSTRAINT_GT: return ConstraintOp::gt;
        case SQLITE_INDEX_CONSTRAINT_GE: return ConstraintOp::ge;
        case SQLITE_INDEX_CONSTRAINT_IS: return ConstraintOp::is;
        case SQLITE_INDEX_CONSTRAINT_ISNULL: return ConstraintOp::is_null;
        case SQLITE_INDEX_CONSTRAINT_LIKE: return ConstraintOp::like;
        default: return ConstraintOp::other;
    }
}

int chunk_connect(sqlite3* db, void* aux, int /*argc*/, const char* const* /*argv*/,
                  sqlite3_vtab** out, char** err) {
    const int rc = sqlite3_declare_vtab(db, chunk::CHUNK_TABLE_DECLARATION);
    if (rc != SQLITE_OK) return rc;
    auto* vtab = new (std::nothrow) ChunkVtab();
    if (vtab == nullptr) {
        if (err) *err = sqlite3_mprintf("vector_chunk: out of memory");
        return SQLITE_NOMEM;
    }
    vtab->config = *static_cast<ConfigHandle*>(aux);
    *out = vtab;
    return SQLITE_OK;
}

int chunk_disconnect(sqlite3_vtab* vtab) {
    auto* self = static_cast<ChunkVtab*>(vtab);
    sqlite3_free(self->zErrMsg);
    delete self;
    return SQLITE_OK;
}

int chunk_best_index(sqlite3_vtab* /*vtab*/, sqlite3_index_info* info) {
    try {
        std::vector<chunk::IndexConstraint> offered(static_cast<std::size_t>(info->nConstraint));
        for (int i = 0; i < info->nConstraint; ++i) {
            const auto& c = info->aConstraint[i];
            offered[i] = chunk::IndexConstraint{c.iColumn, to_constraint_op(c.op), c.usable != 0};
        }
        const chunk::ChunkPlan plan = chunk::plan_chunk_query(offered);
        for (int i = 0; i < info->nConstraint; ++i) {
            info->aConstraintUsage[i].argvIndex = plan.usage[i].argv_index;
            info->aConstraintUsage[i].omit = plan.usage[i].omit ? 1 : 0;
        }
        info->idxNum = plan.idx_num;
        info->estimatedCost = plan.estimated_cost;
        info->estimatedRows = plan.estimated_rows;
        return SQLITE_OK;
    } catch (const std::bad_alloc&) {
        return SQLITE_NOMEM;
    }
}

int chunk_open(sqlite3_vtab* vtab, sqlite3_vtab_cursor** out) {
    auto* self = static_cast<ChunkVtab*>(vtab);
    auto* cur = new (std::nothrow) ChunkVtabCursor(self->config->chunker());
    if (cur == nullptr) return SQLITE_NOMEM;
    *out = cur;
    return SQLITE_OK;
}

int chunk_close(sqlite3_vtab_cursor* cur) {
    auto* self = static_cast<ChunkVtabCursor*>(cur);
    self->cursor.close();
    delete self;
    return SQLITE_OK;
}

int chunk_filter(sqlite3_vtab_cursor* cur, int idx_num, const char* /*idx_str*/,
                 int argc, sqlite3_value** argv) {
    std::optional<std::string_view> text;
    if (idx_num == chunk::PLAN_TEXT_ARGUMENT && argc >= 1 && !value_is_null(argv[0])) {
        std::string_view v;
        if (!value_text(argv[0], v)) return SQLITE_NOMEM;
        text = v;
    }
    try {
        auto r = cursor_of(cur).open(text);
        if (!r) {
            set_vtab_error(vtab_of(cur), CHUNK_MODULE_NAME, r.error());
            return SQLITE_ERROR;
        }
        return SQLITE_OK;
    } catch (const std::bad_alloc&) {
        return SQLITE_NOMEM;
    } catch (const std::exception& e) {
        set_vtab_error(vtab_of(cur), CHUNK_MODULE_NAME,
                       core::error{core::error_code::internal, e.what(), "sqlite.chunk"});
        return SQLITE_ERROR;
    }
}

int chunk_next(sqlite3_vtab_cursor* cur) {
    auto r = cursor_of(cur).next();
    if (!r) {
        set_vtab_error(vtab_of(cur), CHUNK_MODULE_NAME, r.error());
        return SQLITE_ERROR;
    }
    return SQLITE_OK;
}

int chunk_eof(sqlite3_vtab_cursor* cur) {
    return cursor_of(cur).at_end() ? 1 : 0;
}

int chunk_column(sqlite3_vtab_cursor* cur, sqlite3_context* ctx, int i) {
    auto v = cursor_of(cur).column(i);
    if (!v) {
        result_error(ctx, CHUNK_MODULE_NAME, v.error());
        return SQLITE_ERROR;
    }
    std::visit([ctx](const auto& x) {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            sqlite3_result_null(ctx);
        } else if constexpr (std::is_same_v<T, std::string_view>) {
            sqlite3_result_text64(ctx, x.data(), static_cast<sqlite3_uint64>(x.size()),
                                  SQLITE_TRANSIENT, SQLITE_UTF8);
        } else {
            sqlite3_result_int64(ctx, static_cast<sqlite3_int64>(x));
        }
    }, *v);
    return SQLITE_OK;
}

int chunk_rowid(sqlite3_vtab_cursor* cur, sqlite3_int64* out) {
    auto id = cursor_of(cur).row_id();
    if (!id) {
        set_vtab_error(vtab_of(cur), CHUNK_MODULE_NAME, id.error());
        return SQLITE_ERROR;
    }
    *out = static_cast<sqlite3_int64>(*id);
    return SQLITE_OK;
}

} // namespace

auto chunk_module() noexcept -> const sqlite3_module& {
    static const sqlite3_module module = [] {
        sqlite3_module m{};
        m.iVersion = 0;
        m.xCreate = nullptr; // eponymous-only: usable as vector_chunk(...) without CREATE VIRTUAL TABLE
        m.xConnect = &chunk_connect;
        m.xBestIndex = &chunk_best_index;
        m.xDisconnect = &chunk_disconnect;
        m.xDestroy = &chunk_disconnect;
        m.xOpen = &chunk_open;
        m.xClose = &chunk_close;
        m.xFilter = &chunk_filter;
        m.xNext = &chunk_next;
        m.xEof = &chunk_eof;
        m.xColumn = &chunk_column;
        m.xRowid = &chunk_rowid;
        return m;
    }();
    return module;
}

} // namespace sqvec::sqlite::detail
