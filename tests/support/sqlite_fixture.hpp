#pragma once

// In-memory SQLite connection plus small query helpers for integration tests.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <sqlite3.h>

namespace sqvec::test {

class MemoryDb {
public:
    MemoryDb() {
        if (sqlite3_open(":memory:", &db_) != SQLITE_OK) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }
    ~MemoryDb() { sqlite3_close(db_); }
    MemoryDb(const MemoryDb&) = delete;
    MemoryDb& operator=(const MemoryDb&) = delete;

    sqlite3* get() const noexcept { return db_; }

    /** Runs sql (no result rows expected); returns the SQLite result code. */
    int exec(const std::string& sql) {
        return sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, nullptr);
    }

    std::string errmsg() const { return sqlite3_errmsg(db_); }

private:
    sqlite3* db_{nullptr};
};

/** One cell of a query result, as SQLite reports it. */
struct Cell {
    int type{SQLITE_NULL};
    std::int64_t i{0};
    double d{0.0};
    std::string bytes; // TEXT or BLOB payload
};

struct QueryResult {
    int rc{SQLITE_OK};
    std::string error;
    std::vector<std::vector<Cell>> rows;
};

/** Prepares sql, binds blobs in order, and collects every row. */
inline auto query(sqlite3* db, const std::string& sql,
                  const std::vector<std::vector<std::uint8_t>>& blobs = {}) -> QueryResult {
    QueryResult out;
    sqlite3_stmt* stmt = nullptr;
    out.rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (out.rc != SQLITE_OK) {
        out.error = sqlite3_errmsg(db);
        return out;
    }
    for (std::size_t i = 0; i < blobs.size(); ++i) {
        sqlite3_bind_blob(stmt, static_cast<int>(i + 1), blobs[i].data(),
                          static_cast<int>(blobs[i].size()), SQLITE_TRANSIENT);
    }
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        std::vector<Cell> row;
        for (int c = 0; c < sqlite3_column_count(stmt); ++c) {
            Cell cell;
            cell.type = sqlite3_column_type(stmt, c);
            switch (cell.type) {
                case SQLITE_INTEGER: cell.i = sqlite3_column_int64(stmt, c); break;
                case SQLITE_FLOAT: cell.d = sqlite3_column_double(stmt, c); break;
                case SQLITE_TEXT: {
                    const auto* p = sqlite3_column_text(stmt, c);
                    cell.bytes.assign(reinterpret_cast<const char*>(p),
                                      static_cast<std::size_t>(sqlite3_column_bytes(stmt, c)));
                    break;
                }
                case SQLITE_BLOB: {
                    const auto* p = static_cast<const char*>(sqlite3_column_blob(stmt, c));
                    const int n = sqlite3_column_bytes(stmt, c);
                    if (p != nullptr && n > 0) cell.bytes.assign(p, static_cast<std::size_t>(n));
                    break;
                }
                default: break;
            }
            row.push_back(std::move(cell));
        }
        out.rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) {
        out.rc = rc;
        out.error = sqlite3_errmsg(db);
    }
    sqlite3_finalize(stmt);
    return out;
}

/** Single-value convenience; nullopt on error or no rows. */
inline auto scalar(sqlite3* db, const std::string& sql,
                   const std::vector<std::vector<std::uint8_t>>& blobs = {}) -> std::optional<Cell> {
    auto r = query(db, sql, blobs);
    if (r.rc != SQLITE_OK || r.rows.empty() || r.rows[0].empty()) return std::nullopt;
    return r.rows[0][0];
}

} // namespace sqvec::test
