/**
 * Simple nearest-neighbour search over a SQLite table using sqvec
 *
 * This example demonstrates:
 * - Registering the vector functions on a connection
 * - Storing embeddings as RawBlobs with vector_encode
 * - Ranking rows by vector_distance
 * - Comparing against vector_distance_q on quantized copies
 * - Splitting text with vector_chunk
 */

#include <sqvec/sqlite/extension.hpp>

#include <sqlite3.h>

#include <cstdint>
#include <expected>
#include <iostream>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace {

std::string random_json_vector(std::size_t dim, std::uint32_t seed) {
    std::mt19937 gen(seed);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    std::string json = "[";
    for (std::size_t i = 0; i < dim; ++i) {
        if (i) json += ",";
        json += std::to_string(dist(gen));
    }
    return json + "]";
}

bool exec(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::cerr << "SQL error: " << (err ? err : "unknown") << std::endl;
        sqlite3_free(err);
        return false;
    }
    return true;
}

// Prints every row of sql as tab-separated text.
bool print_rows(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "prepare failed: " << sqlite3_errmsg(db) << std::endl;
        return false;
    }
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        for (int c = 0; c < sqlite3_column_count(stmt); ++c) {
            const auto* text = sqlite3_column_text(stmt, c);
            std::cout << (c ? "\t" : "  ") << (text ? reinterpret_cast<const char*>(text) : "NULL");
        }
        std::cout << "\n";
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        std::cerr << "query failed: " << sqlite3_errmsg(db) << std::endl;
        return false;
    }
    return true;
}

} // namespace

int main() {
    constexpr std::size_t dimension = 16;
    constexpr int num_vectors = 200;

    sqlite3* db = nullptr;
    if (sqlite3_open(":memory:", &db) != SQLITE_OK) {
        std::cerr << "Failed to open database: " << sqlite3_errmsg(db) << std::endl;
        sqlite3_close(db);
        return 1;
    }

    sqvec::ExtensionOptions options;
    options.quant_range = sqvec::quant::QuantizationRange{-1.0f, 1.0f};
    options.chunker = sqvec::make_chunker(
        [](std::string_view text) -> std::expected<std::vector<std::string>, sqvec::core::error> {
            std::vector<std::string> out;
            std::size_t start = 0;
            while (start < text.size()) {
                const auto end = text.find('.', start);
                const auto piece = text.substr(start, end == std::string_view::npos ? end : end - start);
                if (!piece.empty()) out.emplace_back(piece);
                if (end == std::string_view::npos) break;
                start = end + 1;
            }
            return out;
        });

    auto registered = sqvec::sqlite::register_functions(db, dimension, std::move(options));
    if (!registered) {
        std::cerr << "Failed to register functions: " << registered.error().message << std::endl;
        sqlite3_close(db);
        return 1;
    }

    bool ok = exec(db, "CREATE TABLE items(id INTEGER PRIMARY KEY, emb BLOB, qemb BLOB)");
    std::cout << "Adding " << num_vectors << " vectors..." << std::endl;
    for (int i = 0; ok && i < num_vectors; ++i) {
        const auto json = random_json_vector(dimension, static_cast<std::uint32_t>(i));
        ok = exec(db, "INSERT INTO items(id, emb) VALUES (" + std::to_string(i)
                          + ", vector_encode('" + json + "'))");
    }
    ok = ok && exec(db, "UPDATE items SET qemb = vector_quantize(emb)");

    const auto query = random_json_vector(dimension, 12345);
    if (ok) {
        std::cout << "Top 5 by exact squared L2:" << std::endl;
        ok = print_rows(db,
            "SELECT id, vector_distance(emb, vector_encode('" + query + "')) AS d"
            " FROM items ORDER BY d LIMIT 5");
    }
    if (ok) {
        std::cout << "Top 5 by quantized squared L2:" << std::endl;
        ok = print_rows(db,
            "SELECT id, vector_distance_q(qemb, vector_quantize(vector_encode('" + query + "'))) AS d"
            " FROM items ORDER BY d LIMIT 5");
    }
    if (ok) {
        std::cout << "Chunks:" << std::endl;
        ok = print_rows(db,
            "SELECT chunk_index, value FROM vector_chunk('First sentence. Second one. Third')");
    }

    sqlite3_close(db);
    return ok ? 0 : 1;
}
