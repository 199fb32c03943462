#pragma once

/** \file chunk_cursor.hpp
 *  \brief Pull-based cursor exposing an external chunker's output as (value, chunk_index) rows.
 *
 * State machine
 *   Created -> Filtered -> Iterating -> Exhausted, and Closed from any state.
 *   open() is allowed from every state except Closed and restarts iteration.
 *
 * Chunking happens eagerly, once per open(); the cursor then only walks the list.
 * Row identity is the position inside the current open() and is not stable across
 * different source texts.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "sqvec/collaborators.hpp"
#include "sqvec/error.hpp"

namespace sqvec::chunk {

enum class CursorState : std::uint8_t {
  created,    /**< never opened */
  filtered,   /**< opened, positioned on the first row */
  iterating,  /**< advanced at least once, positioned on a row */
  exhausted,  /**< past the last row (or opened with no rows) */
  closed,     /**< chunk list released; terminal */
};

/** \brief SQL-level value of one column: NULL, TEXT or INTEGER. */
using ColumnValue = std::variant<std::monostate, std::string_view, std::int64_t>;

class ChunkCursor {
public:
    explicit ChunkCursor(std::shared_ptr<Chunker> chunker);

    ChunkCursor(const ChunkCursor&) = delete;
    ChunkCursor& operator=(const ChunkCursor&) = delete;
    ChunkCursor(ChunkCursor&&) noexcept = default;
    ChunkCursor& operator=(ChunkCursor&&) noexcept = default;

    /** \brief Run the chunker over text and position on the first row.
     *
     * \return config_invalid without a chunker, chunker_failed when the chunker fails
     *         (no rows are kept), precondition_failed after close(). A null text
     *         yields zero rows.
     */
    auto open(std::optional<std::string_view> text) -> std::expected<void, core::error>;

    /** \brief Advance one row; precondition_failed unless positioned on a row. */
    auto next() -> std::expected<void, core::error>;

    /** \brief True when no row is available at the current position. */
    auto at_end() const noexcept -> bool;

    /** \brief Read a column of the current row (see ChunkColumn).
     *
     * The hidden text column echoes the open() argument (NULL if none) in every
     * opened state; value and chunk_index require a current row.
     */
    auto column(int index) const -> std::expected<ColumnValue, core::error>;

    /** \brief Position of the current row. */
    auto row_id() const -> std::expected<std::int64_t, core::error>;

    /** \brief Release the chunk list. Idempotent. */
    void close() noexcept;

    auto state() const noexcept -> CursorState { return state_; }
    auto size() const noexcept -> std::size_t { return chunks_.size(); }
    auto position() const noexcept -> std::size_t { return pos_; }

private:
    auto on_row() const noexcept -> bool;
    void reset() noexcept;

    std::shared_ptr<Chunker> chunker_;
    std::optional<std::string> text_;
    std::vector<std::string> chunks_;
    std::size_t pos_{0};
    CursorState state_{CursorState::created};
};

} // namespace sqvec::chunk
