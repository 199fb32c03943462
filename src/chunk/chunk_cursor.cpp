#include "sqvec/chunk/chunk_cursor.hpp"
#include "sqvec/chunk/chunk_plan.hpp"
#include "sqvec/core/diagnostics.hpp"

#include <utility>

namespace sqvec::chunk {

using core::error;
using core::error_code;

ChunkCursor::ChunkCursor(std::shared_ptr<Chunker> chunker)
    : chunker_(std::move(chunker)) {}

void ChunkCursor::reset() noexcept {
    chunks_.clear();
    chunks_.shrink_to_fit();
    text_.reset();
    pos_ = 0;
}

auto ChunkCursor::open(std::optional<std::string_view> text) -> std::expected<void, core::error> {
    if (state_ == CursorState::closed) {
        return std::unexpected(error{error_code::precondition_failed,
            "cursor is closed", "chunk.cursor"});
    }
    if (!chunker_) {
        return std::unexpected(error{error_code::config_invalid,
            "no chunker configured", "chunk.cursor"});
    }
    reset();
    if (!text.has_value()) {
        state_ = CursorState::exhausted;
        return {};
    }

    auto chunks = chunker_->chunk(*text);
    if (!chunks) {
        state_ = CursorState::created;
        return std::unexpected(error{error_code::chunker_failed,
            chunks.error().message,
            chunks.error().component.empty() ? "chunker" : chunks.error().component});
    }
    text_.emplace(*text);
    chunks_ = std::move(*chunks);
    state_ = chunks_.empty() ? CursorState::exhausted : CursorState::filtered;

    if (core::debug_enabled()) {
        core::debug_log("chunk.cursor", "opened text_bytes=" + std::to_string(text->size())
                                         + " chunks=" + std::to_string(chunks_.size()));
    }
    return {};
}

auto ChunkCursor::on_row() const noexcept -> bool {
    return (state_ == CursorState::filtered || state_ == CursorState::iterating)
        && pos_ < chunks_.size();
}

auto ChunkCursor::next() -> std::expected<void, core::error> {
    if (!on_row()) {
        return std::unexpected(error{error_code::precondition_failed,
            "next() called without a current row", "chunk.cursor"});
    }
    ++pos_;
    state_ = pos_ >= chunks_.size() ? CursorState::exhausted : CursorState::iterating;
    return {};
}

auto ChunkCursor::at_end() const noexcept -> bool {
    return pos_ >= chunks_.size();
}

auto ChunkCursor::column(int index) const -> std::expected<ColumnValue, core::error> {
    if (index == COLUMN_TEXT) {
        if (state_ == CursorState::created || state_ == CursorState::closed) {
            return std::unexpected(error{error_code::precondition_failed,
                "cursor is not open", "chunk.cursor"});
        }
        if (!text_) return ColumnValue{};
        return ColumnValue{std::string_view(*text_)};
    }
    if (index != COLUMN_VALUE && index != COLUMN_CHUNK_INDEX) {
        return std::unexpected(error{error_code::invalid_argument,
            "unknown column " + std::to_string(index), "chunk.cursor"});
    }
    if (!on_row()) {
        return std::unexpected(error{error_code::precondition_failed,
            "column read without a current row", "chunk.cursor"});
    }
    if (index == COLUMN_VALUE) return ColumnValue{std::string_view(chunks_[pos_])};
    return ColumnValue{static_cast<std::int64_t>(pos_)};
}

auto ChunkCursor::row_id() const -> std::expected<std::int64_t, core::error> {
    if (!on_row()) {
        return std::unexpected(error{error_code::precondition_failed,
            "rowid read without a current row", "chunk.cursor"});
    }
    return static_cast<std::int64_t>(pos_);
}

void ChunkCursor::close() noexcept {
    reset();
    state_ = CursorState::closed;
}

} // namespace sqvec::chunk
