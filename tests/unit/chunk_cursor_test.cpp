#include <catch2/catch_all.hpp>
#include <sqvec/chunk/chunk_cursor.hpp>
#include <sqvec/chunk/chunk_plan.hpp>

#include "tests/support/test_collaborators.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace sqvec::chunk;
using sqvec::core::error_code;

namespace {

auto drain(ChunkCursor& cur) -> std::vector<std::pair<std::string, std::int64_t>> {
  std::vector<std::pair<std::string, std::int64_t>> rows;
  while (!cur.at_end()) {
    auto v = cur.column(COLUMN_VALUE);
    auto i = cur.column(COLUMN_CHUNK_INDEX);
    REQUIRE(v.has_value());
    REQUIRE(i.has_value());
    rows.emplace_back(std::string(std::get<std::string_view>(*v)), std::get<std::int64_t>(*i));
    REQUIRE(cur.next().has_value());
  }
  return rows;
}

} // namespace

TEST_CASE("cursor yields one row per chunk in order", "[chunk][cursor]") {
  ChunkCursor cur(sqvec::test::whitespace_chunker());
  REQUIRE(cur.state() == CursorState::created);
  REQUIRE(cur.open(std::string_view("abc def")).has_value());
  REQUIRE(cur.state() == CursorState::filtered);
  REQUIRE(*cur.row_id() == 0);

  const auto rows = drain(cur);
  REQUIRE(rows.size() == 2);
  REQUIRE(rows[0] == std::pair<std::string, std::int64_t>{"abc", 0});
  REQUIRE(rows[1] == std::pair<std::string, std::int64_t>{"def", 1});
  REQUIRE(cur.state() == CursorState::exhausted);
}

TEST_CASE("cursor state moves through iterating", "[chunk][cursor]") {
  ChunkCursor cur(sqvec::test::whitespace_chunker());
  REQUIRE(cur.open(std::string_view("a b c")).has_value());
  REQUIRE(cur.next().has_value());
  REQUIRE(cur.state() == CursorState::iterating);
  REQUIRE(*cur.row_id() == 1);
  REQUIRE(cur.next().has_value());
  REQUIRE(cur.next().has_value());
  REQUIRE(cur.state() == CursorState::exhausted);
  REQUIRE(cur.at_end());

  auto past = cur.next();
  REQUIRE_FALSE(past.has_value());
  REQUIRE(past.error().code == error_code::precondition_failed);
  REQUIRE(cur.column(COLUMN_VALUE).error().code == error_code::precondition_failed);
  REQUIRE(cur.row_id().error().code == error_code::precondition_failed);
}

TEST_CASE("null text yields zero rows", "[chunk][cursor]") {
  auto counting = std::make_shared<sqvec::test::CountingChunker>();
  ChunkCursor cur(counting);
  REQUIRE(cur.open(std::nullopt).has_value());
  REQUIRE(cur.at_end());
  REQUIRE(cur.state() == CursorState::exhausted);
  REQUIRE(counting->calls == 0);
  auto text = cur.column(COLUMN_TEXT);
  REQUIRE(text.has_value());
  REQUIRE(std::holds_alternative<std::monostate>(*text));
}

TEST_CASE("empty chunk list is immediately exhausted", "[chunk][cursor]") {
  ChunkCursor cur(sqvec::test::whitespace_chunker());
  REQUIRE(cur.open(std::string_view("   ")).has_value());
  REQUIRE(cur.at_end());
  REQUIRE(cur.size() == 0);
  REQUIRE(cur.state() == CursorState::exhausted);
}

TEST_CASE("open without a chunker is config_invalid", "[chunk][cursor]") {
  ChunkCursor cur(nullptr);
  auto r = cur.open(std::string_view("abc"));
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == error_code::config_invalid);
  REQUIRE(r.error().message == "no chunker configured");
}

TEST_CASE("chunker failure is chunker_failed and keeps no rows", "[chunk][cursor]") {
  ChunkCursor cur(sqvec::test::failing_chunker("tokenizer unavailable"));
  auto r = cur.open(std::string_view("abc"));
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == error_code::chunker_failed);
  REQUIRE(r.error().message == "tokenizer unavailable");
  REQUIRE(cur.state() == CursorState::created);
  REQUIRE(cur.at_end());
  REQUIRE(cur.column(COLUMN_TEXT).error().code == error_code::precondition_failed);
}

TEST_CASE("chunker runs once per open and reopen restarts", "[chunk][cursor]") {
  auto counting = std::make_shared<sqvec::test::CountingChunker>();
  ChunkCursor cur(counting);
  REQUIRE(cur.open(std::string_view("one two three")).has_value());
  REQUIRE(counting->calls == 1);
  (void)drain(cur);
  REQUIRE(counting->calls == 1);

  REQUIRE(cur.open(std::string_view("four five")).has_value());
  REQUIRE(counting->calls == 2);
  REQUIRE(cur.state() == CursorState::filtered);
  const auto rows = drain(cur);
  REQUIRE(rows.size() == 2);
  REQUIRE(rows[0].first == "four");
  REQUIRE(rows[0].second == 0);
}

TEST_CASE("hidden text column echoes the source text", "[chunk][cursor]") {
  ChunkCursor cur(sqvec::test::whitespace_chunker());
  REQUIRE(cur.column(COLUMN_TEXT).error().code == error_code::precondition_failed);
  REQUIRE(cur.open(std::string_view("abc def")).has_value());
  REQUIRE(std::get<std::string_view>(*cur.column(COLUMN_TEXT)) == "abc def");
  (void)drain(cur);
  REQUIRE(std::get<std::string_view>(*cur.column(COLUMN_TEXT)) == "abc def");
  REQUIRE(cur.column(7).error().code == error_code::invalid_argument);
}

TEST_CASE("close is terminal and idempotent", "[chunk][cursor]") {
  ChunkCursor cur(sqvec::test::whitespace_chunker());
  REQUIRE(cur.open(std::string_view("abc def")).has_value());
  cur.close();
  REQUIRE(cur.state() == CursorState::closed);
  REQUIRE(cur.size() == 0);
  cur.close();
  REQUIRE(cur.state() == CursorState::closed);

  auto r = cur.open(std::string_view("abc"));
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == error_code::precondition_failed);
  REQUIRE(cur.next().error().code == error_code::precondition_failed);
}
