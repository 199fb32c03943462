#pragma once

/** \file chunk_plan.hpp
 *  \brief Plan selection for the vector_chunk table-valued source.
 *
 * Mirrors the host planner's best-index negotiation: the planner offers candidate
 * constraints, the source answers with the constraints it consumes and a cost.
 *
 * Plans
 * - idx_num 1: an equality constraint on the hidden `text` column is usable; it is
 *   consumed as the first filter argument (omitted from host re-checking).
 *   Cost 1, ~10 rows.
 * - idx_num 0: nothing usable; unconstrained scan, reported as very expensive
 *   (cost 1e12, ~1e6 rows) so the host prefers any alternative.
 */

#include <cstdint>
#include <span>
#include <vector>

namespace sqvec::chunk {

/** \brief Column layout: CREATE TABLE x(value TEXT, chunk_index INTEGER, text TEXT HIDDEN). */
enum ChunkColumn : int {
  COLUMN_VALUE = 0,
  COLUMN_CHUNK_INDEX = 1,
  COLUMN_TEXT = 2,
};

inline constexpr const char* CHUNK_TABLE_DECLARATION =
    "CREATE TABLE x(value TEXT, chunk_index INTEGER, text TEXT HIDDEN)";

/** \brief Constraint operators relevant to planning; everything else maps to other. */
enum class ConstraintOp : std::uint8_t { eq, ne, lt, le, gt, ge, is, is_null, like, other };

/** \brief One candidate constraint offered by the host planner. */
struct IndexConstraint {
  int column{-1};
  ConstraintOp op{ConstraintOp::other};
  bool usable{false};
};

/** \brief How the plan uses a constraint; argv_index is 1-based, 0 = unused. */
struct ConstraintUsage {
  int argv_index{0};
  bool omit{false};
};

struct ChunkPlan {
  int idx_num{0};                        /**< 1 = text argument consumed, 0 = full scan */
  double estimated_cost{1e12};
  std::int64_t estimated_rows{1000000};
  std::vector<ConstraintUsage> usage;    /**< parallel to the offered constraints */
};

inline constexpr int PLAN_FULL_SCAN = 0;
inline constexpr int PLAN_TEXT_ARGUMENT = 1;

/** \brief Choose the plan for the offered constraints. */
auto plan_chunk_query(std::span<const IndexConstraint> constraints) -> ChunkPlan;

} // namespace sqvec::chunk
