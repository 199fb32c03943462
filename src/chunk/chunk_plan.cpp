#include "sqvec/chunk/chunk_plan.hpp"

namespace sqvec::chunk {

auto plan_chunk_query(std::span<const IndexConstraint> constraints) -> ChunkPlan {
    ChunkPlan plan{};
    plan.idx_num = PLAN_FULL_SCAN;
    plan.estimated_cost = 1e12;
    plan.estimated_rows = 1000000;
    plan.usage.assign(constraints.size(), ConstraintUsage{});

    for (std::size_t i = 0; i < constraints.size(); ++i) {
        const auto& c = constraints[i];
        if (c.column == COLUMN_TEXT && c.op == ConstraintOp::eq && c.usable) {
            plan.usage[i] = ConstraintUsage{1, true};
            plan.idx_num = PLAN_TEXT_ARGUMENT;
            plan.estimated_cost = 1.0;
            plan.estimated_rows = 10;
            break;
        }
    }
    return plan;
}

} // namespace sqvec::chunk
