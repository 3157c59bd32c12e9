#pragma once

#include <trainlog/model/errors.hpp>
#include <trainlog/model/syntax.hpp>
#include <trainlog/model/weight.hpp>
#include <vector>

namespace trainlog {

// Bounds on literals reaching the evaluator.
static const int64_t MAX_REPETITIONS = 10000;
static const int64_t MAX_SETS = 1000;
static const double MAX_WEIGHT_AMOUNT = 10000.0;

// Flattens a set expression into concrete sets, in notation order.
// Nodes without an explicit weight take the ambient weight, or 0kg when
// ambient is null. WEIGHT_SCOPED replaces the ambient weight for its
// subexpression; COMBINE evaluates both sides under the same ambient weight.
//
// Throws MalformedSetError on zero reps or zero sets, and NumericRangeError
// on negative, non-finite or oversized literals. Pure and reentrant.
std::vector<SetEntry> evaluate(const SetExpr& expr,
                               const Weight* ambient = nullptr);

// Appends the sets of expr to result; see evaluate().
void evaluate_into(const SetExpr& expr, const Weight* ambient,
                   std::vector<SetEntry>& result);

}  // namespace trainlog
