// Syntax of set notation.
//
// Design decisions:
// - One node type tagged by arity; evaluation switches on the arity.
// - Literals are kept as written so the evaluator can range-check them.
// - Nodes are owned by a SetExprPool and never freed before the pool.
// - Only WEIGHT_SCOPED and COMBINE have subexpressions.

#pragma once

#include <stdint.h>
#include <deque>
#include <ostream>
#include <trainlog/util/util.hpp>
#include <vector>

namespace trainlog {

struct SetExpr {
    enum Arity {
        BARE_COUNT,               // reps
        COUNT_BY_COUNT,           // sets x reps
        WHOLE_SET,                // sets x reps x amount
        WEIGHT_SCOPED,            // amount [: arg0]
        FIXED_REPS_MULTI_WEIGHT,  // reps xx amounts...
        COMBINE                   // arg0, arg1
    };

    Arity arity;
    int64_t sets;
    int64_t reps;
    double amount;
    std::vector<double> amounts;
    const SetExpr* arg0;
    const SetExpr* arg1;

    explicit SetExpr(Arity a)
        : arity(a),
          sets(0),
          reps(0),
          amount(0),
          amounts(),
          arg0(nullptr),
          arg1(nullptr) {}
};

const char* set_expr_arity_name(SetExpr::Arity arity);

// Prints a node as an s-expression, e.g. (COMBINE (BARE_COUNT 4) ...).
std::ostream& operator<<(std::ostream& o, const SetExpr& expr);

class SetExprPool : noncopyable {
   public:
    const SetExpr* bare_count(int64_t reps);
    const SetExpr* count_by_count(int64_t sets, int64_t reps);
    const SetExpr* whole_set(int64_t sets, int64_t reps, double amount);
    const SetExpr* weight_scoped(double amount, const SetExpr* inner = nullptr);
    const SetExpr* fixed_reps_multi_weight(int64_t reps,
                                           const std::vector<double>& amounts);
    const SetExpr* combine(const SetExpr* lhs, const SetExpr* rhs);

    size_t size() const { return m_nodes.size(); }

   private:
    SetExpr& new_expr(SetExpr::Arity arity);

    // deque keeps node addresses stable as the pool grows.
    std::deque<SetExpr> m_nodes;
};

}  // namespace trainlog
