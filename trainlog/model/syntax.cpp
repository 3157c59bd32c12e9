#include <trainlog/model/syntax.hpp>

namespace trainlog {

const char* set_expr_arity_name(SetExpr::Arity arity) {
    static const char* names[] = {
        "BARE_COUNT",    "COUNT_BY_COUNT",          "WHOLE_SET",
        "WEIGHT_SCOPED", "FIXED_REPS_MULTI_WEIGHT", "COMBINE",
    };
    return names[static_cast<size_t>(arity)];
}

std::ostream& operator<<(std::ostream& o, const SetExpr& expr) {
    o << '(' << set_expr_arity_name(expr.arity);
    switch (expr.arity) {
        case SetExpr::BARE_COUNT:
            o << ' ' << expr.reps;
            break;
        case SetExpr::COUNT_BY_COUNT:
            o << ' ' << expr.sets << ' ' << expr.reps;
            break;
        case SetExpr::WHOLE_SET:
            o << ' ' << expr.sets << ' ' << expr.reps << ' ' << expr.amount;
            break;
        case SetExpr::WEIGHT_SCOPED:
            o << ' ' << expr.amount;
            if (expr.arg0) {
                o << ' ' << *expr.arg0;
            }
            break;
        case SetExpr::FIXED_REPS_MULTI_WEIGHT:
            o << ' ' << expr.reps;
            for (double amount : expr.amounts) {
                o << ' ' << amount;
            }
            break;
        case SetExpr::COMBINE:
            o << ' ' << *expr.arg0 << ' ' << *expr.arg1;
            break;
    }
    return o << ')';
}

inline SetExpr& SetExprPool::new_expr(SetExpr::Arity arity) {
    m_nodes.emplace_back(arity);
    return m_nodes.back();
}

const SetExpr* SetExprPool::bare_count(int64_t reps) {
    SetExpr& expr = new_expr(SetExpr::BARE_COUNT);
    expr.reps = reps;
    return &expr;
}

const SetExpr* SetExprPool::count_by_count(int64_t sets, int64_t reps) {
    SetExpr& expr = new_expr(SetExpr::COUNT_BY_COUNT);
    expr.sets = sets;
    expr.reps = reps;
    return &expr;
}

const SetExpr* SetExprPool::whole_set(int64_t sets, int64_t reps,
                                      double amount) {
    SetExpr& expr = new_expr(SetExpr::WHOLE_SET);
    expr.sets = sets;
    expr.reps = reps;
    expr.amount = amount;
    return &expr;
}

const SetExpr* SetExprPool::weight_scoped(double amount,
                                          const SetExpr* inner) {
    SetExpr& expr = new_expr(SetExpr::WEIGHT_SCOPED);
    expr.amount = amount;
    expr.arg0 = inner;
    return &expr;
}

const SetExpr* SetExprPool::fixed_reps_multi_weight(
    int64_t reps, const std::vector<double>& amounts) {
    SetExpr& expr = new_expr(SetExpr::FIXED_REPS_MULTI_WEIGHT);
    expr.reps = reps;
    expr.amounts = amounts;
    return &expr;
}

const SetExpr* SetExprPool::combine(const SetExpr* lhs, const SetExpr* rhs) {
    TRAINLOG_ASSERT(lhs and rhs, "combine of missing subexpression");
    SetExpr& expr = new_expr(SetExpr::COMBINE);
    expr.arg0 = lhs;
    expr.arg1 = rhs;
    return &expr;
}

}  // namespace trainlog
