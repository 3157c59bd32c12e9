#include <cmath>
#include <sstream>
#include <trainlog/model/evaluator.hpp>

namespace trainlog {

namespace {

#define TRAINLOG_THROW(ARG_type, ARG_message) \
    {                                         \
        std::ostringstream message;           \
        message << ARG_message;               \
        throw ARG_type(message.str());        \
    }

uint32_t checked_reps(int64_t reps, const SetExpr& expr) {
    if (unlikely(reps < 0 or reps > MAX_REPETITIONS)) {
        TRAINLOG_THROW(NumericRangeError,
                       "repetitions out of range: " << reps << " in " << expr);
    }
    if (unlikely(reps == 0)) {
        TRAINLOG_THROW(MalformedSetError, "zero repetitions in " << expr);
    }
    return static_cast<uint32_t>(reps);
}

size_t checked_sets(int64_t sets, const SetExpr& expr) {
    if (unlikely(sets < 0 or sets > MAX_SETS)) {
        TRAINLOG_THROW(NumericRangeError,
                       "set count out of range: " << sets << " in " << expr);
    }
    if (unlikely(sets == 0)) {
        TRAINLOG_THROW(MalformedSetError, "zero sets in " << expr);
    }
    return static_cast<size_t>(sets);
}

Weight checked_weight(double amount, const SetExpr& expr) {
    if (unlikely(not std::isfinite(amount) or amount < 0 or
                 amount > MAX_WEIGHT_AMOUNT)) {
        TRAINLOG_THROW(NumericRangeError,
                       "weight out of range: " << amount << " in " << expr);
    }
    return Weight(amount);
}

#undef TRAINLOG_THROW

inline Weight ambient_or_zero(const Weight* ambient) {
    return ambient ? *ambient : Weight();
}

}  // namespace

void evaluate_into(const SetExpr& expr, const Weight* ambient,
                   std::vector<SetEntry>& result) {
    switch (expr.arity) {
        case SetExpr::BARE_COUNT: {
            const uint32_t reps = checked_reps(expr.reps, expr);
            result.push_back(SetEntry(reps, ambient_or_zero(ambient)));
            return;
        }

        case SetExpr::COUNT_BY_COUNT: {
            const size_t sets = checked_sets(expr.sets, expr);
            const uint32_t reps = checked_reps(expr.reps, expr);
            result.insert(result.end(), sets,
                          SetEntry(reps, ambient_or_zero(ambient)));
            return;
        }

        case SetExpr::WHOLE_SET: {
            const size_t sets = checked_sets(expr.sets, expr);
            const uint32_t reps = checked_reps(expr.reps, expr);
            const Weight weight = checked_weight(expr.amount, expr);
            result.insert(result.end(), sets, SetEntry(reps, weight));
            return;
        }

        case SetExpr::WEIGHT_SCOPED: {
            const Weight weight = checked_weight(expr.amount, expr);
            if (expr.arg0) {
                evaluate_into(*expr.arg0, &weight, result);
            } else {
                // A weight with no notation documents one set of unknown reps.
                result.push_back(SetEntry(1, weight));
            }
            return;
        }

        case SetExpr::FIXED_REPS_MULTI_WEIGHT: {
            const uint32_t reps = checked_reps(expr.reps, expr);
            for (double amount : expr.amounts) {
                result.push_back(SetEntry(reps, checked_weight(amount, expr)));
            }
            return;
        }

        case SetExpr::COMBINE: {
            evaluate_into(*expr.arg0, ambient, result);
            evaluate_into(*expr.arg1, ambient, result);
            return;
        }
    }

    TRAINLOG_ERROR("unreachable");
}

std::vector<SetEntry> evaluate(const SetExpr& expr, const Weight* ambient) {
    std::vector<SetEntry> result;
    evaluate_into(expr, ambient, result);
    return result;
}

}  // namespace trainlog
