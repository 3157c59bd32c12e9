#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <trainlog/model/evaluator.hpp>

namespace trainlog {
namespace {

std::vector<SetEntry> repeat(size_t count, uint32_t reps, double amount) {
    return std::vector<SetEntry>(count, SetEntry(reps, Weight(amount)));
}

std::vector<SetEntry> concat(std::vector<SetEntry> lhs,
                             const std::vector<SetEntry>& rhs) {
    lhs.insert(lhs.end(), rhs.begin(), rhs.end());
    return lhs;
}

TEST(EvaluateTest, BareCountTakesAmbientWeight) {
    SetExprPool pool;
    const Weight ambient(42.5);
    EXPECT_EQ(evaluate(*pool.bare_count(8), &ambient), repeat(1, 8, 42.5));
}

TEST(EvaluateTest, BareCountDefaultsToZeroWeight) {
    SetExprPool pool;
    EXPECT_EQ(evaluate(*pool.bare_count(8)), repeat(1, 8, 0));
}

TEST(EvaluateTest, CountByCountRepeatsAmbientWeight) {
    SetExprPool pool;
    const Weight ambient(60);
    EXPECT_EQ(evaluate(*pool.count_by_count(3, 10), &ambient),
              repeat(3, 10, 60));
}

TEST(EvaluateTest, WholeSetIgnoresAmbientWeight) {
    SetExprPool pool;
    const Weight ambient(10);
    const auto sets = evaluate(*pool.whole_set(4, 5, 75), &ambient);
    EXPECT_EQ(sets.size(), 4u);
    EXPECT_EQ(sets, repeat(4, 5, 75));
}

TEST(EvaluateTest, FixedRepsMultiWeightKeepsOrder) {
    SetExprPool pool;
    const auto sets =
        evaluate(*pool.fixed_reps_multi_weight(10, {60, 80, 70}));
    const std::vector<SetEntry> expected = {SetEntry(10, Weight(60)),
                                            SetEntry(10, Weight(80)),
                                            SetEntry(10, Weight(70))};
    EXPECT_EQ(sets, expected);
}

TEST(EvaluateTest, FixedRepsMultiWeightWithNoWeightsIsEmpty) {
    SetExprPool pool;
    EXPECT_TRUE(evaluate(*pool.fixed_reps_multi_weight(10, {})).empty());
}

TEST(EvaluateTest, WeightScopedReplacesAmbientWeight) {
    SetExprPool pool;
    const Weight ambient(10);
    const SetExpr* expr = pool.weight_scoped(20, pool.count_by_count(2, 5));
    EXPECT_EQ(evaluate(*expr, &ambient), repeat(2, 5, 20));
}

TEST(EvaluateTest, NestedWeightScopeWins) {
    SetExprPool pool;
    const SetExpr* expr = pool.weight_scoped(
        20, pool.combine(pool.bare_count(5),
                         pool.weight_scoped(30, pool.bare_count(3))));
    const std::vector<SetEntry> expected = {SetEntry(5, Weight(20)),
                                            SetEntry(3, Weight(30))};
    EXPECT_EQ(evaluate(*expr), expected);
}

TEST(EvaluateTest, LoneWeightIsOneSetOfOneRep) {
    SetExprPool pool;
    EXPECT_EQ(evaluate(*pool.weight_scoped(20)), repeat(1, 1, 20));
}

TEST(EvaluateTest, CombineConcatenates) {
    SetExprPool pool;
    const Weight ambient(50);
    const SetExpr* lhs = pool.count_by_count(2, 8);
    const SetExpr* rhs = pool.fixed_reps_multi_weight(6, {55, 60});
    EXPECT_EQ(evaluate(*pool.combine(lhs, rhs), &ambient),
              concat(evaluate(*lhs, &ambient), evaluate(*rhs, &ambient)));
}

TEST(EvaluateTest, CombineIsAssociative) {
    SetExprPool pool;
    const SetExpr* a = pool.bare_count(1);
    const SetExpr* b = pool.count_by_count(2, 2);
    const SetExpr* c = pool.whole_set(3, 3, 3);
    EXPECT_EQ(evaluate(*pool.combine(pool.combine(a, b), c)),
              evaluate(*pool.combine(a, pool.combine(b, c))));
}

TEST(EvaluateTest, ScopedBareCountThenCountByCount) {
    SetExprPool pool;
    const SetExpr* expr = pool.weight_scoped(
        10, pool.combine(pool.bare_count(4), pool.count_by_count(4, 5)));
    EXPECT_EQ(evaluate(*expr), concat(repeat(1, 4, 10), repeat(4, 5, 10)));
}

TEST(EvaluateIntoTest, AppendsToExistingSets) {
    SetExprPool pool;
    const Weight ambient(30);
    std::vector<SetEntry> sets = repeat(2, 5, 20);
    evaluate_into(*pool.count_by_count(3, 8), &ambient, sets);
    evaluate_into(*pool.bare_count(12), nullptr, sets);
    EXPECT_EQ(sets,
              concat(concat(repeat(2, 5, 20), repeat(3, 8, 30)),
                     repeat(1, 12, 0)));
}

TEST(EvaluateIntoTest, KeepsEarlierSetsOnError) {
    SetExprPool pool;
    std::vector<SetEntry> sets = repeat(1, 5, 20);
    EXPECT_THROW(evaluate_into(*pool.combine(pool.bare_count(3),
                                             pool.bare_count(0)),
                               nullptr, sets),
                 MalformedSetError);
    ASSERT_FALSE(sets.empty());
    EXPECT_EQ(sets.front(), SetEntry(5, Weight(20)));
}

TEST(EvaluateTest, ZeroRepetitionsAreMalformed) {
    SetExprPool pool;
    EXPECT_THROW(evaluate(*pool.bare_count(0)), MalformedSetError);
    EXPECT_THROW(evaluate(*pool.count_by_count(3, 0)), MalformedSetError);
    EXPECT_THROW(evaluate(*pool.fixed_reps_multi_weight(0, {60})),
                 MalformedSetError);
}

TEST(EvaluateTest, ZeroSetsAreMalformed) {
    SetExprPool pool;
    EXPECT_THROW(evaluate(*pool.count_by_count(0, 5)), MalformedSetError);
    EXPECT_THROW(evaluate(*pool.whole_set(0, 5, 60)), MalformedSetError);
}

TEST(EvaluateTest, RejectsOutOfRangeLiterals) {
    SetExprPool pool;
    EXPECT_THROW(evaluate(*pool.bare_count(-1)), NumericRangeError);
    EXPECT_THROW(evaluate(*pool.bare_count(MAX_REPETITIONS + 1)),
                 NumericRangeError);
    EXPECT_THROW(evaluate(*pool.count_by_count(MAX_SETS + 1, 5)),
                 NumericRangeError);
    EXPECT_THROW(evaluate(*pool.weight_scoped(-5, pool.bare_count(5))),
                 NumericRangeError);
    EXPECT_THROW(evaluate(*pool.whole_set(1, 1, MAX_WEIGHT_AMOUNT * 2)),
                 NumericRangeError);
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_THROW(evaluate(*pool.fixed_reps_multi_weight(5, {60, inf})),
                 NumericRangeError);
    EXPECT_THROW(evaluate(*pool.weight_scoped(std::nan(""))),
                 NumericRangeError);
}

TEST(EvaluateTest, AcceptsLimits) {
    SetExprPool pool;
    const auto sets = evaluate(
        *pool.whole_set(MAX_SETS, MAX_REPETITIONS, MAX_WEIGHT_AMOUNT));
    EXPECT_EQ(sets.size(), static_cast<size_t>(MAX_SETS));
}

TEST(EvaluateTest, ErrorsAreLineErrors) {
    SetExprPool pool;
    EXPECT_THROW(evaluate(*pool.bare_count(0)), LineError);
    EXPECT_THROW(evaluate(*pool.bare_count(-3)), LineError);
}

}  // namespace
}  // namespace trainlog
