#include <gtest/gtest.h>
#include <sstream>
#include <trainlog/model/exercise.hpp>

namespace trainlog {
namespace {

TEST(AssembleExerciseTest, StandardizesAndEvaluates) {
    SetExprPool pool;
    NameStandardizer standardizer;
    const SetExpr* root = pool.weight_scoped(
        10, pool.combine(pool.bare_count(4), pool.count_by_count(4, 5)));
    const Exercise exercise = assemble_exercise("bp", *root, standardizer);
    EXPECT_EQ(exercise.name(), "Bench Press");
    ASSERT_EQ(exercise.sets().size(), 5u);
    EXPECT_EQ(exercise.sets()[0], SetEntry(4, Weight(10)));
    for (size_t i = 1; i < 5; ++i) {
        EXPECT_EQ(exercise.sets()[i], SetEntry(5, Weight(10)));
    }
}

TEST(AssembleExerciseTest, KeepsUnknownNames) {
    SetExprPool pool;
    NameStandardizer standardizer;
    const Exercise exercise = assemble_exercise(
        "Cable  Fly", *pool.count_by_count(3, 12), standardizer);
    EXPECT_EQ(exercise.name(), "Cable Fly");
    EXPECT_EQ(exercise.sets().size(), 3u);
}

TEST(AssembleExerciseTest, RejectsEmptyRecord) {
    SetExprPool pool;
    NameStandardizer standardizer;
    EXPECT_THROW(assemble_exercise("bp", *pool.fixed_reps_multi_weight(8, {}),
                                   standardizer),
                 MalformedSetError);
}

TEST(AssembleExerciseTest, PropagatesEvaluatorErrors) {
    SetExprPool pool;
    NameStandardizer standardizer;
    EXPECT_THROW(assemble_exercise("bp", *pool.bare_count(0), standardizer),
                 MalformedSetError);
    EXPECT_THROW(assemble_exercise("bp", *pool.whole_set(-2, 5, 60),
                                   standardizer),
                 NumericRangeError);
}

TEST(ExerciseTest, FlattenSplitsRunsOfEqualWeight) {
    const Exercise exercise("Squat", {SetEntry(5, Weight(100)),
                                      SetEntry(5, Weight(100)),
                                      SetEntry(3, Weight(110)),
                                      SetEntry(5, Weight(100))});
    const auto runs = exercise.flatten();
    ASSERT_EQ(runs.size(), 3u);
    EXPECT_EQ(runs[0].sets().size(), 2u);
    EXPECT_EQ(runs[1].sets(), std::vector<SetEntry>({SetEntry(3, Weight(110))}));
    EXPECT_EQ(runs[2].sets(), std::vector<SetEntry>({SetEntry(5, Weight(100))}));
    for (const auto& run : runs) {
        EXPECT_EQ(run.name(), "Squat");
    }
}

TEST(ExerciseTest, PrintsTextForm) {
    const Exercise exercise("Bench Press", {SetEntry(4, Weight(10)),
                                            SetEntry(5, Weight(10)),
                                            SetEntry(8, Weight(62.5))});
    std::ostringstream text;
    text << exercise;
    EXPECT_EQ(text.str(), "Bench Press: 4 - 10kg, 5 - 10kg, 8 - 62.5kg");
}

}  // namespace
}  // namespace trainlog
