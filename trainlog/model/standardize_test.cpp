#include <gtest/gtest.h>
#include <trainlog/model/standardize.hpp>

namespace trainlog {
namespace {

TEST(MatchKeyTest, IgnoresCaseAccentsAndSpacing) {
    EXPECT_EQ(match_key("  Extensión   de CUÁDRICEPS "),
              "extension de cuadriceps");
    EXPECT_EQ(match_key("bench press"), match_key("Bench\tPress"));
}

TEST(CheckSynonymsTest, AcceptsDefaults) {
    std::vector<std::string> error_log;
    EXPECT_TRUE(check_synonyms(SynonymTable::defaults().entries(), error_log));
    EXPECT_TRUE(error_log.empty());
}

TEST(CheckSynonymsTest, ReportsConflicts) {
    const std::vector<Synonym> entries = {
        {"Squat", {"s"}},
        {"squat", {}},
        {"Shrug", {"S", "squat"}},
        {" ", {}},
    };
    std::vector<std::string> error_log;
    EXPECT_FALSE(check_synonyms(entries, error_log));
    // repeated canonical, empty canonical, claimed synonym, synonym that is
    // a canonical name
    EXPECT_EQ(error_log.size(), 4u);
}

TEST(CheckSynonymsTest, AllowsCanonicalAsOwnSynonym) {
    const std::vector<Synonym> entries = {{"Squat", {"squat", "s"}}};
    std::vector<std::string> error_log;
    EXPECT_TRUE(check_synonyms(entries, error_log));
}

TEST(NameStandardizerTest, MapsSynonyms) {
    NameStandardizer standardizer;
    EXPECT_EQ(standardizer.standardize("bp"), "Bench Press");
    EXPECT_EQ(standardizer.standardize("oh"), "Overhead Press");
    EXPECT_EQ(standardizer.standardize("mlp"), "Machine Leg Press");
    EXPECT_EQ(standardizer.standardize("lat pull down"),
              "Machine Lateral Pull-Down");
}

TEST(NameStandardizerTest, IgnoresCaseAndAccents) {
    NameStandardizer standardizer;
    EXPECT_EQ(standardizer.standardize("PRESS DE BANCA"), "Bench Press");
    EXPECT_EQ(standardizer.standardize("extension de cuadriceps"),
              "Leg Extension");
    EXPECT_EQ(standardizer.standardize("Extensión de Cuádriceps"),
              "Leg Extension");
    EXPECT_EQ(standardizer.standardize("  Peso   Muerto "), "Deadlift");
}

TEST(NameStandardizerTest, CanonicalNamesAreFixedPoints) {
    NameStandardizer standardizer;
    for (const auto& entry : standardizer.table().entries()) {
        EXPECT_EQ(standardizer.standardize(entry.canonical), entry.canonical);
        for (const auto& synonym : entry.synonyms) {
            const std::string name = standardizer.standardize(synonym);
            EXPECT_EQ(name, entry.canonical);
            EXPECT_EQ(standardizer.standardize(name), name);
        }
    }
}

TEST(NameStandardizerTest, PassesUnknownNamesThrough) {
    NameStandardizer standardizer;
    EXPECT_EQ(standardizer.standardize("Cable   Fly"), "Cable Fly");
    EXPECT_EQ(standardizer.standardize(" hip thrust"), "hip thrust");
}

TEST(NameStandardizerTest, ExtendsBeforeFirstLookup) {
    NameStandardizer standardizer;
    standardizer.extend({{"Hip Thrust", {"ht", "empuje de cadera"}}});
    EXPECT_EQ(standardizer.standardize("HT"), "Hip Thrust");
    EXPECT_EQ(standardizer.standardize("Empuje de Cadera"), "Hip Thrust");
    EXPECT_EQ(standardizer.standardize("bp"), "Bench Press");
}

TEST(NameStandardizerTest, StartsFromGivenTable) {
    NameStandardizer standardizer(SynonymTable(std::vector<Synonym>{{"Plank", {"pl"}}}));
    EXPECT_EQ(standardizer.standardize("pl"), "Plank");
    EXPECT_EQ(standardizer.standardize("bp"), "bp");
}

TEST(NameStandardizerDeathTest, ExtendAfterLookupFails) {
    NameStandardizer standardizer;
    standardizer.standardize("bp");
    EXPECT_DEATH(standardizer.extend({{"Hip Thrust", {"ht"}}}),
                 "extended after first lookup");
}

TEST(NameStandardizerDeathTest, ConflictingExtensionFails) {
    NameStandardizer standardizer;
    EXPECT_DEATH(standardizer.extend({{"Bulgarian Split Squat", {"bp"}}}),
                 "invalid synonym table");
}

}  // namespace
}  // namespace trainlog
