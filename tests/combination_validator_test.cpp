#include "storyguard/combination_validator.hpp"

#include <gtest/gtest.h>

using namespace storyguard;

namespace {

class CombinationValidatorTest : public ::testing::Test {
protected:
    SharedConfig config = make_shared_config(default_config());
    CombinationValidator validator{config};
};

} // namespace

TEST_F(CombinationValidatorTest, AcceptsDistinctApprovedWords) {
    const SelectionOutcome outcome = validator.validate({"tree", "dragon", "happy"}, {"nature", "creatures", "feelings"});
    EXPECT_FALSE(outcome.error.has_value());
    EXPECT_TRUE(outcome.rule_ids.empty());
    EXPECT_EQ(outcome.words, (Selection{"tree", "dragon", "happy"}));
}

TEST_F(CombinationValidatorTest, CanonicalisesCaseAndPadding) {
    const SelectionOutcome outcome =
        validator.validate({" Tree", "DRAGON ", "Happy"}, {"Nature", "creatures", " FEELINGS "});
    EXPECT_FALSE(outcome.error.has_value());
    EXPECT_EQ(outcome.words, (Selection{"tree", "dragon", "happy"}));
}

TEST_F(CombinationValidatorTest, DuplicateWinsOverEverythingElse) {
    EXPECT_EQ(validator.validate({"tree", "tree", "sun"}, {"nature", "nature", "nature"}).error,
              ErrorKind::DuplicateSelection);
    EXPECT_EQ(validator.validate({"sun", "tree", "Tree"}, {"nature", "nature", "nature"}).error,
              ErrorKind::DuplicateSelection);
    // Unapproved and duplicated at once.
    EXPECT_EQ(validator.validate({"zzz", "zzz", "sun"}, {"nature", "bogus", "nature"}).error,
              ErrorKind::DuplicateSelection);
}

TEST_F(CombinationValidatorTest, MembershipIsCheckedAgainstTheClaimedCategory) {
    const SelectionOutcome outcome = validator.validate({"tree", "dragon", "happy"}, {"nature", "feelings", "feelings"});
    EXPECT_EQ(outcome.error, ErrorKind::UnapprovedSelection);
    EXPECT_EQ(outcome.rule_ids, (std::set<std::string>{"selection.unapproved.1"}));
}

TEST_F(CombinationValidatorTest, MembershipIgnoresPosition) {
    const SelectionOutcome outcome = validator.validate({"happy", "tree", "dragon"}, {"feelings", "nature", "creatures"});
    EXPECT_FALSE(outcome.error.has_value());
}

TEST_F(CombinationValidatorTest, UnknownCategoryIsUnapproved) {
    const SelectionOutcome outcome = validator.validate({"tree", "dragon", "happy"}, {"nature", "creatures", "colours"});
    EXPECT_EQ(outcome.error, ErrorKind::UnapprovedSelection);
    EXPECT_EQ(outcome.rule_ids.count("selection.unknown_category.2"), 1u);
}

TEST_F(CombinationValidatorTest, RejectsForbiddenTripleInAnyOrder) {
    for (const Selection& words : {Selection{"scary", "monster", "dark"}, Selection{"dark", "scary", "monster"},
                                   Selection{"monster", "dark", "scary"}}) {
        Selection categories;
        for (std::size_t i = 0; i < kSelectionSize; ++i) {
            categories[i] = words[i] == "scary" ? "feelings" : words[i] == "monster" ? "creatures" : "nature";
        }
        const SelectionOutcome outcome = validator.validate(words, categories);
        EXPECT_EQ(outcome.error, ErrorKind::InappropriateCombination);
        EXPECT_EQ(outcome.rule_ids.count("combination.scary_monster_dark"), 1u);
    }
}

TEST_F(CombinationValidatorTest, RejectsForbiddenPairInsideSelection) {
    const SelectionOutcome outcome = validator.validate({"angry", "tree", "monster"}, {"feelings", "nature", "creatures"});
    EXPECT_EQ(outcome.error, ErrorKind::InappropriateCombination);
    EXPECT_EQ(outcome.rule_ids.count("combination.angry_monster"), 1u);
}

TEST_F(CombinationValidatorTest, ApprovedWordsOutsideTheTableAreFine) {
    const SelectionOutcome outcome = validator.validate({"scary", "monster", "rainbow"}, {"feelings", "creatures", "nature"});
    EXPECT_FALSE(outcome.error.has_value());
}

TEST_F(CombinationValidatorTest, IsApproved) {
    EXPECT_TRUE(validator.is_approved("Dragon", "creatures"));
    EXPECT_FALSE(validator.is_approved("dragon", "nature"));
    EXPECT_FALSE(validator.is_approved("dragon", "missing"));
}
