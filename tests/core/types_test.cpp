// File: tests/core/types_test.cpp
#include "core/types.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

namespace canforge {
namespace {

// ============================================================================
// FieldType
// ============================================================================

TEST(FieldTypeTest, ToStringMatchesStoredNames) {
    EXPECT_STREQ("CONST", ToString(FieldType::CONST));
    EXPECT_STREQ("MULTI-VALUE", ToString(FieldType::MULTI_VALUE));
    EXPECT_STREQ("SENSOR", ToString(FieldType::SENSOR));
}

TEST(FieldTypeTest, ParseAcceptsBothMultiValueSpellings) {
    EXPECT_EQ(FieldType::MULTI_VALUE, ParseFieldType("MULTI-VALUE"));
    EXPECT_EQ(FieldType::MULTI_VALUE, ParseFieldType("MULTI_VALUE"));
    EXPECT_EQ(FieldType::SENSOR, ParseFieldType("SENSOR"));
    EXPECT_EQ(FieldType::CONST, ParseFieldType("CONST"));
}

TEST(FieldTypeTest, ParseRejectsUnknownName) {
    EXPECT_THROW(ParseFieldType("const"), std::invalid_argument);
    EXPECT_THROW(ParseFieldType(""), std::invalid_argument);
}

// ============================================================================
// FieldVariability
// ============================================================================

TEST(FieldVariabilityTest, CategoryValuesAreStable) {
    EXPECT_EQ(1, static_cast<int>(FieldVariability::HIGH_VAR));
    EXPECT_EQ(2, static_cast<int>(FieldVariability::MID_VAR));
    EXPECT_EQ(3, static_cast<int>(FieldVariability::LOW_VAR));
}

TEST(FieldVariabilityTest, ParseInvertsToString) {
    for (auto category : {FieldVariability::HIGH_VAR, FieldVariability::MID_VAR,
                          FieldVariability::LOW_VAR}) {
        EXPECT_EQ(category, ParseFieldVariability(ToString(category)));
    }
    EXPECT_THROW(ParseFieldVariability("VERY_HIGH"), std::invalid_argument);
}

// ============================================================================
// MutationStrategy
// ============================================================================

TEST(MutationStrategyTest, AllStrategiesInCanonicalOrder) {
    const auto& all = AllMutationStrategies();
    ASSERT_EQ(5u, all.size());
    EXPECT_EQ(MutationStrategy::MAX, all[0]);
    EXPECT_EQ(MutationStrategy::MIN, all[1]);
    EXPECT_EQ(MutationStrategy::RANDOM_CONSTANT, all[2]);
    EXPECT_EQ(MutationStrategy::RANDOM_VALUE, all[3]);
    EXPECT_EQ(MutationStrategy::REPLAY, all[4]);
}

TEST(MutationStrategyTest, ParseInvertsToString) {
    for (auto strategy : AllMutationStrategies()) {
        EXPECT_EQ(strategy, ParseMutationStrategy(ToString(strategy)));
    }
    EXPECT_THROW(ParseMutationStrategy("MAX"), std::invalid_argument);
}

// ============================================================================
// Word Conversions
// ============================================================================

TEST(WordConversionTest, BitStringToWord) {
    Word word = BitStringToWord("10110");
    ASSERT_EQ(5u, word.size());
    EXPECT_EQ(1, word[0]);
    EXPECT_EQ(0, word[1]);
    EXPECT_EQ(1, word[2]);
    EXPECT_EQ(1, word[3]);
    EXPECT_EQ(0, word[4]);
}

TEST(WordConversionTest, WordToBitString) {
    EXPECT_EQ("0011", WordToBitString(Word{0, 0, 1, 1}));
    EXPECT_EQ("", WordToBitString(Word{}));
}

TEST(WordConversionTest, RejectsNonBinaryCharacters) {
    EXPECT_THROW(BitStringToWord("0120"), std::invalid_argument);
    EXPECT_THROW(BitStringToWord("01 0"), std::invalid_argument);
}

} // namespace
} // namespace canforge
