// File: tests/sequence/sequence_reshaper_test.cpp
#include "sequence/sequence_reshaper.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace canforge {
namespace {

std::vector<std::string> MakeBinaryWords(size_t count) {
    std::vector<std::string> words;
    for (size_t i = 0; i < count; ++i) {
        std::string bits(4, '0');
        for (size_t b = 0; b < 4; ++b) {
            if ((i >> b) & 1u) {
                bits[3 - b] = '1';
            }
        }
        words.push_back(bits);
    }
    return words;
}

// ============================================================================
// Words Per Sequence
// ============================================================================

TEST(WordsPerSequenceTest, FloorOfDurationOverPeriod) {
    EXPECT_EQ(4u, WordsPerSequence(0.5, 2.0));
    EXPECT_EQ(3u, WordsPerSequence(0.3, 1.0));
    EXPECT_EQ(100u, WordsPerSequence(0.01, 1.0));
}

TEST(WordsPerSequenceTest, FloatingPointFloorIsKept) {
    // 0.3 / 0.1 evaluates just below 3
    EXPECT_EQ(2u, WordsPerSequence(0.1, 0.3));
    EXPECT_EQ(6u, WordsPerSequence(0.1, 0.7));
    EXPECT_EQ(300u, WordsPerSequence(0.01, 3.0));
}

TEST(WordsPerSequenceTest, InvalidTimingThrows) {
    EXPECT_THROW(WordsPerSequence(0.0, 1.0), std::invalid_argument);
    EXPECT_THROW(WordsPerSequence(-0.01, 1.0), std::invalid_argument);
    EXPECT_THROW(WordsPerSequence(0.01, 0.0), std::invalid_argument);
    EXPECT_THROW(WordsPerSequence(1.0, 0.5), std::invalid_argument);
}

// ============================================================================
// Create Test Sequences
// ============================================================================

TEST(CreateTestSequencesTest, SplitsIntoCompleteSequences) {
    ReshapeResult result = CreateTestSequences(MakeBinaryWords(10), 0.25, 1.0);

    EXPECT_EQ(4u, result.words_per_sequence);
    EXPECT_EQ(2u, result.discarded_words);
    EXPECT_EQ((TensorShape{2, 4, 4}), result.sequences.Shape());
    EXPECT_EQ("0000", WordToBitString(result.sequences.GetWord(0, 0)));
    EXPECT_EQ("0011", WordToBitString(result.sequences.GetWord(0, 3)));
    EXPECT_EQ("0100", WordToBitString(result.sequences.GetWord(1, 0)));
    EXPECT_EQ("0111", WordToBitString(result.sequences.GetWord(1, 3)));
}

TEST(CreateTestSequencesTest, ExactMultipleDiscardsNothing) {
    ReshapeResult result = CreateTestSequences(MakeBinaryWords(12), 0.25, 1.0);
    EXPECT_EQ(3u, result.sequences.NumSequences());
    EXPECT_EQ(0u, result.discarded_words);
}

TEST(CreateTestSequencesTest, TooFewWordsGiveNoSequences) {
    ReshapeResult result = CreateTestSequences(MakeBinaryWords(3), 0.25, 1.0);
    EXPECT_EQ(0u, result.sequences.NumSequences());
    EXPECT_EQ(3u, result.discarded_words);
    EXPECT_TRUE(result.sequences.IsEmpty());
}

TEST(CreateTestSequencesTest, EmptyInput) {
    ReshapeResult result = CreateTestSequences(std::vector<std::string>{}, 0.25, 1.0);
    EXPECT_EQ(0u, result.sequences.NumSequences());
    EXPECT_EQ(0u, result.discarded_words);
}

TEST(CreateTestSequencesTest, RaggedWordsThrow) {
    std::vector<std::string> words = MakeBinaryWords(8);
    words[5] = "01";
    EXPECT_THROW(CreateTestSequences(words, 0.25, 1.0), std::invalid_argument);
}

TEST(CreateTestSequencesTest, NonBinaryWordThrows) {
    std::vector<std::string> words = MakeBinaryWords(8);
    words[2] = "01x0";
    EXPECT_THROW(CreateTestSequences(words, 0.25, 1.0), std::invalid_argument);
}

TEST(CreateTestSequencesTest, RecordsUseBinaryPayload) {
    std::vector<TrafficRecord> records;
    for (const auto& bits : MakeBinaryWords(5)) {
        TrafficRecord record;
        record.id = "0DE";
        record.data_bin = bits;
        records.push_back(record);
    }

    ReshapeResult result = CreateTestSequences(records, 0.5, 1.0);
    EXPECT_EQ((TensorShape{2, 2, 4}), result.sequences.Shape());
    EXPECT_EQ(1u, result.discarded_words);
    EXPECT_EQ("0010", WordToBitString(result.sequences.GetWord(1, 0)));
}

} // namespace
} // namespace canforge
