// File: tests/core/sequence_tensor_test.cpp
#include "core/sequence_tensor.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace canforge {
namespace {

// Word whose bits spell the binary value of `value`, MSB first
Word MakeWord(unsigned value, size_t bits) {
    Word word(bits);
    for (size_t i = 0; i < bits; ++i) {
        word[bits - 1 - i] = static_cast<uint8_t>((value >> i) & 1u);
    }
    return word;
}

// Tensor where word w of sequence s holds the value s * words + w
SequenceTensor MakeCountingTensor(size_t sequences, size_t words, size_t bits) {
    std::vector<Word> rows;
    for (size_t i = 0; i < sequences * words; ++i) {
        rows.push_back(MakeWord(static_cast<unsigned>(i), bits));
    }
    return SequenceTensor::FromRows(rows, TensorShape{sequences, words, bits});
}

// ============================================================================
// Construction
// ============================================================================

TEST(SequenceTensorTest, DefaultConstructionIsEmpty) {
    SequenceTensor tensor;
    EXPECT_TRUE(tensor.IsEmpty());
    EXPECT_EQ(TensorShape{}, tensor.Shape());
}

TEST(SequenceTensorTest, ShapeConstructionZeroFills) {
    SequenceTensor tensor(2, 3, 4);
    EXPECT_EQ(2u, tensor.NumSequences());
    EXPECT_EQ(3u, tensor.WordsPerSequence());
    EXPECT_EQ(4u, tensor.WordLength());
    EXPECT_EQ(24u, tensor.Data().size());
    for (uint8_t bit : tensor.Data()) {
        EXPECT_EQ(0, bit);
    }
}

TEST(SequenceTensorTest, FromRowsKeepsRowMajorOrder) {
    SequenceTensor tensor = MakeCountingTensor(2, 3, 4);
    EXPECT_EQ(MakeWord(0, 4), tensor.GetWord(0, 0));
    EXPECT_EQ(MakeWord(2, 4), tensor.GetWord(0, 2));
    EXPECT_EQ(MakeWord(3, 4), tensor.GetWord(1, 0));
    EXPECT_EQ(MakeWord(5, 4), tensor.GetWord(1, 2));
}

TEST(SequenceTensorTest, FromRowsRejectsWrongCount) {
    std::vector<Word> rows(5, Word(4, 0));
    EXPECT_THROW(SequenceTensor::FromRows(rows, TensorShape{2, 3, 4}), std::invalid_argument);
}

TEST(SequenceTensorTest, FromRowsRejectsRaggedWords) {
    std::vector<Word> rows(6, Word(4, 0));
    rows[3] = Word(5, 0);
    EXPECT_THROW(SequenceTensor::FromRows(rows, TensorShape{2, 3, 4}), std::invalid_argument);
}

TEST(SequenceTensorTest, FromWordsInfersWidth) {
    std::vector<Word> words(4, Word{1, 0, 1});
    SequenceTensor tensor = SequenceTensor::FromWords(words, 2, 2);
    EXPECT_EQ((TensorShape{2, 2, 3}), tensor.Shape());
}

TEST(SequenceTensorTest, ShapeToString) {
    EXPECT_EQ("(3, 300, 64)", (TensorShape{3, 300, 64}).ToString());
}

// ============================================================================
// Element Access
// ============================================================================

TEST(SequenceTensorTest, SetWordAndIndexing) {
    SequenceTensor tensor(2, 2, 3);
    tensor.SetWord(1, 0, Word{1, 0, 1});
    EXPECT_EQ(1, tensor(1, 0, 0));
    EXPECT_EQ(0, tensor(1, 0, 1));
    EXPECT_EQ(1, tensor.At(1, 0, 2));

    tensor(0, 1, 1) = 1;
    EXPECT_EQ((Word{0, 1, 0}), tensor.GetWord(0, 1));
}

TEST(SequenceTensorTest, CheckedAccessThrows) {
    SequenceTensor tensor(2, 2, 3);
    EXPECT_THROW(tensor.At(2, 0, 0), std::out_of_range);
    EXPECT_THROW(tensor.At(0, 0, 3), std::out_of_range);
    EXPECT_THROW(tensor.GetWord(0, 2), std::out_of_range);
    EXPECT_THROW(tensor.SetWord(0, 0, Word{1, 1}), std::invalid_argument);
}

TEST(SequenceTensorTest, GetSequenceAndFlatten) {
    SequenceTensor tensor = MakeCountingTensor(2, 3, 4);

    auto second = tensor.GetSequence(1);
    ASSERT_EQ(3u, second.size());
    EXPECT_EQ(MakeWord(4, 4), second[1]);

    auto rows = tensor.Flatten();
    ASSERT_EQ(6u, rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        EXPECT_EQ(MakeWord(static_cast<unsigned>(i), 4), rows[i]);
    }
}

// ============================================================================
// Axis Deletion
// ============================================================================

TEST(SequenceTensorTest, DeleteBitsRemovesColumns) {
    SequenceTensor tensor = SequenceTensor::FromRows({Word{1, 0, 1, 1}, Word{0, 1, 1, 0}},
                                                     TensorShape{1, 2, 4});
    SequenceTensor result = tensor.DeleteBits({0, 2});

    EXPECT_EQ((TensorShape{1, 2, 2}), result.Shape());
    EXPECT_EQ((Word{0, 1}), result.GetWord(0, 0));
    EXPECT_EQ((Word{1, 0}), result.GetWord(0, 1));
}

TEST(SequenceTensorTest, DeleteBitsToleratesDuplicates) {
    SequenceTensor tensor(1, 1, 4);
    EXPECT_EQ(3u, tensor.DeleteBits({1, 1, 1}).WordLength());
}

TEST(SequenceTensorTest, DeleteWordsKeepsOrder) {
    SequenceTensor tensor = MakeCountingTensor(2, 5, 4);
    SequenceTensor result = tensor.DeleteWords({1, 3});

    EXPECT_EQ((TensorShape{2, 3, 4}), result.Shape());
    EXPECT_EQ(MakeWord(0, 4), result.GetWord(0, 0));
    EXPECT_EQ(MakeWord(2, 4), result.GetWord(0, 1));
    EXPECT_EQ(MakeWord(4, 4), result.GetWord(0, 2));
    EXPECT_EQ(MakeWord(7, 4), result.GetWord(1, 1));
}

TEST(SequenceTensorTest, DeleteOutOfRangeThrows) {
    SequenceTensor tensor(1, 3, 4);
    EXPECT_THROW(tensor.DeleteBits({4}), std::out_of_range);
    EXPECT_THROW(tensor.DeleteWords({3}), std::out_of_range);
}

TEST(SequenceTensorTest, DeletionLeavesSourceUntouched) {
    SequenceTensor tensor = MakeCountingTensor(1, 4, 4);
    SequenceTensor copy = tensor;
    (void)tensor.DeleteWords({0});
    (void)tensor.DeleteBits({0});
    EXPECT_EQ(copy, tensor);
}

} // namespace
} // namespace canforge
