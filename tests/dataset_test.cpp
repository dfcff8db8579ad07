#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "charrnn/dataset.h"
#include "charrnn/errors.h"

TEST(SequenceRecordTest, TargetIsInputShiftedByOne) {
    std::vector<SequenceRecord> records = makeSequenceRecords({"hello", "world"});
    ASSERT_EQ(records.size(), 2u);
    for (const auto& r : records) {
        ASSERT_EQ(r.input.size(), r.target.size());
        for (size_t i = 0; i + 1 < r.input.size(); ++i) {
            EXPECT_EQ(r.target[i], r.input[i + 1]);
        }
    }
    EXPECT_EQ(records[0].input, "hell");
    EXPECT_EQ(records[0].target, "ello");
}

TEST(SequenceRecordTest, RequiresEqualLengthsOfAtLeastTwo) {
    EXPECT_THROW(makeSequenceRecords({"abc", "ab"}), ShapeMismatchError);
    EXPECT_THROW(makeSequenceRecords({"a"}), SequenceLengthError);
    EXPECT_TRUE(makeSequenceRecords({}).empty());
}

TEST(CorpusWindowTest, SplitsIntoShiftedWindows) {
    std::vector<SequenceRecord> records = makeCorpusWindows("abcdefghij", 4);
    // 10 characters -> two windows of 5, nothing left over
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].input, "abcd");
    EXPECT_EQ(records[0].target, "bcde");
    EXPECT_EQ(records[1].input, "fghi");
    EXPECT_EQ(records[1].target, "ghij");
}

TEST(CorpusWindowTest, DropsTrailingRemainder) {
    std::vector<SequenceRecord> records = makeCorpusWindows("abcdefg", 2);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].input, "de");
}

TEST(CorpusWindowTest, RejectsShortText) {
    EXPECT_THROW(makeCorpusWindows("abc", 3), SequenceLengthError);
    EXPECT_THROW(makeCorpusWindows("abc", 0), SequenceLengthError);
}

TEST(CorpusWindowTest, DatasetFromWindows) {
    CharDataset dataset = CharDataset::fromRecords(makeCorpusWindows("abababababab", 5));
    EXPECT_EQ(dataset.batch_size, 2u);
    EXPECT_EQ(dataset.seq_len, 5u);
    EXPECT_EQ(dataset.dict_size, 2u);
    EXPECT_TRUE(dataset.inputs.isOneHot());
}

TEST(CorpusWindowTest, DatasetRejectsUnshiftedRecords) {
    std::vector<SequenceRecord> records = {{"abcd", "bcde"}, {"abcd", "bxde"}};
    EXPECT_THROW(CharDataset::fromRecords(records), ShapeMismatchError);
    EXPECT_THROW(CharDataset::fromRecords({{"abc", "bc"}}), ShapeMismatchError);
}

TEST(ReadTextFileTest, MissingFileThrows) {
    EXPECT_THROW(readTextFile("/nonexistent/charrnn/corpus.txt"), std::runtime_error);
}
