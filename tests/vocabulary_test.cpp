#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "charrnn/vocabulary.h"
#include "charrnn/dataset.h"
#include "charrnn/errors.h"

namespace {

const std::vector<std::string> kSentences = {
    "hey how are you",
    "good i am fine",
    "have a nice day",
};

} // namespace

TEST(VocabularyTest, IndicesAreDenseAndRoundTrip) {
    Vocabulary vocab = Vocabulary::build(kSentences);
    ASSERT_EQ(vocab.size(), 17u);

    for (const auto& sentence : kSentences) {
        for (char c : sentence) {
            int index = vocab.indexOf(c);
            EXPECT_GE(index, 0);
            EXPECT_LT(static_cast<size_t>(index), vocab.size());
            EXPECT_EQ(vocab.decode(index), c);
        }
    }
    for (size_t i = 0; i < vocab.size(); ++i) {
        EXPECT_EQ(vocab.indexOf(vocab.decode(static_cast<int>(i))), static_cast<int>(i));
    }
}

TEST(VocabularyTest, SameCorpusSameIndices) {
    Vocabulary a = Vocabulary::build(kSentences);
    Vocabulary b = Vocabulary::build({kSentences[2], kSentences[0], kSentences[1]});
    EXPECT_EQ(a.characters(), b.characters());
}

TEST(VocabularyTest, EmptyCorpusFails) {
    EXPECT_THROW(Vocabulary::build({}), std::invalid_argument);
    EXPECT_THROW(Vocabulary::build({"", ""}), std::invalid_argument);
}

TEST(VocabularyTest, UnknownLookupsFail) {
    Vocabulary vocab = Vocabulary::build(kSentences);
    EXPECT_FALSE(vocab.contains('z'));
    EXPECT_THROW(vocab.indexOf('z'), VocabularyLookupError);
    EXPECT_THROW(vocab.encode("zebra"), VocabularyLookupError);
    EXPECT_THROW(vocab.decode(-1), VocabularyLookupError);
    EXPECT_THROW(vocab.decode(17), VocabularyLookupError);
    // Still catchable as the standard exception
    EXPECT_THROW(vocab.decode(17), std::out_of_range);
}

TEST(VocabularyTest, FromCharactersRejectsDuplicates) {
    EXPECT_THROW(Vocabulary::fromCharacters({'a', 'b', 'a'}), std::invalid_argument);
    Vocabulary v = Vocabulary::fromCharacters({'x', 'a'});
    EXPECT_EQ(v.indexOf('x'), 0);
    EXPECT_EQ(v.indexOf('a'), 1);
}

TEST(PaddingTest, PadsToTargetAndKeepsPrefixes) {
    size_t target = maxLength(kSentences);
    ASSERT_EQ(target, 15u);

    std::vector<std::string> padded = padSequences(kSentences, target, ' ');
    ASSERT_EQ(padded.size(), kSentences.size());
    for (size_t i = 0; i < padded.size(); ++i) {
        EXPECT_EQ(padded[i].size(), target);
        EXPECT_EQ(padded[i].substr(0, kSentences[i].size()), kSentences[i]);
    }
    EXPECT_EQ(padded[1], "good i am fine ");
}

TEST(PaddingTest, CustomFillCharacter) {
    std::vector<std::string> padded = padSequences({"ab", "abcd"}, 5, '#');
    EXPECT_EQ(padded[0], "ab###");
    EXPECT_EQ(padded[1], "abcd#");
}

TEST(PaddingTest, LongerThanTargetFails) {
    EXPECT_THROW(padSequences(kSentences, 10, ' '), SequenceLengthError);
}

TEST(OneHotTest, ExactlyOneHotPerSlice) {
    IndexBatch batch = {{0, 3, 2}, {4, 4, 1}};
    FeatureTensor features = encodeOneHot(batch, 5, 3, 2);

    auto shape = features.shape();
    EXPECT_EQ(shape[0], 2u);
    EXPECT_EQ(shape[1], 3u);
    EXPECT_EQ(shape[2], 5u);
    EXPECT_TRUE(features.isOneHot());

    for (size_t b = 0; b < 2; ++b) {
        for (size_t t = 0; t < 3; ++t) {
            for (size_t k = 0; k < 5; ++k) {
                double expected = (static_cast<int>(k) == batch[b][t]) ? 1.0 : 0.0;
                EXPECT_EQ(features.get(b, t, k), expected);
            }
        }
    }
}

TEST(OneHotTest, RejectsBadIndicesAndShapes) {
    EXPECT_THROW(encodeOneHot({{0, 5}}, 5, 2, 1), VocabularyLookupError);
    EXPECT_THROW(encodeOneHot({{0, -1}}, 5, 2, 1), VocabularyLookupError);
    EXPECT_THROW(encodeOneHot({{0, 1}}, 5, 3, 1), ShapeMismatchError);
    EXPECT_THROW(encodeOneHot({{0, 1}}, 5, 2, 2), ShapeMismatchError);
}

TEST(CharDatasetTest, ThreeSentenceScenario) {
    CharDataset dataset = CharDataset::fromSentences(kSentences);

    EXPECT_EQ(dataset.seq_len, 14u);
    EXPECT_EQ(dataset.batch_size, 3u);
    EXPECT_EQ(dataset.dict_size, 17u);

    auto shape = dataset.inputs.shape();
    EXPECT_EQ(shape[0], 3u);
    EXPECT_EQ(shape[1], 14u);
    EXPECT_EQ(shape[2], 17u);
    EXPECT_TRUE(dataset.inputs.isOneHot());

    EXPECT_EQ(dataset.records[1].input, "good i am fine");
    EXPECT_EQ(dataset.records[1].target, "ood i am fine ");
    EXPECT_EQ(dataset.vocabulary.decode(dataset.targets[1]), "ood i am fine ");
}

TEST(CharDatasetTest, FillCharacterJoinsVocabulary) {
    CharDataset dataset = CharDataset::fromSentences({"ab", "abc"}, '_');
    EXPECT_TRUE(dataset.vocabulary.contains('_'));
    EXPECT_EQ(dataset.dict_size, 4u);
    EXPECT_EQ(dataset.records[0].target, "b_");
}
