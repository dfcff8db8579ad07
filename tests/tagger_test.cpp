#include <gtest/gtest.h>
#include <random>
#include <sstream>
#include <vector>
#include "charrnn/tagger.h"
#include "charrnn/errors.h"

namespace {

std::vector<TaggedSentence> trainingCorpus() {
    return {
        {splitWords("The dog ate the apple"), splitWords("DET NN V DET NN")},
        {splitWords("Everybody read that book"), splitWords("NN V DET NN")},
    };
}

} // namespace

TEST(LabelIndexTest, AssignsIdsInFirstSeenOrder) {
    LabelIndex index;
    EXPECT_EQ(index.add("DET"), 0);
    EXPECT_EQ(index.add("NN"), 1);
    EXPECT_EQ(index.add("DET"), 0);
    EXPECT_EQ(index.size(), 2u);
    EXPECT_EQ(index.labelOf(1), "NN");
    EXPECT_TRUE(index.contains("NN"));
    EXPECT_THROW(index.idOf("V"), VocabularyLookupError);
    EXPECT_THROW(index.labelOf(2), VocabularyLookupError);
}

TEST(SplitWordsTest, CollapsesWhitespace) {
    std::vector<std::string> words = splitWords("  The  dog\tate ");
    ASSERT_EQ(words.size(), 3u);
    EXPECT_EQ(words[2], "ate");
}

TEST(SequenceTaggerTest, LearnsTrainingSentences) {
    std::vector<TaggedSentence> corpus = trainingCorpus();
    std::mt19937 gen(5489);
    SequenceTagger tagger(corpus, 8, gen);
    EXPECT_EQ(tagger.words().size(), 9u);
    EXPECT_EQ(tagger.tags().size(), 3u);

    Adam optimizer(0.05);
    std::ostringstream silent;
    TrainingHistory history = tagger.train(corpus, 150, optimizer, 10, silent, false);
    EXPECT_LT(history.finalLoss(), history.initialLoss());

    for (const auto& sentence : corpus) {
        EXPECT_EQ(tagger.predict(sentence.words), sentence.tags);
    }

    Matrix probabilities = tagger.tagProbabilities(corpus[0].words);
    ASSERT_EQ(probabilities.getRows(), 5u);
    for (size_t t = 0; t < probabilities.getRows(); ++t) {
        EXPECT_NEAR(probabilities.row(t).sum(), 1.0, 1e-9);
    }
}

TEST(SequenceTaggerTest, RejectsBadInput) {
    std::mt19937 gen(1);
    EXPECT_THROW(SequenceTagger({}, 4, gen), std::invalid_argument);

    std::vector<TaggedSentence> uneven = {{splitWords("a b"), splitWords("X")}};
    EXPECT_THROW(SequenceTagger(uneven, 4, gen), ShapeMismatchError);

    SequenceTagger tagger(trainingCorpus(), 4, gen);
    EXPECT_THROW(tagger.predict(splitWords("The cat")), VocabularyLookupError);
    EXPECT_TRUE(tagger.predict({}).empty());
}
