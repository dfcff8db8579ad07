#include <gtest/gtest.h>
#include <limits>
#include <random>
#include <sstream>
#include <string>
#include <vector>
#include "charrnn/trainer.h"
#include "charrnn/errors.h"

namespace {

const std::vector<std::string> kSentences = {
    "hey how are you",
    "good i am fine",
    "have a nice day",
};

TrainingConfig quickConfig(int epochs) {
    TrainingConfig config;
    config.hidden_size = 12;
    config.epochs = epochs;
    config.learning_rate = 0.01;
    config.optimizer = "adam";
    config.log_every = 10;
    return config;
}

template <typename Cell>
TrainingHistory trainFresh(const CharDataset& dataset, const TrainingConfig& config) {
    std::mt19937 gen(config.seed);
    RecurrentPredictor<Cell> predictor(dataset.dict_size, config.hidden_size,
                                       dataset.dict_size, gen);
    auto optimizer = makeOptimizer(config.optimizer, config.learning_rate);
    std::ostringstream silent;
    return trainPredictor(predictor, dataset, config, *optimizer, silent, false);
}

} // namespace

TEST(TrainerTest, SameSeedSameHistory) {
    CharDataset dataset = CharDataset::fromSentences(kSentences);
    TrainingConfig config = quickConfig(20);

    TrainingHistory a = trainFresh<RNNCell>(dataset, config);
    TrainingHistory b = trainFresh<RNNCell>(dataset, config);
    EXPECT_EQ(a.losses, b.losses);

    config.seed = 1234;
    TrainingHistory c = trainFresh<RNNCell>(dataset, config);
    EXPECT_NE(a.losses, c.losses);
}

TEST(TrainerTest, LossDecreasesForBothCells) {
    CharDataset dataset = CharDataset::fromSentences(kSentences);
    TrainingConfig config = quickConfig(100);

    TrainingHistory rnn = trainFresh<RNNCell>(dataset, config);
    ASSERT_EQ(rnn.losses.size(), 100u);
    EXPECT_LT(rnn.finalLoss(), 0.5 * rnn.initialLoss());

    config.cell = CellType::LSTM;
    config.epochs = 150;
    TrainingHistory lstm = trainFresh<LSTMCell>(dataset, config);
    EXPECT_LT(lstm.finalLoss(), 0.7 * lstm.initialLoss());
}

TEST(TrainerTest, SGDAlsoLearns) {
    CharDataset dataset = CharDataset::fromSentences(kSentences);
    TrainingConfig config = quickConfig(60);
    config.optimizer = "sgd";
    config.learning_rate = 1.0;

    TrainingHistory history = trainFresh<RNNCell>(dataset, config);
    EXPECT_LT(history.finalLoss(), history.initialLoss());
}

TEST(TrainerTest, LogsEveryConfiguredEpoch) {
    CharDataset dataset = CharDataset::fromSentences(kSentences);
    TrainingConfig config = quickConfig(30);

    std::mt19937 gen(config.seed);
    CharRNN predictor(dataset.dict_size, config.hidden_size, dataset.dict_size, gen);
    Adam optimizer(config.learning_rate);
    std::ostringstream log;
    trainPredictor(predictor, dataset, config, optimizer, log);

    std::istringstream lines(log.str());
    std::vector<std::string> logged;
    std::string line;
    while (std::getline(lines, line)) {
        logged.push_back(line);
    }
    ASSERT_EQ(logged.size(), 3u);
    EXPECT_EQ(logged[0].rfind("Epoch   10/30 | Loss: ", 0), 0u);
    EXPECT_EQ(logged[2].rfind("Epoch   30/30 | Loss: ", 0), 0u);
}

TEST(TrainerTest, NonFiniteLossRaises) {
    CharDataset dataset = CharDataset::fromSentences(kSentences);
    TrainingConfig config = quickConfig(5);

    std::mt19937 gen(config.seed);
    CharRNN predictor(dataset.dict_size, config.hidden_size, dataset.dict_size, gen);
    for (const auto& p : predictor.parameters()) {
        if (p.name == "projection.W_hy") {
            p.value->fill(std::numeric_limits<double>::quiet_NaN());
        }
    }

    SGD optimizer(0.1);
    std::ostringstream silent;
    try {
        trainPredictor(predictor, dataset, config, optimizer, silent, false);
        FAIL() << "expected NumericDivergenceError";
    } catch (const NumericDivergenceError& e) {
        EXPECT_EQ(e.getEpoch(), 1);
    }
}

TEST(TrainerTest, InvalidConfigIsRejectedBeforeTraining) {
    CharDataset dataset = CharDataset::fromSentences(kSentences);
    TrainingConfig config = quickConfig(10);
    config.log_every = 0;

    std::mt19937 gen(config.seed);
    CharRNN predictor(dataset.dict_size, config.hidden_size, dataset.dict_size, gen);
    SGD optimizer(0.1);
    EXPECT_THROW(trainPredictor(predictor, dataset, config, optimizer), std::invalid_argument);
    EXPECT_EQ(predictor.getMode(), PredictorMode::Uninitialized);
}

TEST(TrainerTest, EmptyHistoryHasNoLosses) {
    TrainingHistory history;
    EXPECT_TRUE(history.empty());
    EXPECT_THROW(history.finalLoss(), std::logic_error);
}
