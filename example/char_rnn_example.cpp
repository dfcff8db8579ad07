/**
 * ═══════════════════════════════════════════════════════════════════════════
 * CHARACTER-LEVEL RNN ON THREE SENTENCES
 * ═══════════════════════════════════════════════════════════════════════════
 * 
 * Walks through the whole pipeline on a corpus small enough to memorise:
 * 
 *   1. Build the vocabulary (17 characters)
 *   2. Pad every sentence to 15 characters and shift by one
 *        input : "good i am fine"
 *        target: "ood i am fine "
 *   3. One-hot encode -> tensor of shape (3, 14, 17)
 *   4. Train a vanilla RNN, printing the loss every 10 epochs
 *   5. Greedily sample from the seed "good"
 * 
 * Usage: char_rnn_example [config.json]
 */

#include "charrnn/config.h"
#include "charrnn/dataset.h"
#include "charrnn/errors.h"
#include "charrnn/optimizer.h"
#include "charrnn/predictor.h"
#include "charrnn/sampler.h"
#include "charrnn/trainer.h"
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

// ANSI Colors
#define RESET   "\033[0m"
#define RED     "\033[31m"
#define GREEN   "\033[32m"
#define CYAN    "\033[36m"
#define BOLD    "\033[1m"

void printHeader(const std::string& title) {
    std::cout << "\n" << BOLD << CYAN;
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║  " << std::setw(58) << std::left << title << "  ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝";
    std::cout << RESET << std::right << "\n\n";
}

template <typename Cell>
void run(const CharDataset& dataset, const TrainingConfig& config) {
    std::mt19937 gen(config.seed);
    RecurrentPredictor<Cell> model(dataset.dict_size, config.hidden_size,
                                   dataset.dict_size, gen);
    model.summary();
    
    printHeader("Training");
    auto optimizer = makeOptimizer(config.optimizer, config.learning_rate);
    TrainingHistory history = trainPredictor(model, dataset, config, *optimizer);
    if (!history.empty()) {
        std::cout << "\nLoss: " << history.initialLoss() << " -> " << history.finalLoss() << "\n";
    }
    
    printHeader("Sampling");
    for (const std::string seed : {"good", "hey", "have"}) {
        std::string text = sample(model, dataset.vocabulary, seed, dataset.seq_len + 1);
        std::cout << "  " << std::setw(6) << std::left << ("'" + seed + "'") << std::right
                  << " -> '" << GREEN << text << RESET << "'\n";
    }
}

int main(int argc, char** argv) {
    try {
        TrainingConfig config;
        if (argc > 1) {
            config = TrainingConfig::load(argv[1]);
        }
        
        const std::vector<std::string> sentences = {
            "hey how are you",
            "good i am fine",
            "have a nice day",
        };
        
        printHeader("Vocabulary and feature tensor");
        CharDataset dataset = CharDataset::fromSentences(sentences, config.fill_char);
        
        std::cout << "Vocabulary (" << dataset.dict_size << "): ";
        for (char c : dataset.vocabulary.characters()) {
            std::cout << "'" << c << "' ";
        }
        std::cout << "\n\n";
        for (const auto& record : dataset.records) {
            std::cout << "  input : '" << record.input << "'\n";
            std::cout << "  target: '" << record.target << "'\n";
        }
        auto shape = dataset.inputs.shape();
        std::cout << "\nFeature tensor shape: (" << shape[0] << ", " << shape[1] << ", "
                  << shape[2] << ")\n";
        
        if (config.cell == CellType::LSTM) {
            run<LSTMCell>(dataset, config);
        } else {
            run<RNNCell>(dataset, config);
        }
    } catch (const NumericDivergenceError& e) {
        std::cerr << RED << "Training diverged: " << e.what() << RESET << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        return 1;
    }
    return 0;
}
