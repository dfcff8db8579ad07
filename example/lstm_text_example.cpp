/**
 * ═══════════════════════════════════════════════════════════════════════════
 * CHARACTER-LEVEL LSTM ON A LONGER TEXT
 * ═══════════════════════════════════════════════════════════════════════════
 * 
 * Trains an LSTM on a text file (a novel, a play, any plain text) cut into
 * fixed-size windows, then writes text with greedy and top-k sampling and
 * saves a checkpoint that can be reloaded for more sampling.
 * 
 * Usage: lstm_text_example <text.txt> [config.json] [checkpoint_dir]
 * 
 * Only the first few thousand characters are used: the matrix code here is
 * meant for learning, not for throughput.
 */

#include "charrnn/config.h"
#include "charrnn/dataset.h"
#include "charrnn/model_saver.h"
#include "charrnn/optimizer.h"
#include "charrnn/predictor.h"
#include "charrnn/sampler.h"
#include "charrnn/trainer.h"
#include <filesystem>
#include <iostream>
#include <random>
#include <string>

namespace {

constexpr size_t kMaxCharacters = 4000;
constexpr size_t kWindow = 40;

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <text.txt> [config.json] [checkpoint_dir]\n";
        return 1;
    }
    
    try {
        TrainingConfig config;
        config.cell = CellType::LSTM;
        config.hidden_size = 64;
        config.epochs = 50;
        config.learning_rate = 0.01;
        config.clip_norm = 5.0;
        if (argc > 2) {
            config = TrainingConfig::load(argv[2]);
        }
        if (config.cell != CellType::LSTM) {
            std::cerr << "This example trains an LSTM; ignoring cell type '"
                      << toString(config.cell) << "'\n";
            config.cell = CellType::LSTM;
        }
        
        std::string text = readTextFile(argv[1]);
        if (text.size() > kMaxCharacters) {
            text.resize(kMaxCharacters);
        }
        std::cout << "Loaded " << text.size() << " characters from " << argv[1] << "\n";
        
        CharDataset dataset = CharDataset::fromRecords(makeCorpusWindows(text, kWindow));
        std::cout << "Windows: " << dataset.batch_size << " x " << dataset.seq_len
                  << ", vocabulary: " << dataset.dict_size << "\n";
        
        std::mt19937 gen(config.seed);
        CharLSTM model(dataset.dict_size, config.hidden_size, dataset.dict_size, gen);
        model.summary();
        
        auto optimizer = makeOptimizer(config.optimizer, config.learning_rate);
        trainPredictor(model, dataset, config, *optimizer);
        
        std::string prime = text.substr(0, 8);
        std::cout << "\nGreedy:\n" << sample(model, dataset.vocabulary, prime, 200,
                                             SamplingStrategy::Incremental) << "\n";
        std::cout << "\nTop-5:\n" << sampleTopK(model, dataset.vocabulary, prime, 200, 5, gen)
                  << "\n";
        
        if (argc > 3) {
            std::filesystem::create_directories(argv[3]);
            saveCheckpoint(argv[3], model, dataset.vocabulary, config);
            
            Checkpoint<LSTMCell> restored = loadCheckpoint<LSTMCell>(argv[3]);
            std::cout << "\nCheckpoint saved to " << argv[3] << "; reloaded sample:\n"
                      << sample(restored.predictor, restored.vocabulary, prime, 80,
                                SamplingStrategy::Incremental)
                      << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
