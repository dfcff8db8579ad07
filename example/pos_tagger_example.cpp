/**
 * ═══════════════════════════════════════════════════════════════════════════
 * PART-OF-SPEECH TAGGING WITH AN LSTM
 * ═══════════════════════════════════════════════════════════════════════════
 * 
 * Each word is one-hot encoded, the LSTM reads the sentence left to right
 * and the projection scores every tag at every word:
 * 
 *   "The dog ate the apple"  ->  DET NN V DET NN
 * 
 * Same predictor as the character models; only the input and output
 * alphabets change (words in, tags out).
 */

#include "charrnn/optimizer.h"
#include "charrnn/tagger.h"
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

int main() {
    try {
        const std::vector<TaggedSentence> corpus = {
            {splitWords("The dog ate the apple"), {"DET", "NN", "V", "DET", "NN"}},
            {splitWords("Everybody read that book"), {"NN", "V", "DET", "NN"}},
        };
        
        std::mt19937 gen(1);
        SequenceTagger tagger(corpus, 6, gen);
        std::cout << "Words: " << tagger.words().size() << ", tags: " << tagger.tags().size()
                  << "\n\n";
        
        SGD optimizer(0.1);
        tagger.train(corpus, 300, optimizer, 50);
        
        for (const auto& sentence : corpus) {
            std::vector<std::string> predicted = tagger.predict(sentence.words);
            std::cout << "\n";
            for (size_t i = 0; i < sentence.words.size(); ++i) {
                std::cout << "  " << std::setw(10) << std::left << sentence.words[i]
                          << std::setw(4) << predicted[i]
                          << (predicted[i] == sentence.tags[i] ? "" : "  (expected " +
                                                                    sentence.tags[i] + ")")
                          << "\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
