#ifndef CHARRNN_SAMPLER_H
#define CHARRNN_SAMPLER_H

#include "predictor.h"
#include "vocabulary.h"
#include <random>
#include <string>

/**
 * @brief How sample() obtains the state for each new character
 * 
 * Recompute: re-run the whole generated text from a zero state at every
 *            step (quadratic in the output length).
 * Incremental: feed only the newest character and carry the state forward.
 * 
 * Both produce the same text under greedy decoding.
 */
enum class SamplingStrategy {
    Recompute,
    Incremental
};

/**
 * @brief Greedy prediction of the character following `text`
 */
struct Prediction {
    char character;
    Matrix probabilities;   // (1 x vocab_size) softmax of the last step
};

/**
 * @throws VocabularyLookupError if text contains a character outside the vocabulary
 * @throws SequenceLengthError if text is empty
 * @throws ShapeMismatchError if the predictor was not built for this vocabulary
 */
template <typename Cell>
Prediction predictNext(const RecurrentPredictor<Cell>& predictor,
                       const Vocabulary& vocabulary,
                       const std::string& text);

/**
 * @brief Greedy generation until the text is `length` characters long
 * 
 * Appends max(0, length - start_text.size()) characters. Marks the
 * predictor Ready.
 * 
 * @throws VocabularyLookupError if start_text contains an unknown character
 * @throws SequenceLengthError if start_text is empty
 */
template <typename Cell>
std::string sample(RecurrentPredictor<Cell>& predictor,
                   const Vocabulary& vocabulary,
                   const std::string& start_text,
                   size_t length,
                   SamplingStrategy strategy = SamplingStrategy::Recompute);

/**
 * @brief Draw each next character from the renormalised k most likely ones
 * 
 * k = 1 reduces to greedy decoding. State is carried incrementally.
 * 
 * @throws std::invalid_argument if k is 0
 */
template <typename Cell>
std::string sampleTopK(RecurrentPredictor<Cell>& predictor,
                       const Vocabulary& vocabulary,
                       const std::string& prime,
                       size_t length,
                       size_t k,
                       std::mt19937& gen);

#endif // CHARRNN_SAMPLER_H
