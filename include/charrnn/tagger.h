#ifndef CHARRNN_TAGGER_H
#define CHARRNN_TAGGER_H

#include "predictor.h"
#include "trainer.h"
#include "optimizer.h"
#include <iostream>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Dense ids for string labels, assigned in first-seen order
 */
class LabelIndex {
private:
    std::unordered_map<std::string, int> label_to_id;
    std::vector<std::string> id_to_label;
    
public:
    /**
     * @brief Id of label, adding it if new
     */
    int add(const std::string& label);
    
    /**
     * @throws VocabularyLookupError if the label was never added
     */
    int idOf(const std::string& label) const;
    
    /**
     * @throws VocabularyLookupError if id is out of range
     */
    const std::string& labelOf(int id) const;
    
    bool contains(const std::string& label) const;
    size_t size() const { return id_to_label.size(); }
    const std::vector<std::string>& labels() const { return id_to_label; }
};

struct TaggedSentence {
    std::vector<std::string> words;
    std::vector<std::string> tags;
};

/**
 * @brief Split on runs of whitespace
 */
std::vector<std::string> splitWords(const std::string& sentence);

/**
 * @brief Part-of-speech style tagger: one-hot words -> LSTM -> tag scores
 * 
 * Sentences have different lengths, so training runs one sentence at a time
 * (batch of 1) and takes an optimizer step after each.
 */
class SequenceTagger {
private:
    LabelIndex word_index;
    LabelIndex tag_index;
    RecurrentPredictor<LSTMCell> predictor;
    
    FeatureTensor encodeWords(const std::vector<std::string>& words) const;
    
public:
    /**
     * @param corpus Sentences whose words and tags define both indices
     * @throws ShapeMismatchError if a sentence has a different number of words and tags
     * @throws std::invalid_argument if the corpus is empty
     */
    SequenceTagger(const std::vector<TaggedSentence>& corpus, size_t hidden_size,
                   std::mt19937& gen);
    
    /**
     * @return Mean per-sentence loss of every epoch
     */
    TrainingHistory train(const std::vector<TaggedSentence>& corpus,
                          int epochs,
                          Optimizer& optimizer,
                          int log_every = 10,
                          std::ostream& log = std::cout,
                          bool verbose = true);
    
    /**
     * @return (words x tags) probabilities
     * @throws VocabularyLookupError for a word not seen in the corpus
     */
    Matrix tagProbabilities(const std::vector<std::string>& words) const;
    
    std::vector<std::string> predict(const std::vector<std::string>& words) const;
    
    const LabelIndex& words() const { return word_index; }
    const LabelIndex& tags() const { return tag_index; }
};

#endif // CHARRNN_TAGGER_H
