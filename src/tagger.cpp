#include "charrnn/tagger.h"
#include "charrnn/activation.h"
#include "charrnn/errors.h"
#include <cmath>
#include <sstream>
#include <stdexcept>

// ============================================================================
// LABEL INDEX
// ============================================================================

int LabelIndex::add(const std::string& label) {
    auto it = label_to_id.find(label);
    if (it != label_to_id.end()) {
        return it->second;
    }
    int id = static_cast<int>(id_to_label.size());
    label_to_id.emplace(label, id);
    id_to_label.push_back(label);
    return id;
}

int LabelIndex::idOf(const std::string& label) const {
    auto it = label_to_id.find(label);
    if (it == label_to_id.end()) {
        throw VocabularyLookupError("Unknown label '" + label + "'");
    }
    return it->second;
}

const std::string& LabelIndex::labelOf(int id) const {
    if (id < 0 || static_cast<size_t>(id) >= id_to_label.size()) {
        throw VocabularyLookupError("Label id " + std::to_string(id) + " is out of range");
    }
    return id_to_label[static_cast<size_t>(id)];
}

bool LabelIndex::contains(const std::string& label) const {
    return label_to_id.count(label) > 0;
}

std::vector<std::string> splitWords(const std::string& sentence) {
    std::istringstream stream(sentence);
    std::vector<std::string> words;
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

// ============================================================================
// SEQUENCE TAGGER
// ============================================================================

namespace {

LabelIndex indexWords(const std::vector<TaggedSentence>& corpus) {
    if (corpus.empty()) {
        throw std::invalid_argument("Tagger corpus is empty");
    }
    LabelIndex index;
    for (const auto& sentence : corpus) {
        if (sentence.words.size() != sentence.tags.size()) {
            throw ShapeMismatchError("Sentence has " + std::to_string(sentence.words.size()) +
                                     " words but " + std::to_string(sentence.tags.size()) +
                                     " tags");
        }
        for (const auto& word : sentence.words) {
            index.add(word);
        }
    }
    return index;
}

LabelIndex indexTags(const std::vector<TaggedSentence>& corpus) {
    LabelIndex index;
    for (const auto& sentence : corpus) {
        for (const auto& tag : sentence.tags) {
            index.add(tag);
        }
    }
    return index;
}

} // namespace

SequenceTagger::SequenceTagger(const std::vector<TaggedSentence>& corpus, size_t hidden_size,
                               std::mt19937& gen)
    : word_index(indexWords(corpus)),
      tag_index(indexTags(corpus)),
      predictor(word_index.size(), hidden_size, tag_index.size(), gen) {}

FeatureTensor SequenceTagger::encodeWords(const std::vector<std::string>& words) const {
    IndexSequence ids;
    for (const auto& word : words) {
        ids.push_back(word_index.idOf(word));
    }
    return encodeOneHot({ids}, word_index.size(), ids.size(), 1);
}

TrainingHistory SequenceTagger::train(const std::vector<TaggedSentence>& corpus,
                                      int epochs,
                                      Optimizer& optimizer,
                                      int log_every,
                                      std::ostream& log,
                                      bool verbose) {
    if (log_every <= 0) {
        throw std::invalid_argument("log_every must be positive");
    }
    
    // Encode once; every epoch reuses the same tensors
    std::vector<FeatureTensor> inputs;
    std::vector<IndexBatch> targets;
    for (const auto& sentence : corpus) {
        if (sentence.words.size() != sentence.tags.size()) {
            throw ShapeMismatchError("Sentence has " + std::to_string(sentence.words.size()) +
                                     " words but " + std::to_string(sentence.tags.size()) +
                                     " tags");
        }
        if (sentence.words.empty()) {
            continue;
        }
        IndexSequence tag_ids;
        for (const auto& tag : sentence.tags) {
            tag_ids.push_back(tag_index.idOf(tag));
        }
        inputs.push_back(encodeWords(sentence.words));
        targets.push_back({tag_ids});
    }
    if (inputs.empty()) {
        throw std::invalid_argument("Tagger training needs at least one non-empty sentence");
    }
    
    TrainingHistory history;
    for (int epoch = 1; epoch <= epochs; ++epoch) {
        double total = 0.0;
        for (size_t n = 0; n < inputs.size(); ++n) {
            predictor.zeroGradients();
            double loss = predictor.computeGradients(inputs[n], targets[n]);
            if (!std::isfinite(loss)) {
                throw NumericDivergenceError("Tagger loss became non-finite at epoch " +
                                             std::to_string(epoch), epoch, loss);
            }
            predictor.applyGradients(optimizer);
            total += loss;
        }
        
        double mean = total / static_cast<double>(inputs.size());
        history.losses.push_back(mean);
        if (verbose && epoch % log_every == 0) {
            logEpoch(log, epoch, epochs, mean);
        }
    }
    return history;
}

Matrix SequenceTagger::tagProbabilities(const std::vector<std::string>& words) const {
    if (words.empty()) {
        return Matrix(0, tag_index.size());
    }
    
    auto output = predictor.forward(encodeWords(words));
    Softmax softmax;
    Matrix probabilities(words.size(), tag_index.size());
    for (size_t t = 0; t < words.size(); ++t) {
        probabilities.setRow(t, softmax.forward(output.logits[t]));
    }
    return probabilities;
}

std::vector<std::string> SequenceTagger::predict(const std::vector<std::string>& words) const {
    Matrix probabilities = tagProbabilities(words);
    std::vector<std::string> tags;
    for (size_t t = 0; t < probabilities.getRows(); ++t) {
        tags.push_back(tag_index.labelOf(static_cast<int>(probabilities.argmaxRow(t))));
    }
    return tags;
}
