#include "charrnn/sampler.h"
#include "charrnn/activation.h"
#include "charrnn/errors.h"
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace {

FeatureTensor encodeText(const Vocabulary& vocabulary, const std::string& text) {
    return encodeOneHot({vocabulary.encode(text)}, vocabulary.size(), text.size(), 1);
}

template <typename Cell>
void checkCompatible(const RecurrentPredictor<Cell>& predictor, const Vocabulary& vocabulary) {
    if (predictor.getInputSize() != vocabulary.size() ||
        predictor.getOutputSize() != vocabulary.size()) {
        throw ShapeMismatchError("Predictor (" + std::to_string(predictor.getInputSize()) +
                                 " -> " + std::to_string(predictor.getOutputSize()) +
                                 ") does not match a vocabulary of " +
                                 std::to_string(vocabulary.size()) + " characters");
    }
}

void checkStartText(const Vocabulary& vocabulary, const std::string& text) {
    if (text.empty()) {
        throw SequenceLengthError("Sampling needs at least one start character");
    }
    // Throws VocabularyLookupError on the first unknown character
    vocabulary.encode(text);
}

// Index of the highest probability after softmax, first index on ties
size_t greedyIndex(const Matrix& last_logits) {
    return Softmax().forward(last_logits).argmaxRow(0);
}

} // namespace

template <typename Cell>
Prediction predictNext(const RecurrentPredictor<Cell>& predictor,
                       const Vocabulary& vocabulary,
                       const std::string& text) {
    checkCompatible(predictor, vocabulary);
    checkStartText(vocabulary, text);

    auto output = predictor.forward(encodeText(vocabulary, text));
    Matrix probabilities = Softmax().forward(output.logits.back());
    size_t index = probabilities.argmaxRow(0);
    return Prediction{vocabulary.decode(static_cast<int>(index)), probabilities};
}

template <typename Cell>
std::string sample(RecurrentPredictor<Cell>& predictor,
                   const Vocabulary& vocabulary,
                   const std::string& start_text,
                   size_t length,
                   SamplingStrategy strategy) {
    checkCompatible(predictor, vocabulary);
    checkStartText(vocabulary, start_text);
    predictor.markReady();

    std::string text = start_text;
    if (text.size() >= length) {
        return text;
    }

    if (strategy == SamplingStrategy::Recompute) {
        while (text.size() < length) {
            text.push_back(predictNext(predictor, vocabulary, text).character);
        }
        return text;
    }

    auto output = predictor.forward(encodeText(vocabulary, text));
    while (true) {
        char next = vocabulary.decode(static_cast<int>(greedyIndex(output.logits.back())));
        text.push_back(next);
        if (text.size() >= length) {
            break;
        }
        output = predictor.forward(encodeText(vocabulary, std::string(1, next)),
                                   output.final_state);
    }
    return text;
}

template <typename Cell>
std::string sampleTopK(RecurrentPredictor<Cell>& predictor,
                       const Vocabulary& vocabulary,
                       const std::string& prime,
                       size_t length,
                       size_t k,
                       std::mt19937& gen) {
    if (k == 0) {
        throw std::invalid_argument("top-k sampling needs k >= 1");
    }
    checkCompatible(predictor, vocabulary);
    checkStartText(vocabulary, prime);
    predictor.markReady();

    std::string text = prime;
    if (text.size() >= length) {
        return text;
    }

    const size_t keep = std::min(k, vocabulary.size());
    std::vector<size_t> order(vocabulary.size());

    auto output = predictor.forward(encodeText(vocabulary, text));
    while (true) {
        Matrix probabilities = Softmax().forward(output.logits.back());

        std::iota(order.begin(), order.end(), 0);
        std::partial_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(keep),
                          order.end(), [&probabilities](size_t a, size_t b) {
                              double pa = probabilities.get(0, a);
                              double pb = probabilities.get(0, b);
                              return pa > pb || (pa == pb && a < b);
                          });

        std::vector<double> weights;
        for (size_t r = 0; r < keep; ++r) {
            weights.push_back(probabilities.get(0, order[r]));
        }
        std::discrete_distribution<size_t> pick(weights.begin(), weights.end());
        char next = vocabulary.decode(static_cast<int>(order[pick(gen)]));

        text.push_back(next);
        if (text.size() >= length) {
            break;
        }
        output = predictor.forward(encodeText(vocabulary, std::string(1, next)),
                                   output.final_state);
    }
    return text;
}

template Prediction predictNext<RNNCell>(const RecurrentPredictor<RNNCell>&,
                                         const Vocabulary&, const std::string&);
template Prediction predictNext<LSTMCell>(const RecurrentPredictor<LSTMCell>&,
                                          const Vocabulary&, const std::string&);

template std::string sample<RNNCell>(RecurrentPredictor<RNNCell>&, const Vocabulary&,
                                     const std::string&, size_t, SamplingStrategy);
template std::string sample<LSTMCell>(RecurrentPredictor<LSTMCell>&, const Vocabulary&,
                                      const std::string&, size_t, SamplingStrategy);

template std::string sampleTopK<RNNCell>(RecurrentPredictor<RNNCell>&, const Vocabulary&,
                                         const std::string&, size_t, size_t, std::mt19937&);
template std::string sampleTopK<LSTMCell>(RecurrentPredictor<LSTMCell>&, const Vocabulary&,
                                          const std::string&, size_t, size_t, std::mt19937&);
