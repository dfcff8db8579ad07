#ifndef CHARRNN_ERRORS_H
#define CHARRNN_ERRORS_H

#include <stdexcept>
#include <string>

/**
 * @file errors.h
 * @brief Exception types raised by the codec, the predictor and the trainer
 * 
 * All of them are fatal for the call that raised them. Each derives from the
 * standard exception that describes the same class of failure, so callers
 * that only know <stdexcept> still catch them.
 */

/// A character or index is not part of the vocabulary.
class VocabularyLookupError : public std::out_of_range {
public:
    explicit VocabularyLookupError(const std::string& what)
        : std::out_of_range(what) {}
};

/// Tensor dimensions disagree with the declared vocabulary, length or batch.
class ShapeMismatchError : public std::invalid_argument {
public:
    explicit ShapeMismatchError(const std::string& what)
        : std::invalid_argument(what) {}
};

/// A string is longer than the padding target, or too short to shift.
class SequenceLengthError : public std::length_error {
public:
    explicit SequenceLengthError(const std::string& what)
        : std::length_error(what) {}
};

/// The training loss became NaN or infinite.
class NumericDivergenceError : public std::runtime_error {
public:
    NumericDivergenceError(const std::string& what, int epoch, double loss)
        : std::runtime_error(what), epoch(epoch), loss(loss) {}
    
    int getEpoch() const { return epoch; }
    double getLoss() const { return loss; }

private:
    int epoch;
    double loss;
};

#endif // CHARRNN_ERRORS_H
