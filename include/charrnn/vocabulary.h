#ifndef CHARRNN_VOCABULARY_H
#define CHARRNN_VOCABULARY_H

#include "feature_tensor.h"
#include <string>
#include <vector>
#include <array>

/// One row of character indices per batch element
using IndexSequence = std::vector<int>;
using IndexBatch = std::vector<IndexSequence>;

/**
 * @brief Bidirectional character <-> index mapping
 * 
 * Indices form the dense range [0, size()). Characters are ordered by their
 * unsigned byte value, so building from the same corpus always yields the
 * same indices. Immutable once built.
 */
class Vocabulary {
private:
    std::vector<char> index_to_char;
    std::array<int, 256> char_to_index;

    Vocabulary();
    
public:
    /**
     * @brief Collect every distinct character of the corpus
     * @throws std::invalid_argument if the corpus has no characters at all
     */
    static Vocabulary build(const std::vector<std::string>& corpus);
    
    /**
     * @brief Rebuild from a stored ordering (checkpoints)
     * @throws std::invalid_argument on an empty list or duplicates
     */
    static Vocabulary fromCharacters(const std::vector<char>& characters);
    
    /**
     * @throws VocabularyLookupError if c was not in the corpus
     */
    int indexOf(char c) const;
    
    /**
     * @throws VocabularyLookupError if index is outside [0, size())
     */
    char decode(int index) const;
    
    bool contains(char c) const;
    
    IndexSequence encode(const std::string& text) const;
    std::string decode(const IndexSequence& indices) const;
    
    size_t size() const { return index_to_char.size(); }
    const std::vector<char>& characters() const { return index_to_char; }
};

/**
 * @brief Longest string length in the corpus (0 for an empty corpus)
 */
size_t maxLength(const std::vector<std::string>& strings);

/**
 * @brief Right-pad every string with fill_char up to target_length
 * @throws SequenceLengthError if a string is already longer than target_length
 */
std::vector<std::string> padSequences(const std::vector<std::string>& strings,
                                      size_t target_length,
                                      char fill_char = ' ');

/**
 * @brief One-hot encode a batch of index sequences
 * 
 * Output shape is (batch_size, seq_len, vocab_size).
 * 
 * @throws ShapeMismatchError if the batch does not have batch_size rows of seq_len indices
 * @throws VocabularyLookupError if an index is outside [0, vocab_size)
 */
FeatureTensor encodeOneHot(const IndexBatch& sequences,
                           size_t vocab_size,
                           size_t seq_len,
                           size_t batch_size);

#endif // CHARRNN_VOCABULARY_H
