#include "charrnn/vocabulary.h"
#include "charrnn/errors.h"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace {

std::string describe(char c) {
    if (c >= 32 && c < 127) {
        return std::string("'") + c + "'";
    }
    return "byte " + std::to_string(static_cast<unsigned char>(c));
}

} // namespace

Vocabulary::Vocabulary() {
    char_to_index.fill(-1);
}

Vocabulary Vocabulary::build(const std::vector<std::string>& corpus) {
    if (corpus.empty()) {
        throw std::invalid_argument("Cannot build a vocabulary from an empty corpus");
    }
    
    std::set<unsigned char> seen;
    for (const auto& text : corpus) {
        seen.insert(text.begin(), text.end());
    }
    if (seen.empty()) {
        throw std::invalid_argument("Cannot build a vocabulary: corpus contains no characters");
    }
    
    std::vector<char> ordered;
    ordered.reserve(seen.size());
    for (unsigned char c : seen) {
        ordered.push_back(static_cast<char>(c));
    }
    return fromCharacters(ordered);
}

Vocabulary Vocabulary::fromCharacters(const std::vector<char>& characters) {
    if (characters.empty()) {
        throw std::invalid_argument("Vocabulary must contain at least one character");
    }
    
    Vocabulary vocab;
    vocab.index_to_char = characters;
    for (size_t i = 0; i < characters.size(); ++i) {
        auto slot = static_cast<unsigned char>(characters[i]);
        if (vocab.char_to_index[slot] != -1) {
            throw std::invalid_argument("Duplicate character " + describe(characters[i]) +
                                        " in vocabulary");
        }
        vocab.char_to_index[slot] = static_cast<int>(i);
    }
    return vocab;
}

int Vocabulary::indexOf(char c) const {
    int index = char_to_index[static_cast<unsigned char>(c)];
    if (index < 0) {
        throw VocabularyLookupError("Character " + describe(c) + " is not in the vocabulary");
    }
    return index;
}

char Vocabulary::decode(int index) const {
    if (index < 0 || static_cast<size_t>(index) >= index_to_char.size()) {
        throw VocabularyLookupError("Index " + std::to_string(index) +
                                    " is outside the vocabulary [0, " +
                                    std::to_string(index_to_char.size()) + ")");
    }
    return index_to_char[static_cast<size_t>(index)];
}

bool Vocabulary::contains(char c) const {
    return char_to_index[static_cast<unsigned char>(c)] >= 0;
}

IndexSequence Vocabulary::encode(const std::string& text) const {
    IndexSequence indices;
    indices.reserve(text.size());
    for (char c : text) {
        indices.push_back(indexOf(c));
    }
    return indices;
}

std::string Vocabulary::decode(const IndexSequence& indices) const {
    std::string text;
    text.reserve(indices.size());
    for (int index : indices) {
        text.push_back(decode(index));
    }
    return text;
}

// ============================================================================
// PADDING AND ONE-HOT ENCODING
// ============================================================================

size_t maxLength(const std::vector<std::string>& strings) {
    size_t longest = 0;
    for (const auto& s : strings) {
        longest = std::max(longest, s.size());
    }
    return longest;
}

std::vector<std::string> padSequences(const std::vector<std::string>& strings,
                                      size_t target_length,
                                      char fill_char) {
    std::vector<std::string> padded;
    padded.reserve(strings.size());
    for (size_t i = 0; i < strings.size(); ++i) {
        const auto& s = strings[i];
        if (s.size() > target_length) {
            throw SequenceLengthError("String " + std::to_string(i) + " has length " +
                                      std::to_string(s.size()) +
                                      ", longer than the padding target " +
                                      std::to_string(target_length));
        }
        padded.push_back(s + std::string(target_length - s.size(), fill_char));
    }
    return padded;
}

FeatureTensor encodeOneHot(const IndexBatch& sequences,
                           size_t vocab_size,
                           size_t seq_len,
                           size_t batch_size) {
    if (sequences.size() != batch_size) {
        throw ShapeMismatchError("Expected " + std::to_string(batch_size) +
                                 " sequences, got " + std::to_string(sequences.size()));
    }
    
    FeatureTensor features(batch_size, seq_len, vocab_size);
    for (size_t b = 0; b < batch_size; ++b) {
        if (sequences[b].size() != seq_len) {
            throw ShapeMismatchError("Sequence " + std::to_string(b) + " has length " +
                                     std::to_string(sequences[b].size()) + ", expected " +
                                     std::to_string(seq_len));
        }
        for (size_t t = 0; t < seq_len; ++t) {
            int index = sequences[b][t];
            if (index < 0 || static_cast<size_t>(index) >= vocab_size) {
                throw VocabularyLookupError("Index " + std::to_string(index) + " at (" +
                                            std::to_string(b) + ", " + std::to_string(t) +
                                            ") is outside [0, " + std::to_string(vocab_size) +
                                            ")");
            }
            features.set(b, t, static_cast<size_t>(index), 1.0);
        }
    }
    return features;
}
