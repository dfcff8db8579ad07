#ifndef CHARRNN_DATASET_H
#define CHARRNN_DATASET_H

#include "vocabulary.h"
#include "feature_tensor.h"
#include <string>
#include <vector>

/**
 * @brief Input/target pair where target[i] == input[i + 1]
 */
struct SequenceRecord {
    std::string input;
    std::string target;
};

/**
 * @brief Shift every (equal-length) string by one position
 * 
 * input = s[0 .. n-2], target = s[1 .. n-1]
 * 
 * @throws ShapeMismatchError if the strings do not all share one length
 * @throws SequenceLengthError if that length is below 2
 */
std::vector<SequenceRecord> makeSequenceRecords(const std::vector<std::string>& padded);

/**
 * @brief Cut a long text into consecutive windows of window + 1 characters
 * 
 * Each window yields one record of `window` characters. A trailing remainder
 * shorter than a full window is dropped.
 * 
 * @throws SequenceLengthError if window is 0 or the text is shorter than window + 1
 */
std::vector<SequenceRecord> makeCorpusWindows(const std::string& text, size_t window);

/**
 * @brief Read a whole text file
 * @throws std::runtime_error if the file cannot be opened
 */
std::string readTextFile(const std::string& path);

/**
 * @brief Everything the trainer needs for a small sentence corpus
 * 
 * Runs the codec pipeline: build vocabulary -> pad to the longest sentence
 * -> shift by one -> one-hot encode the inputs.
 */
struct CharDataset {
    Vocabulary vocabulary;
    std::vector<SequenceRecord> records;
    FeatureTensor inputs;     // (batch, seq_len, dict_size)
    IndexBatch targets;       // (batch, seq_len)
    size_t seq_len;
    size_t batch_size;
    size_t dict_size;
    
    /**
     * @param sentences Training sentences, at least one
     * @param fill_char Padding character; added to the vocabulary if the corpus lacks it
     */
    static CharDataset fromSentences(const std::vector<std::string>& sentences,
                                     char fill_char = ' ');
    
    /**
     * @brief Records that already satisfy the shift invariant (e.g. corpus windows)
     * @throws ShapeMismatchError if a target is not its input shifted by one
     */
    static CharDataset fromRecords(const std::vector<SequenceRecord>& records);
};

#endif // CHARRNN_DATASET_H
