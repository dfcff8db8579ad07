#include "charrnn/dataset.h"
#include "charrnn/errors.h"
#include <fstream>
#include <sstream>
#include <stdexcept>

std::vector<SequenceRecord> makeSequenceRecords(const std::vector<std::string>& padded) {
    std::vector<SequenceRecord> records;
    if (padded.empty()) {
        return records;
    }
    
    const size_t length = padded[0].size();
    if (length < 2) {
        throw SequenceLengthError("Sequences need at least 2 characters to shift, got " +
                                  std::to_string(length));
    }
    
    records.reserve(padded.size());
    for (size_t i = 0; i < padded.size(); ++i) {
        if (padded[i].size() != length) {
            throw ShapeMismatchError("Sequence " + std::to_string(i) + " has length " +
                                     std::to_string(padded[i].size()) + ", expected " +
                                     std::to_string(length) + " (pad first)");
        }
        records.push_back({padded[i].substr(0, length - 1), padded[i].substr(1)});
    }
    return records;
}

std::vector<SequenceRecord> makeCorpusWindows(const std::string& text, size_t window) {
    if (window == 0) {
        throw SequenceLengthError("Window length must be positive");
    }
    if (text.size() < window + 1) {
        throw SequenceLengthError("Text of " + std::to_string(text.size()) +
                                  " characters is too short for a window of " +
                                  std::to_string(window));
    }
    
    std::vector<SequenceRecord> records;
    for (size_t start = 0; start + window + 1 <= text.size(); start += window + 1) {
        std::string chunk = text.substr(start, window + 1);
        records.push_back({chunk.substr(0, window), chunk.substr(1)});
    }
    return records;
}

std::string readTextFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open " + path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

CharDataset CharDataset::fromSentences(const std::vector<std::string>& sentences,
                                       char fill_char) {
    if (sentences.empty()) {
        throw std::invalid_argument("Cannot build a dataset from an empty corpus");
    }
    
    std::vector<std::string> corpus = sentences;
    corpus.push_back(std::string(1, fill_char));
    Vocabulary vocabulary = Vocabulary::build(corpus);
    
    std::vector<std::string> padded = padSequences(sentences, maxLength(sentences), fill_char);
    
    CharDataset dataset{vocabulary, makeSequenceRecords(padded), FeatureTensor(), {}, 0, 0, 0};
    dataset.batch_size = dataset.records.size();
    dataset.seq_len = padded[0].size() - 1;
    dataset.dict_size = vocabulary.size();
    
    IndexBatch input_indices;
    for (const auto& record : dataset.records) {
        input_indices.push_back(vocabulary.encode(record.input));
        dataset.targets.push_back(vocabulary.encode(record.target));
    }
    dataset.inputs = encodeOneHot(input_indices, dataset.dict_size,
                                  dataset.seq_len, dataset.batch_size);
    return dataset;
}

CharDataset CharDataset::fromRecords(const std::vector<SequenceRecord>& records) {
    if (records.empty()) {
        throw std::invalid_argument("Cannot build a dataset from zero records");
    }
    
    std::vector<std::string> corpus;
    for (size_t n = 0; n < records.size(); ++n) {
        const auto& record = records[n];
        if (record.target.size() != record.input.size()) {
            throw ShapeMismatchError("Record " + std::to_string(n) +
                                     " target length differs from its input length");
        }
        for (size_t i = 0; i + 1 < record.input.size(); ++i) {
            if (record.target[i] != record.input[i + 1]) {
                throw ShapeMismatchError("Record " + std::to_string(n) +
                                         " target is not its input shifted by one (position " +
                                         std::to_string(i) + ")");
            }
        }
        corpus.push_back(record.input);
        corpus.push_back(record.target);
    }
    Vocabulary vocabulary = Vocabulary::build(corpus);
    
    CharDataset dataset{vocabulary, records, FeatureTensor(), {}, 0, 0, 0};
    dataset.batch_size = records.size();
    dataset.seq_len = records[0].input.size();
    dataset.dict_size = vocabulary.size();
    
    IndexBatch input_indices;
    for (const auto& record : records) {
        input_indices.push_back(vocabulary.encode(record.input));
        dataset.targets.push_back(vocabulary.encode(record.target));
    }
    dataset.inputs = encodeOneHot(input_indices, dataset.dict_size,
                                  dataset.seq_len, dataset.batch_size);
    return dataset;
}
