#include "charrnn/model_saver.h"
#include "charrnn/errors.h"
#include <cstdint>
#include <limits>
#include <random>
#include <stdexcept>
#include <unordered_map>

namespace {

void writeU64(std::ofstream& file, uint64_t value) {
    file.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

uint64_t readU64(std::ifstream& file) {
    uint64_t value = 0;
    file.read(reinterpret_cast<char*>(&value), sizeof(value));
    if (!file) {
        throw std::runtime_error("Unexpected end of model.bin");
    }
    return value;
}

uint64_t bytesRemaining(std::ifstream& file) {
    std::streamoff here = file.tellg();
    file.seekg(0, std::ios::end);
    std::streamoff end = file.tellg();
    file.seekg(here);
    if (here < 0 || end < here || !file) {
        throw std::runtime_error("Cannot determine the size of model.bin");
    }
    return static_cast<uint64_t>(end - here);
}

template <typename Cell>
CellType cellTypeOf();

template <>
CellType cellTypeOf<RNNCell>() { return CellType::RNN; }

template <>
CellType cellTypeOf<LSTMCell>() { return CellType::LSTM; }

} // namespace

void ModelSaver::saveConfig(const std::string& dir, const json& config) {
    std::ofstream file(dir + "/config.json");
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write " + dir + "/config.json");
    }
    file << config.dump(2);
}

json ModelSaver::loadConfig(const std::string& dir) {
    std::ifstream file(dir + "/config.json");
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config.json in " + dir);
    }
    json config;
    try {
        file >> config;
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Corrupt config.json: ") + e.what());
    }
    return config;
}

void ModelSaver::saveVocab(const std::string& dir, const Vocabulary& vocabulary) {
    // Bytes as integers: JSON strings cannot carry arbitrary bytes
    json vocab_json;
    std::vector<int> codes;
    for (char c : vocabulary.characters()) {
        codes.push_back(static_cast<unsigned char>(c));
    }
    vocab_json["characters"] = codes;
    vocab_json["size"] = vocabulary.size();
    
    std::ofstream file(dir + "/vocab.json");
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write " + dir + "/vocab.json");
    }
    file << vocab_json.dump(2);
}

Vocabulary ModelSaver::loadVocab(const std::string& dir) {
    std::ifstream file(dir + "/vocab.json");
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open vocab.json in " + dir);
    }
    
    std::vector<char> characters;
    try {
        json vocab_json;
        file >> vocab_json;
        for (int code : vocab_json.at("characters").get<std::vector<int>>()) {
            if (code < 0 || code > 255) {
                throw std::runtime_error("Character code " + std::to_string(code) +
                                         " in vocab.json is not a byte");
            }
            characters.push_back(static_cast<char>(static_cast<unsigned char>(code)));
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Corrupt vocab.json: ") + e.what());
    }
    return Vocabulary::fromCharacters(characters);
}

void ModelSaver::saveMatrix(std::ofstream& file, const Matrix& mat) {
    writeU64(file, mat.getRows());
    writeU64(file, mat.getCols());
    for (double val : mat.values()) {
        file.write(reinterpret_cast<const char*>(&val), sizeof(double));
    }
}

Matrix ModelSaver::loadMatrix(std::ifstream& file) {
    uint64_t rows = readU64(file);
    uint64_t cols = readU64(file);
    
    // The header is untrusted: the payload must fit both in memory and in
    // what is left of the file
    if (cols != 0 && rows > std::numeric_limits<uint64_t>::max() / cols) {
        throw std::runtime_error("Corrupt model.bin: matrix of " + std::to_string(rows) + "x" +
                                 std::to_string(cols) + " overflows");
    }
    uint64_t count = rows * cols;
    if (count > bytesRemaining(file) / sizeof(double)) {
        throw std::runtime_error("Corrupt model.bin: matrix of " + std::to_string(rows) + "x" +
                                 std::to_string(cols) + " is larger than the file");
    }
    
    Matrix mat(static_cast<size_t>(rows), static_cast<size_t>(cols));
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            double val = 0.0;
            file.read(reinterpret_cast<char*>(&val), sizeof(double));
            if (!file) {
                throw std::runtime_error("Unexpected end of model.bin");
            }
            mat.set(i, j, val);
        }
    }
    return mat;
}

void ModelSaver::saveWeights(const std::string& dir, const ParameterList& parameters) {
    std::ofstream file(dir + "/model.bin", std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write " + dir + "/model.bin");
    }
    
    writeU64(file, parameters.size());
    for (const auto& p : parameters) {
        writeU64(file, p.name.size());
        file.write(p.name.data(), static_cast<std::streamsize>(p.name.size()));
        saveMatrix(file, *p.value);
    }
    if (!file) {
        throw std::runtime_error("Failed while writing " + dir + "/model.bin");
    }
}

void ModelSaver::loadWeights(const std::string& dir, const ParameterList& parameters) {
    std::ifstream file(dir + "/model.bin", std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open model.bin in " + dir);
    }
    
    std::unordered_map<std::string, Matrix> stored;
    uint64_t count = readU64(file);
    for (uint64_t n = 0; n < count; ++n) {
        uint64_t name_length = readU64(file);
        if (name_length > 256) {
            throw std::runtime_error("Corrupt model.bin: implausible entry name length");
        }
        std::string name(name_length, '\0');
        file.read(&name[0], static_cast<std::streamsize>(name_length));
        if (!file) {
            throw std::runtime_error("Unexpected end of model.bin");
        }
        stored[name] = loadMatrix(file);
    }
    
    for (const auto& p : parameters) {
        auto it = stored.find(p.name);
        if (it == stored.end()) {
            throw std::runtime_error("model.bin has no entry for " + p.name);
        }
        if (!it->second.sameShape(*p.value)) {
            throw ShapeMismatchError("Stored " + p.name + " is " +
                                     std::to_string(it->second.getRows()) + "x" +
                                     std::to_string(it->second.getCols()) + ", expected " +
                                     std::to_string(p.value->getRows()) + "x" +
                                     std::to_string(p.value->getCols()));
        }
        *p.value = it->second;
    }
}

template <typename Cell>
void saveCheckpoint(const std::string& dir,
                    RecurrentPredictor<Cell>& predictor,
                    const Vocabulary& vocabulary,
                    const TrainingConfig& config) {
    json config_json = config.toJson();
    config_json["cell"] = Cell::kTypeName;
    config_json["hidden_size"] = predictor.getHiddenSize();
    config_json["input_size"] = predictor.getInputSize();
    config_json["output_size"] = predictor.getOutputSize();
    
    ModelSaver::saveConfig(dir, config_json);
    ModelSaver::saveVocab(dir, vocabulary);
    ModelSaver::saveWeights(dir, predictor.parameters());
}

template <typename Cell>
Checkpoint<Cell> loadCheckpoint(const std::string& dir) {
    json config_json = ModelSaver::loadConfig(dir);
    TrainingConfig config = TrainingConfig::fromJson(config_json);
    if (config.cell != cellTypeOf<Cell>()) {
        throw std::runtime_error(std::string("Checkpoint holds a ") + toString(config.cell) +
                                 " model, not " + Cell::kTypeName);
    }
    
    Vocabulary vocabulary = ModelSaver::loadVocab(dir);
    size_t input_size = config_json.value("input_size", vocabulary.size());
    size_t output_size = config_json.value("output_size", vocabulary.size());
    
    // Initial weights are overwritten by loadWeights
    std::mt19937 gen(config.seed);
    Checkpoint<Cell> checkpoint{config, vocabulary,
                                RecurrentPredictor<Cell>(input_size, config.hidden_size,
                                                         output_size, gen)};
    ModelSaver::loadWeights(dir, checkpoint.predictor.parameters());
    return checkpoint;
}

template void saveCheckpoint<RNNCell>(const std::string&, RecurrentPredictor<RNNCell>&,
                                      const Vocabulary&, const TrainingConfig&);
template void saveCheckpoint<LSTMCell>(const std::string&, RecurrentPredictor<LSTMCell>&,
                                       const Vocabulary&, const TrainingConfig&);
template Checkpoint<RNNCell> loadCheckpoint<RNNCell>(const std::string&);
template Checkpoint<LSTMCell> loadCheckpoint<LSTMCell>(const std::string&);
