#include "charrnn/config.h"
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace {

// nlohmann's get<> on numbers is a plain cast: a negative value read as an
// unsigned wraps and 1.5 read as an int truncates. Check before converting.
void requireInteger(const json& value, const std::string& key) {
    if (!value.is_number_integer()) {
        throw std::invalid_argument(key + " must be an integer");
    }
}

uint64_t readUnsigned(const json& j, const std::string& key, uint64_t max_value) {
    const json& value = j.at(key);
    requireInteger(value, key);
    if (!value.is_number_unsigned() && value.get<int64_t>() < 0) {
        throw std::invalid_argument(key + " must not be negative");
    }
    uint64_t result = value.is_number_unsigned() ? value.get<uint64_t>()
                                                 : static_cast<uint64_t>(value.get<int64_t>());
    if (result > max_value) {
        throw std::invalid_argument(key + " is out of range");
    }
    return result;
}

int readInt(const json& j, const std::string& key) {
    const json& value = j.at(key);
    requireInteger(value, key);
    if (value.is_number_unsigned()) {
        if (value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            throw std::invalid_argument(key + " is out of range");
        }
        return static_cast<int>(value.get<uint64_t>());
    }
    int64_t result = value.get<int64_t>();
    if (result < std::numeric_limits<int>::min() || result > std::numeric_limits<int>::max()) {
        throw std::invalid_argument(key + " is out of range");
    }
    return static_cast<int>(result);
}

double readDouble(const json& j, const std::string& key) {
    const json& value = j.at(key);
    if (!value.is_number()) {
        throw std::invalid_argument(key + " must be a number");
    }
    return value.get<double>();
}

} // namespace

const char* toString(CellType type) {
    switch (type) {
        case CellType::RNN: return "rnn";
        case CellType::LSTM: return "lstm";
    }
    return "unknown";
}

CellType parseCellType(const std::string& name) {
    if (name == "rnn") return CellType::RNN;
    if (name == "lstm") return CellType::LSTM;
    throw std::invalid_argument("Unknown cell type '" + name + "' (expected rnn or lstm)");
}

void TrainingConfig::validate() const {
    if (hidden_size == 0) {
        throw std::invalid_argument("hidden_size must be positive");
    }
    if (epochs < 0) {
        throw std::invalid_argument("epochs must not be negative");
    }
    if (!(learning_rate > 0.0) || !std::isfinite(learning_rate)) {
        throw std::invalid_argument("learning_rate must be a positive number");
    }
    if (log_every <= 0) {
        throw std::invalid_argument("log_every must be positive");
    }
    if (clip_norm < 0.0) {
        throw std::invalid_argument("clip_norm must not be negative");
    }
    if (optimizer != "sgd" && optimizer != "adam") {
        throw std::invalid_argument("Unknown optimizer '" + optimizer + "' (expected sgd or adam)");
    }
}

json TrainingConfig::toJson() const {
    return json{
        {"cell", toString(cell)},
        {"hidden_size", hidden_size},
        {"epochs", epochs},
        {"learning_rate", learning_rate},
        {"optimizer", optimizer},
        {"log_every", log_every},
        {"seed", seed},
        {"fill_char", std::string(1, fill_char)},
        {"clip_norm", clip_norm},
    };
}

TrainingConfig TrainingConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Training config must be a JSON object");
    }
    
    TrainingConfig config;
    try {
        if (j.contains("cell")) config.cell = parseCellType(j.at("cell").get<std::string>());
        if (j.contains("hidden_size")) {
            config.hidden_size = static_cast<size_t>(
                readUnsigned(j, "hidden_size", std::numeric_limits<size_t>::max()));
        }
        if (j.contains("epochs")) config.epochs = readInt(j, "epochs");
        if (j.contains("learning_rate")) config.learning_rate = readDouble(j, "learning_rate");
        if (j.contains("optimizer")) config.optimizer = j.at("optimizer").get<std::string>();
        if (j.contains("log_every")) config.log_every = readInt(j, "log_every");
        if (j.contains("seed")) {
            config.seed = static_cast<uint32_t>(
                readUnsigned(j, "seed", std::numeric_limits<uint32_t>::max()));
        }
        if (j.contains("clip_norm")) config.clip_norm = readDouble(j, "clip_norm");
        if (j.contains("fill_char")) {
            std::string fill = j.at("fill_char").get<std::string>();
            if (fill.size() != 1) {
                throw std::invalid_argument("fill_char must be exactly one character");
            }
            config.fill_char = fill[0];
        }
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Invalid training config: ") + e.what());
    }
    
    config.validate();
    return config;
}

TrainingConfig TrainingConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open " + path);
    }
    
    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Cannot parse " + path + ": " + e.what());
    }
    return fromJson(j);
}
