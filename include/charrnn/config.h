#ifndef CHARRNN_CONFIG_H
#define CHARRNN_CONFIG_H

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

enum class CellType {
    RNN,
    LSTM
};

const char* toString(CellType type);

/**
 * @throws std::invalid_argument for anything but "rnn" or "lstm"
 */
CellType parseCellType(const std::string& name);

/**
 * @brief Hyper-parameters of one training session
 * 
 * Example config.json:
 * {
 *   "cell": "rnn",
 *   "hidden_size": 12,
 *   "epochs": 100,
 *   "learning_rate": 0.01,
 *   "optimizer": "adam",
 *   "log_every": 10,
 *   "seed": 5489,
 *   "fill_char": " ",
 *   "clip_norm": 0.0
 * }
 * 
 * Missing keys keep their defaults.
 */
struct TrainingConfig {
    CellType cell = CellType::RNN;
    size_t hidden_size = 12;
    int epochs = 100;
    double learning_rate = 0.01;
    std::string optimizer = "adam";
    int log_every = 10;
    uint32_t seed = 5489;
    char fill_char = ' ';
    double clip_norm = 0.0;   // 0 disables clipping
    
    /**
     * @throws std::invalid_argument if a value is out of range
     */
    void validate() const;
    
    json toJson() const;
    
    /**
     * @throws std::invalid_argument on wrong types or invalid values
     */
    static TrainingConfig fromJson(const json& j);
    
    /**
     * @throws std::runtime_error if the file cannot be read or parsed
     * @throws std::invalid_argument on invalid values
     */
    static TrainingConfig load(const std::string& path);
};

#endif // CHARRNN_CONFIG_H
