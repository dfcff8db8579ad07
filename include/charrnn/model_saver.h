#ifndef CHARRNN_MODEL_SAVER_H
#define CHARRNN_MODEL_SAVER_H

#include "matrix.h"
#include "vocabulary.h"
#include "config.h"
#include "predictor.h"
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

/**
 * @brief Checkpoint directory layout
 * 
 *   model_dir/
 *     ├── config.json       (training config + layer sizes)
 *     ├── vocab.json        (characters in index order)
 *     └── model.bin         (named weight matrices)
 * 
 * model.bin holds a uint64 entry count, then per entry: uint64 name length,
 * the name bytes, uint64 rows, uint64 cols and rows*cols doubles row-major.
 * Integers and doubles are written in host byte order, so a model.bin only
 * loads on a machine with the same endianness and double format.
 */
class ModelSaver {
public:
    /**
     * @throws std::runtime_error if the file cannot be written
     */
    static void saveConfig(const std::string& dir, const json& config);
    
    /**
     * @throws std::runtime_error if the file is missing or not valid JSON
     */
    static json loadConfig(const std::string& dir);
    
    static void saveVocab(const std::string& dir, const Vocabulary& vocabulary);
    static Vocabulary loadVocab(const std::string& dir);
    
    static void saveMatrix(std::ofstream& file, const Matrix& mat);
    
    /**
     * @throws std::runtime_error on a truncated stream, or a rows/cols header
     *         that overflows or claims more doubles than the stream holds
     */
    static Matrix loadMatrix(std::ifstream& file);
    
    static void saveWeights(const std::string& dir, const ParameterList& parameters);
    
    /**
     * @brief Overwrite every parameter with the entry of the same name
     * @throws std::runtime_error if an entry is missing
     * @throws ShapeMismatchError if a stored matrix has the wrong shape
     */
    static void loadWeights(const std::string& dir, const ParameterList& parameters);
};

/**
 * @brief Everything needed to resume sampling or training
 */
template <typename Cell>
struct Checkpoint {
    TrainingConfig config;
    Vocabulary vocabulary;
    RecurrentPredictor<Cell> predictor;
};

/**
 * @brief Write config.json, vocab.json and model.bin into an existing directory
 */
template <typename Cell>
void saveCheckpoint(const std::string& dir,
                    RecurrentPredictor<Cell>& predictor,
                    const Vocabulary& vocabulary,
                    const TrainingConfig& config);

/**
 * @throws std::runtime_error if the stored cell type is not Cell
 */
template <typename Cell>
Checkpoint<Cell> loadCheckpoint(const std::string& dir);

#endif // CHARRNN_MODEL_SAVER_H
