#ifndef CHARRNN_PARAMETER_H
#define CHARRNN_PARAMETER_H

#include "matrix.h"
#include <string>
#include <vector>

/**
 * @brief Named view of one trainable matrix and its gradient accumulator
 * 
 * The name doubles as the optimizer state key and the checkpoint entry name,
 * so it must be unique within a model ("cell.W_xh", "projection.b_y", ...).
 */
struct ParameterRef {
    std::string name;
    Matrix* value;
    Matrix* gradient;
};

using ParameterList = std::vector<ParameterRef>;

#endif // CHARRNN_PARAMETER_H
