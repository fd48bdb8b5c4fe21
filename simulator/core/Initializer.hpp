#pragma once
#include <random>
#include <string>
#include <vector>
#include "Matrix.hpp"

// Structure to hold initialization result and metadata
struct InitResult {
    Matrix positions;            // N x 2 (y, x)
    std::vector<int> cellTypes;  // one type index per cell
    std::string metadata;
};

class Initializer {
public:
    // Uniformly random cells in [0, boxSize)^2, no two closer than minDistance.
    // Cell types are drawn in proportion to typeFractions (empty = all type 0).
    static InitResult initRandomCells(int n,
                                      double boxSize,
                                      double minDistance,
                                      const std::vector<double>& typeFractions,
                                      std::mt19937& gen);

    // rows x cols lattice with the given spacing, each cell displaced by up
    // to +-jitter along both axes.
    static InitResult initGrid(int rows,
                               int cols,
                               double spacing,
                               double jitter,
                               const std::vector<double>& typeFractions,
                               std::mt19937& gen);

    // Read cells from a CSV file with columns y,x[,type]
    static InitResult initFromFile(const std::string& filePath);
};

// Symmetric pair mask that is true for i != j when the unordered pair of cell
// types is {typeA, typeB}.
InteractionMask buildTypePairMask(const std::vector<int>& cellTypes, int typeA, int typeB);
