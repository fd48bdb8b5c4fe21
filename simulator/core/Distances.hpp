#pragma once
#include "Matrix.hpp"

// Pairwise displacement and distance between all cells.
// xDist(i,j) and yDist(i,j) point from cell i toward cell j.
struct PairDistances {
    Matrix xDist;
    Matrix yDist;
    Matrix dist;
};

// Compute all pairwise displacements and Euclidean distances from an N x 2
// (y, x) position array. Diagonal entries are exactly zero.
// Throws std::invalid_argument if positions do not have two columns.
PairDistances computeDistances(const Matrix& positions);
