#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

// Dense row-major matrix used for positions (N x 2), pairwise quantities (N x N)
// and force fields. Storage is a single contiguous buffer so all-pairs loops
// can walk it row by row.
template <typename T>
struct DenseMatrix {
    size_t rows;
    size_t cols;
    std::vector<T> data;

    DenseMatrix() : rows(0), cols(0) {}

    DenseMatrix(size_t nRows, size_t nCols, T value = T())
        : rows(nRows), cols(nCols), data(nRows * nCols, value) {}

    T& operator()(size_t i, size_t j) { return data[i * cols + j]; }
    const T& operator()(size_t i, size_t j) const { return data[i * cols + j]; }

    T* row(size_t i) { return data.data() + i * cols; }
    const T* row(size_t i) const { return data.data() + i * cols; }

    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }

    bool sameShape(size_t nRows, size_t nCols) const {
        return rows == nRows && cols == nCols;
    }

    void fill(T value) {
        for (auto& v : data) v = value;
    }
};

using Matrix = DenseMatrix<double>;

// Pair masks use bytes rather than bool to keep contiguous, addressable storage
using InteractionMask = DenseMatrix<std::uint8_t>;

// Column layout of position and force arrays: (y, x)
constexpr size_t COL_Y = 0;
constexpr size_t COL_X = 1;
