#include "Distances.hpp"
#include <cmath>
#include <stdexcept>
#include <string>
#include <omp.h>

PairDistances computeDistances(const Matrix& positions)
{
    if (positions.cols != 2 && !(positions.rows == 0 && positions.cols == 0)) {
        throw std::invalid_argument("Positions must have 2 columns (y, x), got "
                                    + std::to_string(positions.cols));
    }

    const size_t n = positions.rows;
    PairDistances d{Matrix(n, n), Matrix(n, n), Matrix(n, n)};

    #pragma omp parallel for schedule(static)
    for (size_t i = 0; i < n; ++i) {
        const double iy = positions(i, COL_Y);
        const double ix = positions(i, COL_X);

        double* xRow = d.xDist.row(i);
        double* yRow = d.yDist.row(i);
        double* dRow = d.dist.row(i);

        for (size_t j = 0; j < n; ++j) {
            double dx = positions(j, COL_X) - ix;
            double dy = positions(j, COL_Y) - iy;
            xRow[j] = dx;
            yRow[j] = dy;
            dRow[j] = std::sqrt(dx*dx + dy*dy);
        }
    }

    return d;
}
