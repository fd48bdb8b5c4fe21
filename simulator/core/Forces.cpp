#include "Forces.hpp"
#include "Distances.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <omp.h>

namespace {
    std::string shapeString(const Matrix& m)
    {
        return std::to_string(m.rows) + "x" + std::to_string(m.cols);
    }

    // Raw N x N force matrix of a term with noise, range cutoffs and mask applied.
    // Noise is drawn sequentially in row-major order so a given seed yields the
    // same forces whatever the thread count.
    Matrix evaluateTerm(const ForceTerm& term, const PairDistances& d, std::mt19937& rng)
    {
        const size_t n = d.dist.rows;

        if (!term.forceFunc) {
            throw std::runtime_error("Force term '" + term.name + "' has no force function");
        }

        Matrix forces = term.forceFunc(d.dist, term.params);
        if (!forces.sameShape(n, n)) {
            throw std::runtime_error("Force term '" + term.name + "' returned a "
                                     + shapeString(forces) + " matrix, expected "
                                     + shapeString(d.dist));
        }

        if (term.rndStdev && *term.rndStdev < 0.0) {
            throw std::runtime_error("Force term '" + term.name + "' has a negative noise stdev");
        }
        if (term.rndStdev && term.rndBound && *term.rndBound < 0.0) {
            throw std::runtime_error("Force term '" + term.name + "' has a negative noise bound");
        }

        // A zero stdev adds exactly nothing and draws nothing from rng
        if (term.rndStdev && *term.rndStdev > 0.0) {
            std::normal_distribution<double> noise(0.0, *term.rndStdev);
            for (auto& f : forces.data) {
                double r = noise(rng);
                if (term.rndBound) {
                    r = std::min(std::max(r, -*term.rndBound), *term.rndBound);
                }
                f += r;
            }
        }

        if (term.mask && !term.mask->sameShape(n, n)) {
            throw std::runtime_error("Force term '" + term.name + "' has a "
                                     + std::to_string(term.mask->rows) + "x"
                                     + std::to_string(term.mask->cols) + " mask, expected "
                                     + shapeString(d.dist));
        }

        #pragma omp parallel for schedule(static)
        for (size_t i = 0; i < n; ++i) {
            double* fRow = forces.row(i);
            const double* dRow = d.dist.row(i);
            for (size_t j = 0; j < n; ++j) {
                if (dRow[j] < term.minRange || dRow[j] > term.maxRange) {
                    fRow[j] = 0.0;
                }
            }
            if (term.mask) {
                const std::uint8_t* mRow = term.mask->row(i);
                for (size_t j = 0; j < n; ++j) {
                    if (!mRow[j]) fRow[j] = 0.0;
                }
            }
        }

        return forces;
    }
}

ForceTerm makeForceTerm(ForceLaw law, std::vector<double> params)
{
    ForceTerm term;
    term.forceFunc = forceFunctionFor(law);
    term.potentialFunc = potentialFunctionFor(law);
    term.params = std::move(params);
    term.name = forceLawName(law);
    return term;
}

Matrix calculateForces(const Matrix& positions, const std::vector<ForceTerm>& terms,
                       std::mt19937& rng)
{
    PairDistances d = computeDistances(positions);
    const size_t n = positions.rows;

    Matrix force(n, 2);

    for (const auto& term : terms) {
        Matrix pairForces = evaluateTerm(term, d, rng);

        // Decompose along the displacement and sum over neighbours.
        // Self-pairs are skipped: their distance is zero and they stay zero.
        #pragma omp parallel for schedule(static)
        for (size_t i = 0; i < n; ++i) {
            const double* fRow = pairForces.row(i);
            const double* xRow = d.xDist.row(i);
            const double* yRow = d.yDist.row(i);
            const double* dRow = d.dist.row(i);

            double fy = 0.0, fx = 0.0;
            for (size_t j = 0; j < n; ++j) {
                if (i == j) continue;
                fy += fRow[j] * yRow[j] / dRow[j];
                fx += fRow[j] * xRow[j] / dRow[j];
            }

            force(i, COL_Y) += fy;
            force(i, COL_X) += fx;
        }
    }

    return force;
}

StepResult timestep(const Matrix& positions, const std::vector<ForceTerm>& terms,
                    double deltaT, std::mt19937& rng)
{
    StepResult result{positions, calculateForces(positions, terms, rng)};

    for (size_t k = 0; k < result.positions.data.size(); ++k) {
        result.positions.data[k] += deltaT * result.forces.data[k];
    }

    return result;
}

StepResult timestep(const Matrix& positions, const std::vector<ForceTerm>& terms, double deltaT)
{
    static std::mt19937 gen{std::random_device{}()};
    return timestep(positions, terms, deltaT, gen);
}

double computePotentialEnergy(const Matrix& positions, const std::vector<ForceTerm>& terms)
{
    PairDistances d = computeDistances(positions);
    const size_t n = positions.rows;
    double total = 0.0;

    for (const auto& term : terms) {
        if (!term.potentialFunc) continue;

        Matrix pot = term.potentialFunc(d.dist, term.params);
        if (!pot.sameShape(n, n)) {
            throw std::runtime_error("Potential of term '" + term.name + "' returned a "
                                     + shapeString(pot) + " matrix, expected "
                                     + shapeString(d.dist));
        }
        if (term.mask && !term.mask->sameShape(n, n)) {
            throw std::runtime_error("Force term '" + term.name + "' has a mask of the wrong shape");
        }

        for (size_t i = 0; i < n; ++i) {
            for (size_t j = i + 1; j < n; ++j) {
                double dij = d.dist(i, j);
                if (dij < term.minRange || dij > term.maxRange) continue;
                if (term.mask && !(*term.mask)(i, j)) continue;
                total += pot(i, j);
            }
        }
    }

    return total;
}
