#pragma once
#include "Matrix.hpp"
#include <functional>
#include <string>
#include <vector>

// Uniform signature of force and potential laws: the full pairwise distance
// matrix plus an ordered list of extra parameters, returning a matrix of the
// same shape.
using ForceFunction = std::function<Matrix(const Matrix& dist, const std::vector<double>& params)>;
using PotentialFunction = std::function<Matrix(const Matrix& dist, const std::vector<double>& params)>;

// Built-in force laws
enum class ForceLaw {
    HOOKE,          // spring: params (dist0, k)
    EXP_DECAY,      // exponential decay: params (dist0, pot0, e)
    EXP_NEG,        // negative exponential: params (dist0, pot0, e)
    ANHARMONIC      // anharmonic oscillator: params (dist0, pot0, m, e1, e2)
};

// Force laws F = f(dist, ...)
Matrix forceHooke(const Matrix& dist, const std::vector<double>& params);
Matrix forceExpDecay(const Matrix& dist, const std::vector<double>& params);
Matrix forceExpNeg(const Matrix& dist, const std::vector<double>& params);
Matrix forceAnharmonic(const Matrix& dist, const std::vector<double>& params);

// Potential energy landscapes E = f(dist, ...) matching the force laws above
Matrix potentialHooke(const Matrix& dist, const std::vector<double>& params);
Matrix potentialExpDecay(const Matrix& dist, const std::vector<double>& params);
Matrix potentialExpNeg(const Matrix& dist, const std::vector<double>& params);
Matrix potentialAnharmonic(const Matrix& dist, const std::vector<double>& params);

// Dispatchers
ForceFunction forceFunctionFor(ForceLaw law);
PotentialFunction potentialFunctionFor(ForceLaw law);
size_t forceLawParamCount(ForceLaw law);

ForceLaw parseForceLaw(const std::string& name);
std::string forceLawName(ForceLaw law);
