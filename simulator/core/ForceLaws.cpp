#include "ForceLaws.hpp"
#include <cmath>
#include <stdexcept>

namespace {
    void requireParams(const std::vector<double>& params, size_t expected, const char* law)
    {
        if (params.size() < expected) {
            throw std::invalid_argument(std::string(law) + " expects " + std::to_string(expected)
                                        + " parameters, got " + std::to_string(params.size()));
        }
    }

    // Apply a scalar formula to every entry of the distance matrix
    template <typename Fn>
    Matrix mapDistances(const Matrix& dist, Fn fn)
    {
        Matrix out(dist.rows, dist.cols);
        for (size_t k = 0; k < dist.data.size(); ++k) {
            out.data[k] = fn(dist.data[k]);
        }
        return out;
    }
}

//------------------------------------------------------------------------------
// Forces
//------------------------------------------------------------------------------

// Hooke's law spring: F = k * (d - d0)
Matrix forceHooke(const Matrix& dist, const std::vector<double>& params)
{
    requireParams(params, 2, "HOOKE");
    const double dist0 = params[0];
    const double k = params[1];
    return mapDistances(dist, [=](double d) { return k * (d - dist0); });
}

// Derivative of the exponential decay landscape pot0 * exp(-e (d - d0))
Matrix forceExpDecay(const Matrix& dist, const std::vector<double>& params)
{
    requireParams(params, 3, "EXP_DECAY");
    const double dist0 = params[0];
    const double pot0 = params[1];
    const double e = params[2];
    return mapDistances(dist, [=](double d) { return -e * pot0 * std::exp(-e * (d - dist0)); });
}

Matrix forceExpNeg(const Matrix& dist, const std::vector<double>& params)
{
    requireParams(params, 3, "EXP_NEG");
    const double dist0 = params[0];
    const double pot0 = params[1];
    const double e = params[2];
    return mapDistances(dist, [=](double d) { return e * pot0 * std::exp(-e * (d - dist0)); });
}

// Anharmonic oscillator. F = 0 at d = 0.
Matrix forceAnharmonic(const Matrix& dist, const std::vector<double>& params)
{
    requireParams(params, 5, "ANHARMONIC");
    const double dist0 = params[0];
    const double pot0 = params[1];
    const double m = params[2];
    const double e1 = params[3];
    const double e2 = params[4];
    return mapDistances(dist, [=](double d) {
        if (!(d > 0.0)) return 0.0;
        double r = dist0 / d;
        return pot0 * (e1 * std::pow(r, e1) - m * e2 * std::pow(r, e2)) / d;
    });
}

//------------------------------------------------------------------------------
// Potentials
//------------------------------------------------------------------------------

Matrix potentialHooke(const Matrix& dist, const std::vector<double>& params)
{
    requireParams(params, 2, "HOOKE");
    const double dist0 = params[0];
    const double k = params[1];
    return mapDistances(dist, [=](double d) { return 0.5 * k * (d - dist0) * (d - dist0); });
}

// Decays from pot0 at d0 toward 0
Matrix potentialExpDecay(const Matrix& dist, const std::vector<double>& params)
{
    requireParams(params, 3, "EXP_DECAY");
    const double dist0 = params[0];
    const double pot0 = params[1];
    const double e = params[2];
    return mapDistances(dist, [=](double d) { return pot0 * std::exp(-e * (d - dist0)); });
}

// Rises from -pot0 at d0 toward 0
Matrix potentialExpNeg(const Matrix& dist, const std::vector<double>& params)
{
    requireParams(params, 3, "EXP_NEG");
    const double dist0 = params[0];
    const double pot0 = params[1];
    const double e = params[2];
    return mapDistances(dist, [=](double d) { return pot0 - pot0 * std::exp(-e * (d - dist0)); });
}

// E = -pot0 * [(d0/d)^e1 - m (d0/d)^e2] for d > 0, otherwise 0.
// Minimum sits at d0 for m = 2 and e1/e2 = 2.
Matrix potentialAnharmonic(const Matrix& dist, const std::vector<double>& params)
{
    requireParams(params, 5, "ANHARMONIC");
    const double dist0 = params[0];
    const double pot0 = params[1];
    const double m = params[2];
    const double e1 = params[3];
    const double e2 = params[4];
    return mapDistances(dist, [=](double d) {
        if (!(d > 0.0)) return 0.0;
        double r = dist0 / d;
        return -pot0 * (std::pow(r, e1) - m * std::pow(r, e2));
    });
}

//------------------------------------------------------------------------------
// Dispatch
//------------------------------------------------------------------------------

ForceFunction forceFunctionFor(ForceLaw law)
{
    switch (law) {
        case ForceLaw::HOOKE:
            return forceHooke;
        case ForceLaw::EXP_DECAY:
            return forceExpDecay;
        case ForceLaw::EXP_NEG:
            return forceExpNeg;
        case ForceLaw::ANHARMONIC:
            return forceAnharmonic;
        default:
            throw std::runtime_error("Unknown force law");
    }
}

PotentialFunction potentialFunctionFor(ForceLaw law)
{
    switch (law) {
        case ForceLaw::HOOKE:
            return potentialHooke;
        case ForceLaw::EXP_DECAY:
            return potentialExpDecay;
        case ForceLaw::EXP_NEG:
            return potentialExpNeg;
        case ForceLaw::ANHARMONIC:
            return potentialAnharmonic;
        default:
            throw std::runtime_error("Unknown force law");
    }
}

size_t forceLawParamCount(ForceLaw law)
{
    switch (law) {
        case ForceLaw::HOOKE:      return 2;
        case ForceLaw::EXP_DECAY:  return 3;
        case ForceLaw::EXP_NEG:    return 3;
        case ForceLaw::ANHARMONIC: return 5;
        default:
            throw std::runtime_error("Unknown force law");
    }
}

ForceLaw parseForceLaw(const std::string& name)
{
    if (name == "HOOKE") {
        return ForceLaw::HOOKE;
    } else if (name == "EXP_DECAY") {
        return ForceLaw::EXP_DECAY;
    } else if (name == "EXP_NEG") {
        return ForceLaw::EXP_NEG;
    } else if (name == "ANHARMONIC") {
        return ForceLaw::ANHARMONIC;
    }
    throw std::runtime_error("Unknown force law: " + name);
}

std::string forceLawName(ForceLaw law)
{
    switch (law) {
        case ForceLaw::HOOKE:      return "HOOKE";
        case ForceLaw::EXP_DECAY:  return "EXP_DECAY";
        case ForceLaw::EXP_NEG:    return "EXP_NEG";
        case ForceLaw::ANHARMONIC: return "ANHARMONIC";
    }
    return "UNKNOWN";
}
