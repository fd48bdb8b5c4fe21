#pragma once
#include "Matrix.hpp"
#include "ForceLaws.hpp"
#include <limits>
#include <optional>
#include <random>
#include <string>
#include <vector>

// One configured pairwise interaction rule. Terms are additive: the net force
// on a cell is the sum of every term's contribution.
struct ForceTerm {
    ForceFunction forceFunc;
    std::vector<double> params;

    // Pairs with dist < minRange or dist > maxRange contribute nothing.
    // Pairs exactly on either bound are kept.
    double minRange = 0.0;
    double maxRange = std::numeric_limits<double>::infinity();

    // Only pairs with a nonzero mask entry interact. No mask: all pairs interact.
    std::optional<InteractionMask> mask;

    // Gaussian noise added to the raw pair force, optionally clipped to
    // [-rndBound, rndBound]. rndBound has no effect without rndStdev.
    std::optional<double> rndStdev;
    std::optional<double> rndBound;

    // Used by computePotentialEnergy only; terms without one are skipped there
    PotentialFunction potentialFunc;
    std::string name;
};

// Build a term from a built-in law, wiring both its force and potential
ForceTerm makeForceTerm(ForceLaw law, std::vector<double> params);

struct StepResult {
    Matrix positions;   // N x 2 (y, x) after the Euler update
    Matrix forces;      // N x 2 (y, x) net force applied during the step
};

// Net (y, x) force on every cell from all force terms
Matrix calculateForces(const Matrix& positions, const std::vector<ForceTerm>& terms,
                       std::mt19937& rng);

// One explicit Euler step: pos_new = pos + deltaT * force
StepResult timestep(const Matrix& positions, const std::vector<ForceTerm>& terms,
                    double deltaT, std::mt19937& rng);

// Same as above, drawing noise from a process-wide engine seeded by std::random_device
StepResult timestep(const Matrix& positions, const std::vector<ForceTerm>& terms, double deltaT);

// Total pairwise potential energy (each unordered pair counted once, no noise)
double computePotentialEnergy(const Matrix& positions, const std::vector<ForceTerm>& terms);
