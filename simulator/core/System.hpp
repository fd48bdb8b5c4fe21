#pragma once

#include "Forces.hpp"
#include "Initializer.hpp"
#include "Matrix.hpp"
#include "OutputModes.hpp"
#include <random>
#include <string>
#include <vector>

// Owns the state of one simulation run and drives the fixed-timestep loop
class CellSystem
{
public:
    CellSystem(InitResult&& init, std::vector<ForceTerm> terms, std::mt19937 gen,
               OutputMode outMode = OutputMode::FILE_CSV);

    CellSystem(const CellSystem&) = delete;
    CellSystem& operator=(const CellSystem&) = delete;
    CellSystem(CellSystem&&) = default;
    CellSystem& operator=(CellSystem&&) = default;

    // Total pairwise potential energy of the current configuration
    double computeTotalEnergy() const;

    // Run with the configured output mode. In FILE_CSV mode the state is
    // recorded at step 0 and every stepFreq steps, then written to outputFilename.
    void runSimulation(double dt, int steps, int stepFreq,
                       const std::string &outputFilename,
                       const std::string &metadata);

    // Steps only, no recording or energy evaluation
    void runBenchmark(double dt, int steps);

    void performIntegrationStep(double dt);

    const Matrix& getPositions() const { return positions; }
    const Matrix& getLastForces() const { return lastForces; }
    const std::vector<int>& getCellTypes() const { return cellTypes; }
    double getSimulationTime() const { return m_simulationTime; }

private:
    Matrix positions;
    Matrix lastForces;
    std::vector<int> cellTypes;
    std::vector<ForceTerm> forceTerms;
    std::mt19937 rng;
    OutputMode outputMode{OutputMode::FILE_CSV};

    double m_simulationTime = 0.0;
};
