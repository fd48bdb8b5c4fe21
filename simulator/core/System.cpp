#include "System.hpp"
#include "OutputUtils.hpp"
#include "OutputData.hpp"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <stdexcept>

namespace
{
    // Simple profiling utility
    class ScopedTimer {
    private:
        std::chrono::high_resolution_clock::time_point start;
        std::string name;
        bool active;

    public:
        ScopedTimer(const std::string& name, bool active = true)
            : start(std::chrono::high_resolution_clock::now()), name(name), active(active) {}

        ~ScopedTimer() {
            if (active) {
                auto end = std::chrono::high_resolution_clock::now();
                std::chrono::duration<double> elapsed = end - start;
                std::cout << std::fixed << std::setprecision(5)
                          << "[Profile] " << name << ": "
                          << elapsed.count() << " seconds" << std::endl;
            }
        }
    };

    // Need to be enabled/disabled for production use
    const bool ENABLE_PROFILING = true;
}

CellSystem::CellSystem(InitResult&& init, std::vector<ForceTerm> terms, std::mt19937 gen,
                       OutputMode outMode)
    : positions(std::move(init.positions)),
      lastForces(positions.rows, 2),
      cellTypes(std::move(init.cellTypes)),
      forceTerms(std::move(terms)),
      rng(gen),
      outputMode(outMode)
{
    if (positions.cols != 2 && positions.rows != 0) {
        throw std::runtime_error("Cell positions must have 2 columns (y, x)");
    }
    cellTypes.resize(positions.rows, 0);
}

double CellSystem::computeTotalEnergy() const
{
    return computePotentialEnergy(positions, forceTerms);
}

void CellSystem::performIntegrationStep(double dt)
{
    StepResult step = timestep(positions, forceTerms, dt, rng);
    positions = std::move(step.positions);
    lastForces = std::move(step.forces);
    m_simulationTime += dt;
}

void CellSystem::runSimulation(double dt, int steps, int stepFreq,
                               const std::string &outputFilename,
                               const std::string &metadata)
{
    if (steps < 0) {
        throw std::runtime_error("Number of steps must be non-negative");
    }

    if (outputMode == OutputMode::BENCHMARK) {
        runBenchmark(dt, steps);
        return;
    }

    if (stepFreq < 1) {
        throw std::runtime_error("Output frequency must be at least 1 step");
    }

    ScopedTimer timer("runSimulation", ENABLE_PROFILING);

    OutputData outputData(positions.rows, steps / stepFreq + 1, cellTypes);

    // Store initial state
    outputData.record(m_simulationTime, computeTotalEnergy(), positions, lastForces);

    int printCounter = 0;
    for (int i = 0; i < steps; ++i) {
        performIntegrationStep(dt);

        if (++printCounter >= stepFreq) {
            outputData.record(m_simulationTime, computeTotalEnergy(), positions, lastForces);
            printCounter = 0;
        }

        printProgressBar(i + 1, steps);
    }
    std::cout << std::endl;

    flushCSVOutput(outputData, outputFilename, metadata);
}

void CellSystem::runBenchmark(double dt, int steps)
{
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < steps; ++i) {
        performIntegrationStep(dt);
    }

    auto end = std::chrono::high_resolution_clock::now();
    double elapsed_seconds = std::chrono::duration<double>(end - start).count();

    if (elapsed_seconds > 0.0) {
        double performance = steps / elapsed_seconds; // steps per second
        std::cout << "Benchmark completed in " << elapsed_seconds << " seconds." << std::endl;
        std::cout << "Performance: " << performance << " steps/second, "
                  << (performance * positions.rows) / 1e6 << " million cell-steps/second" << std::endl;
    }
}
