#pragma once

#include <vector>
#include <cstddef>
#include "Matrix.hpp"

// Recorded trajectory of a simulation run in flat, preallocated buffers
struct OutputData {
    // Cell data - one record per cell per recorded step
    std::vector<double> cellData;
    static constexpr size_t valuesPerCell = 4;    // y, x, fy, fx

    // System data - one record per recorded step
    std::vector<double> systemData;
    static constexpr size_t valuesPerSystem = 2;  // time, potential energy

    // Static data that doesn't change during the simulation
    std::vector<int> cellTypes;

    size_t numCells = 0;
    size_t numTimeSteps = 0;    // capacity in recorded steps
    size_t recordedSteps = 0;

    OutputData() = default;

    OutputData(size_t cells, size_t timeSteps, const std::vector<int>& types)
        : cellData(cells * timeSteps * valuesPerCell, 0.0),
          systemData(timeSteps * valuesPerSystem, 0.0),
          cellTypes(types),
          numCells(cells),
          numTimeSteps(timeSteps)
    {
        cellTypes.resize(cells, 0);
    }

    void setSystemData(size_t timeIdx, double time, double energy) {
        systemData[timeIdx * valuesPerSystem + 0] = time;
        systemData[timeIdx * valuesPerSystem + 1] = energy;
    }

    void setCellData(size_t cell, size_t timeIdx, const Matrix& positions, const Matrix& forces) {
        size_t idx = (timeIdx * numCells + cell) * valuesPerCell;
        cellData[idx + 0] = positions(cell, COL_Y);
        cellData[idx + 1] = positions(cell, COL_X);
        cellData[idx + 2] = forces(cell, COL_Y);
        cellData[idx + 3] = forces(cell, COL_X);
    }

    // Store one full snapshot; returns false once capacity is exhausted
    bool record(double time, double energy, const Matrix& positions, const Matrix& forces) {
        if (recordedSteps >= numTimeSteps) return false;
        setSystemData(recordedSteps, time, energy);
        for (size_t c = 0; c < numCells; ++c) {
            setCellData(c, recordedSteps, positions, forces);
        }
        ++recordedSteps;
        return true;
    }
};
