#include "OutputUtils.hpp"
#include "OutputData.hpp"
#include <fstream>
#include <iostream>
#include <iomanip>
#include <stdexcept>

void flushCSVOutput(const OutputData &outputData,
                   const std::string &filename,
                   const std::string &metadata)
{
    std::ofstream csvFile(filename);
    if (!csvFile) {
        throw std::runtime_error("Could not open CSV file " + filename + " for writing");
    }

    // Write metadata
    csvFile << metadata;
    if (!metadata.empty() && metadata.back() != '\n') csvFile << "\n";

    csvFile << "cell_id,type,time,y,x,fy,fx,energy\n";

    for (size_t t = 0; t < outputData.recordedSteps; ++t) {
        double time = outputData.systemData[t * OutputData::valuesPerSystem + 0];
        double energy = outputData.systemData[t * OutputData::valuesPerSystem + 1];

        for (size_t c = 0; c < outputData.numCells; ++c) {
            size_t idx = (t * outputData.numCells + c) * OutputData::valuesPerCell;

            csvFile << c << ","
                    << outputData.cellTypes[c] << ","
                    << std::fixed << std::setprecision(8)
                    << time << ","
                    << outputData.cellData[idx + 0] << "," << outputData.cellData[idx + 1] << ","
                    << outputData.cellData[idx + 2] << "," << outputData.cellData[idx + 3] << ","
                    << std::setprecision(15)
                    << energy << "\n"; // same for all cells at this step
        }
    }

    csvFile.close();
    std::cout << "CSV output written to " << filename << "\n";
}

void printProgressBar(int currentStep, int totalSteps)
{
    double progress = (totalSteps == 0) ? 0.0 : static_cast<double>(currentStep) / totalSteps;
    int barWidth = 50;
    int pos = static_cast<int>(barWidth * progress);
    std::cout << "\r[";
    for (int j = 0; j < barWidth; ++j) {
        if (j < pos) std::cout << "=";
        else if (j == pos) std::cout << ">";
        else std::cout << " ";
    }
    std::cout << "] " << int(progress * 100.0) << " %";
    std::cout.flush();
}
