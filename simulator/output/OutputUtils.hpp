#pragma once
#include <vector>
#include <string>

// Forward declarations
struct OutputData;

// Write OutputData to a CSV file, one row per cell per recorded step.
// Throws std::runtime_error if the file cannot be opened.
void flushCSVOutput(const OutputData &outputData,
                    const std::string &filename,
                    const std::string &metadata);

// Progress bar display
void printProgressBar(int currentStep, int totalSteps);
