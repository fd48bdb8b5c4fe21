#pragma once

#include <optional>
#include <random>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "Initializer.hpp"
#include "Forces.hpp"
#include "OutputModes.hpp"

using json = nlohmann::json;

// Structure to hold all configuration parameters
struct Config {
    std::string initSelected;
    json initParams;
    json forceTerms;
    int threads;
    std::optional<unsigned int> seed;
    double deltaT;
    int steps;
    int outputEvery;
    std::string outputDir;
    std::string outputFile;
    OutputMode outputMode;
};

// Parse the JSON configuration file
Config parseConfig(const std::string& path);

// Parse an already loaded JSON document
Config parseConfigJson(const json& j);

// Create the initial cell population selected in the config
InitResult createInitializerFromConfig(const Config& cfg, std::mt19937& gen);

// Build the force terms, resolving "types" pairs into masks over cellTypes
std::vector<ForceTerm> createForceTermsFromConfig(const Config& cfg, const std::vector<int>& cellTypes);
