#include "System.hpp"
#include "ConfigParser.hpp"
#include <iostream>
#include <filesystem>
#include <sstream>
#include <chrono>
#include <omp.h>
#include <string>

namespace {
    std::string describeForceTerms(const std::vector<ForceTerm>& terms)
    {
        std::ostringstream s;
        s << "# force terms: " << terms.size() << "\n";
        for (size_t i = 0; i < terms.size(); ++i) {
            const auto& t = terms[i];
            s << "#   [" << i << "] " << t.name << " params=(";
            for (size_t k = 0; k < t.params.size(); ++k) {
                if (k) s << ", ";
                s << t.params[k];
            }
            s << ") range=[" << t.minRange << ", " << t.maxRange << "]";
            if (t.mask) s << " masked";
            if (t.rndStdev) s << " noise=" << *t.rndStdev;
            if (t.rndStdev && t.rndBound) s << " bound=" << *t.rndBound;
            s << "\n";
        }
        return s.str();
    }
}

int main(int argc, char** argv)
{
    try
    {
        std::string configPath = (argc > 1) ? argv[1] : "config.json";

        // Load configuration from JSON file
        auto cfg = parseConfig(configPath);

        // Set the number of threads for OpenMP
        omp_set_num_threads(cfg.threads);
        std::cout << "OpenMP is configured to use " << cfg.threads << " threads.\n";

        unsigned int seed = cfg.seed ? *cfg.seed : std::random_device{}();
        std::mt19937 gen(seed);

        auto init_start = std::chrono::high_resolution_clock::now();
        InitResult init = createInitializerFromConfig(cfg, gen);
        auto init_end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double> init_elapsed = init_end - init_start;
        std::cout << "Initialization time: " << init_elapsed.count() << " seconds\n";

        std::vector<ForceTerm> terms = createForceTermsFromConfig(cfg, init.cellTypes);

        std::string metadata = init.metadata;
        metadata += "# seed: " + std::to_string(seed) + "\n";
        metadata += "# dt: " + std::to_string(cfg.deltaT) + "\n";
        metadata += "# steps: " + std::to_string(cfg.steps) + "\n";
        metadata += "# print frequency (steps): " + std::to_string(cfg.outputEvery) + "\n";
        metadata += "# integration method: Euler\n";
        metadata += describeForceTerms(terms);

        std::string outputModeName = (cfg.outputMode == OutputMode::BENCHMARK) ? "None (Benchmark)" : "CSV File";
        metadata += "# output mode: " + outputModeName + "\n";

        std::string unifiedOutputFile = cfg.outputDir + cfg.outputFile;
        if (cfg.outputMode == OutputMode::FILE_CSV && !cfg.outputDir.empty()) {
            std::filesystem::create_directories(cfg.outputDir);
        }

        std::cout << "Initialization mode: " << cfg.initSelected << "\n";
        std::cout << "Cells: " << init.positions.rows << "\n";
        std::cout << "Force terms: " << terms.size() << "\n";
        std::cout << "Output mode: " << outputModeName << "\n";

        CellSystem sys(std::move(init), std::move(terms), gen, cfg.outputMode);

        auto start = std::chrono::high_resolution_clock::now();
        sys.runSimulation(cfg.deltaT, cfg.steps, cfg.outputEvery, unifiedOutputFile, metadata);
        auto end = std::chrono::high_resolution_clock::now();

        std::chrono::duration<double> elapsed = end - start;
        std::cout << "Simulation time: " << elapsed.count() << " seconds" << std::endl;
        return 0;
    }
    catch(const std::exception &ex)
    {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
