#include "ConfigParser.hpp"
#include <fstream>
#include <stdexcept>

namespace {
    // Fetch a required key, reporting the full path on failure
    template <typename T>
    T require(const json& j, const std::string& key, const std::string& where)
    {
        if (!j.is_object() || !j.contains(key)) {
            throw std::runtime_error("Missing config key: " + where + key);
        }
        try {
            return j.at(key).get<T>();
        } catch (const json::exception& ex) {
            throw std::runtime_error("Invalid value for config key " + where + key + ": " + ex.what());
        }
    }

    template <typename T>
    std::optional<T> optionalKey(const json& j, const std::string& key, const std::string& where)
    {
        if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
        return require<T>(j, key, where);
    }

    std::optional<double> nonNegativeKey(const json& j, const std::string& key, const std::string& where)
    {
        auto value = optionalKey<double>(j, key, where);
        if (value && *value < 0.0) {
            throw std::runtime_error("Config key " + where + key + " must be non-negative");
        }
        return value;
    }

    std::vector<double> typeFractionsFrom(const json& params, const std::string& where)
    {
        return optionalKey<std::vector<double>>(params, "typeFractions", where).value_or(std::vector<double>{});
    }
}

Config parseConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& ex) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + ex.what());
    }
    return parseConfigJson(j);
}

Config parseConfigJson(const json& j) {
    Config cfg;

    // Basic parameters
    cfg.threads = optionalKey<int>(j, "threads", "").value_or(1);
    cfg.seed = optionalKey<unsigned int>(j, "seed", "");
    cfg.deltaT = require<double>(j, "deltaT", "");
    cfg.steps = require<int>(j, "steps", "");
    cfg.outputEvery = optionalKey<int>(j, "outputEvery", "").value_or(1);

    if (cfg.threads < 1) throw std::runtime_error("threads must be at least 1");
    if (cfg.steps < 0) throw std::runtime_error("steps must be non-negative");
    if (cfg.outputEvery < 1) throw std::runtime_error("outputEvery must be at least 1");

    json output = j.contains("output") ? j["output"] : json::object();
    cfg.outputDir = optionalKey<std::string>(output, "dir", "output.").value_or("./");
    cfg.outputFile = optionalKey<std::string>(output, "file", "output.").value_or("cells.csv");

    // Parse output mode
    std::string outMode = optionalKey<std::string>(j, "outputMode", "").value_or("FILE_CSV");
    if (outMode == "FILE_CSV") {
        cfg.outputMode = OutputMode::FILE_CSV;
    } else if (outMode == "BENCHMARK") {
        cfg.outputMode = OutputMode::BENCHMARK;
    } else {
        throw std::runtime_error("Unknown output mode: " + outMode);
    }

    // Initializer block
    if (!j.contains("init")) throw std::runtime_error("Missing config key: init");
    cfg.initSelected = require<std::string>(j["init"], "selected", "init.");
    if (!j["init"].contains(cfg.initSelected)) {
        throw std::runtime_error("Missing config key: init." + cfg.initSelected);
    }
    cfg.initParams = j["init"][cfg.initSelected];

    // Force terms are validated here so errors surface before the run starts
    cfg.forceTerms = j.contains("forceTerms") ? j["forceTerms"] : json::array();
    if (!cfg.forceTerms.is_array()) {
        throw std::runtime_error("Config key forceTerms must be an array");
    }
    for (size_t i = 0; i < cfg.forceTerms.size(); ++i) {
        const json& t = cfg.forceTerms[i];
        std::string where = "forceTerms[" + std::to_string(i) + "].";
        ForceLaw law = parseForceLaw(require<std::string>(t, "law", where));
        auto params = require<std::vector<double>>(t, "params", where);
        if (params.size() != forceLawParamCount(law)) {
            throw std::runtime_error("Force term " + where + "params: " + forceLawName(law) + " expects "
                                     + std::to_string(forceLawParamCount(law)) + " parameters, got "
                                     + std::to_string(params.size()));
        }
        if (t.contains("types")) {
            auto types = require<std::vector<int>>(t, "types", where);
            if (types.size() != 2) {
                throw std::runtime_error("Config key " + where + "types must list exactly 2 cell types");
            }
        }
        nonNegativeKey(t, "rndStdev", where);
        nonNegativeKey(t, "rndBound", where);
    }

    return cfg;
}

InitResult createInitializerFromConfig(const Config& cfg, std::mt19937& gen) {
    const json& p = cfg.initParams;
    const std::string where = "init." + cfg.initSelected + ".";

    if (cfg.initSelected == "FROM_FILE") {
        std::string filePath = require<std::string>(p, "filePath", where);
        return Initializer::initFromFile(filePath);
    }
    else if (cfg.initSelected == "RANDOM") {
        int nCells = require<int>(p, "nCells", where);
        double boxSize = require<double>(p, "boxSize", where);
        double minDistance = optionalKey<double>(p, "minDistance", where).value_or(0.0);
        return Initializer::initRandomCells(nCells, boxSize, minDistance, typeFractionsFrom(p, where), gen);
    }
    else if (cfg.initSelected == "GRID") {
        int rows = require<int>(p, "rows", where);
        int cols = require<int>(p, "cols", where);
        double spacing = require<double>(p, "spacing", where);
        double jitter = optionalKey<double>(p, "jitter", where).value_or(0.0);
        return Initializer::initGrid(rows, cols, spacing, jitter, typeFractionsFrom(p, where), gen);
    }

    throw std::runtime_error("Unknown initialization method: " + cfg.initSelected);
}

std::vector<ForceTerm> createForceTermsFromConfig(const Config& cfg, const std::vector<int>& cellTypes) {
    std::vector<ForceTerm> terms;

    for (size_t i = 0; i < cfg.forceTerms.size(); ++i) {
        const json& t = cfg.forceTerms[i];
        std::string where = "forceTerms[" + std::to_string(i) + "].";

        ForceLaw law = parseForceLaw(require<std::string>(t, "law", where));
        ForceTerm term = makeForceTerm(law, require<std::vector<double>>(t, "params", where));

        term.name = optionalKey<std::string>(t, "name", where).value_or(forceLawName(law));
        term.minRange = optionalKey<double>(t, "minRange", where).value_or(term.minRange);
        term.maxRange = optionalKey<double>(t, "maxRange", where).value_or(term.maxRange);
        term.rndStdev = nonNegativeKey(t, "rndStdev", where);
        term.rndBound = nonNegativeKey(t, "rndBound", where);

        if (t.contains("types")) {
            auto types = require<std::vector<int>>(t, "types", where);
            term.mask = buildTypePairMask(cellTypes, types.at(0), types.at(1));
        }

        terms.push_back(std::move(term));
    }

    return terms;
}
