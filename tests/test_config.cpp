#include <cassert>
#include <cmath>
#include <random>
#include <stdexcept>
#include <string>
#include "ConfigParser.hpp"

namespace {
    json baseConfig()
    {
        return json::parse(R"({
            "threads": 2,
            "seed": 7,
            "deltaT": 0.1,
            "steps": 10,
            "outputEvery": 5,
            "output": { "dir": "./out/", "file": "run.csv" },
            "init": {
                "selected": "GRID",
                "GRID": { "rows": 2, "cols": 3, "spacing": 1.0, "typeFractions": [1.0, 1.0] }
            },
            "forceTerms": [
                { "law": "HOOKE", "params": [1.0, 0.5], "maxRange": 2.0, "types": [0, 1] },
                { "name": "push", "law": "EXP_DECAY", "params": [1.0, 1.0, 2.0],
                  "rndStdev": 0.1, "rndBound": 0.2 }
            ]
        })");
    }

    bool failsWith(const json& j, const std::string& fragment)
    {
        try {
            parseConfigJson(j);
        } catch (const std::runtime_error& ex) {
            return std::string(ex.what()).find(fragment) != std::string::npos;
        }
        return false;
    }
}

void test_parse_full_config()
{
    Config cfg = parseConfigJson(baseConfig());
    assert(cfg.threads == 2);
    assert(cfg.seed && *cfg.seed == 7);
    assert(cfg.deltaT == 0.1);
    assert(cfg.steps == 10);
    assert(cfg.outputEvery == 5);
    assert(cfg.outputDir == "./out/");
    assert(cfg.outputFile == "run.csv");
    assert(cfg.outputMode == OutputMode::FILE_CSV);
    assert(cfg.initSelected == "GRID");
    assert(cfg.forceTerms.size() == 2);
}

void test_defaults()
{
    json j = baseConfig();
    j.erase("threads");
    j.erase("seed");
    j.erase("outputEvery");
    j.erase("output");
    j["outputMode"] = "BENCHMARK";

    Config cfg = parseConfigJson(j);
    assert(cfg.threads == 1);
    assert(!cfg.seed);
    assert(cfg.outputEvery == 1);
    assert(cfg.outputFile == "cells.csv");
    assert(cfg.outputMode == OutputMode::BENCHMARK);
}

void test_errors_name_the_key()
{
    json missingDt = baseConfig();
    missingDt.erase("deltaT");
    assert(failsWith(missingDt, "deltaT"));

    json badLaw = baseConfig();
    badLaw["forceTerms"][0]["law"] = "GRAVITY";
    assert(failsWith(badLaw, "GRAVITY"));

    json badParams = baseConfig();
    badParams["forceTerms"][1]["params"] = {1.0, 2.0};
    assert(failsWith(badParams, "forceTerms[1]"));

    json badTypes = baseConfig();
    badTypes["forceTerms"][0]["types"] = {0, 1, 2};
    assert(failsWith(badTypes, "types"));

    json wrongType = baseConfig();
    wrongType["steps"] = "many";
    assert(failsWith(wrongType, "steps"));

    json badMode = baseConfig();
    badMode["outputMode"] = "VIDEO";
    assert(failsWith(badMode, "VIDEO"));

    json missingInit = baseConfig();
    missingInit["init"]["selected"] = "RANDOM";
    assert(failsWith(missingInit, "init.RANDOM"));

    json negStdev = baseConfig();
    negStdev["forceTerms"][1]["rndStdev"] = -0.1;
    assert(failsWith(negStdev, "forceTerms[1].rndStdev"));

    json negBound = baseConfig();
    negBound["forceTerms"][1]["rndBound"] = -0.2;
    assert(failsWith(negBound, "forceTerms[1].rndBound"));
}

void test_negative_noise_rejected_when_building_terms()
{
    // Config assembled by hand, bypassing parseConfigJson
    Config cfg = parseConfigJson(baseConfig());
    cfg.forceTerms[1]["rndStdev"] = -0.1;

    bool thrown = false;
    try {
        createForceTermsFromConfig(cfg, std::vector<int>(6, 0));
    } catch (const std::runtime_error& ex) {
        thrown = std::string(ex.what()).find("rndStdev") != std::string::npos;
    }
    assert(thrown);

    // Zero noise is allowed
    cfg.forceTerms[1]["rndStdev"] = 0.0;
    std::vector<ForceTerm> terms = createForceTermsFromConfig(cfg, std::vector<int>(6, 0));
    assert(terms[1].rndStdev && *terms[1].rndStdev == 0.0);
}

void test_build_initializer_and_terms()
{
    Config cfg = parseConfigJson(baseConfig());
    std::mt19937 gen(*cfg.seed);

    InitResult init = createInitializerFromConfig(cfg, gen);
    assert(init.positions.sameShape(6, 2));
    assert(init.cellTypes.size() == 6);

    std::vector<ForceTerm> terms = createForceTermsFromConfig(cfg, init.cellTypes);
    assert(terms.size() == 2);

    const ForceTerm& hooke = terms[0];
    assert(hooke.name == "HOOKE");
    assert(hooke.params.size() == 2 && hooke.params[1] == 0.5);
    assert(hooke.minRange == 0.0);
    assert(hooke.maxRange == 2.0);
    assert(hooke.mask && hooke.mask->sameShape(6, 6));
    assert(!hooke.rndStdev && !hooke.rndBound);
    for (size_t i = 0; i < 6; ++i) {
        for (size_t j = 0; j < 6; ++j) {
            bool cross = i != j && init.cellTypes[i] != init.cellTypes[j];
            assert(((*hooke.mask)(i, j) != 0) == cross);
        }
    }

    const ForceTerm& push = terms[1];
    assert(push.name == "push");
    assert(!push.mask);
    assert(std::isinf(push.maxRange));
    assert(push.rndStdev && *push.rndStdev == 0.1);
    assert(push.rndBound && *push.rndBound == 0.2);
    assert(push.forceFunc && push.potentialFunc);
}

void test_missing_file()
{
    bool thrown = false;
    try {
        parseConfig("/nonexistent/cellsim/config.json");
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
}

int main()
{
    test_parse_full_config();
    test_defaults();
    test_errors_name_the_key();
    test_build_initializer_and_terms();
    test_negative_noise_rejected_when_building_terms();
    test_missing_file();
    return 0;
}
