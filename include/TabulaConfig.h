#pragma once

#include "ReadOptions.h"

#include <cstddef>
#include <string>
#include <vector>

struct TabulaConfig {
    std::string inputPath;
    std::string outputPath;
    char delimiter = '\0';   // '\0' => sniff
    std::string sheet;
    std::string encoding;    // empty => detect

    double headerNumericRatio = 0.9;
    size_t discreteMaxNumericValues = 3;
    double discreteCardinalityExponent = 0.7;
    std::vector<std::string> missingValues = ReadOptions{}.missingValues;

    bool summary = true;
    size_t previewRows = 0;
    std::string logLevel = "warning"; // debug|info|warning|error
    bool isolatedRegistry = false;
    bool listFormats = false;

    /**
     * @brief Builds config from CLI args and optional config file override.
     * @pre argv[1] is the input path, or "--formats".
     * @post Returns a validated config object.
     * @throws Tabula::ConfigurationException on invalid arguments or values.
     */
    static TabulaConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads `key: value` lines (loose YAML / JSON-ish) over `base`.
     * @throws Tabula::ConfigurationException on parse/validation failures.
     */
    static TabulaConfig fromFile(const std::string& configPath, const TabulaConfig& base);

    /**
     * @throws Tabula::ConfigurationException on invalid values.
     */
    void validate() const;

    // Registry pointer is left null; callers owning a private registry set it.
    ReadOptions toReadOptions() const;

    static std::string usage();
};
