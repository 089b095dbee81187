#pragma once

#include <cstddef>
#include <string>
#include <vector>

class VariableRegistry;

/**
 * @brief Per-read tuning shared by every format adapter.
 */
struct ReadOptions {
    // Cells equal to one of these (after trimming) are missing. Blank cells are always missing.
    std::vector<std::string> missingValues = {"", "?", ".", "~", "nan", "NA"};

    // Row 1 is data, not names, once this fraction of its cells is numeric-looking.
    double headerNumericRatio = 0.9;

    // Categorical heuristic: numeric-looking columns with at most this many distinct values
    // may be discrete; other columns may have up to round(rows ^ exponent) values.
    size_t discreteMaxNumericValues = 3;
    double discreteCardinalityExponent = 0.7;

    // nullptr selects VariableRegistry::global(). Not owned.
    VariableRegistry* registry = nullptr;

    // '\0' sniffs the delimiter from the file.
    char delimiter = '\0';

    // Spreadsheet sheet name (or 1-based index); a ":sheet" filename suffix takes precedence.
    std::string sheet;

    // Trusted source encoding; empty runs detection.
    std::string encoding;

    VariableRegistry& effectiveRegistry() const;
};
