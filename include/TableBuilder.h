#pragma once

#include "HeaderParser.h"
#include "ReadOptions.h"
#include "RowSource.h"
#include "Table.h"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

/**
 * @brief Turns header rows plus raw data rows into a typed Table.
 * @details Handles the column pipeline: flag decoding, missing-value normalization,
 * kind resolution (explicit tag or categorical heuristic), discrete index mapping,
 * registry reconciliation and role routing.
 */
class TableBuilder {
public:
    explicit TableBuilder(ReadOptions options = ReadOptions{});

    const ReadOptions& options() const noexcept { return options_; }

    /**
     * @brief Detects header rows at the front of `rows`, then builds from the remainder.
     * @throws Tabula::ParseException on malformed value lists or unconvertible continuous cells.
     */
    Table build(RowSource& rows) const;

    /**
     * @brief Builds from already separated header rows (0..3) and data rows.
     * @pre headers.size() <= 3.
     * @post Returned table satisfies the Table invariant; nothing is returned on failure.
     * @throws Tabula::ParseException as build(RowSource&).
     */
    Table build(const std::vector<RawRow>& headers, RowSource& rows) const;

    /**
     * @brief Categorical heuristic on one column of trimmed cells.
     * @return sorted distinct non-missing values when the column should be discrete.
     */
    std::optional<std::vector<std::string>> inferDiscreteValues(const std::vector<std::string>& cells,
                                                                const std::vector<uint8_t>& missing) const;

    bool isMissingToken(const std::string& trimmed) const;

    /**
     * @brief Strict number parse: whole token, optional leading '+'.
     */
    static bool parseNumber(const std::string& token, double& out);

private:
    ReadOptions options_;
    std::unordered_set<std::string> missingTokens_;
};
