#pragma once

#include "RowSource.h"

#include <cstddef>
#include <string>
#include <vector>

struct HeaderTriple {
    std::string name;
    std::string typeTag;
    std::string flags;
};

struct ParsedHeaders {
    std::vector<RawRow> rows;       // 0..3 header rows, cells trimmed
    std::vector<RawRow> pushedBack; // the first row that failed its test, if any
};

namespace HeaderParser {

constexpr double kDefaultNumericRatio = 0.9;

// "continuous", "c", "discrete", "d", "string", "s", "text".
bool isTypeTag(const std::string& cell);
bool isDiscreteList(const std::string& cell);
// Digits, commas and periods only, at least one digit.
bool isNumericLooking(const std::string& cell);

bool isNameRow(const RawRow& row, double numericRatio = kDefaultNumericRatio);
bool isTypeRow(const RawRow& row);
bool isFlagRow(const RawRow& row);

/**
 * @brief Pulls up to three rows off `source` and keeps the leading ones that pass the
 * positional header tests (names, types, flags).
 * @post Rows read but not kept are in pushedBack; wrap `source` in a SplicedRowSource
 * with them to continue reading data.
 */
ParsedHeaders parseHeaders(RowSource& source, double numericRatio = kDefaultNumericRatio);

/**
 * @brief Splits a combined "typeflags" cell: a complete type tag or value list is the type;
 * otherwise uppercase letters (lower-cased) form the type and each lowercase letter is a flag.
 */
void splitCombinedCell(const std::string& cell, std::string& typeTag, std::string& flags);

/**
 * @brief Converts 0..3 header rows into one HeaderTriple per column.
 * @details Width is max(widest header row, dataWidth); missing entries are empty strings.
 */
std::vector<HeaderTriple> normalizeHeaders(const std::vector<RawRow>& headers, size_t dataWidth);

} // namespace HeaderParser
