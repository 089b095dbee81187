#pragma once

#include "RowSource.h"

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace CSVUtils {
// Low-level delimited-text tokenization, dialect sniffing and writing.
// This module does not infer semantic types.
struct ParseLimits {
	size_t maxFieldBytes = 8 * 1024 * 1024;           // 8 MiB
	size_t maxRecordBytes = 64 * 1024 * 1024;         // 64 MiB
	size_t maxColumns = 20000;
	size_t maxPhysicalLinesPerRecord = 10000;
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);
std::vector<std::string> parseCSVLine(std::istream& is,
									  char delimiter,
									  bool* malformed = nullptr,
									  size_t* consumedLines = nullptr,
									  bool* limitExceeded = nullptr,
									  const ParseLimits& limits = ParseLimits{});

/**
 * @brief Guesses the field delimiter from a lead sample.
 * @details A candidate qualifies when it occurs outside quotes the same non-zero number of
 * times on every complete line of the sample. Ties go to `preferred` order.
 * @return '\0' when no candidate qualifies.
 */
char sniffDelimiter(const std::string& sample, const std::string& preferred);

std::string quoteField(const std::string& value, char delimiter);
void writeRow(std::ostream& os, const std::vector<std::string>& row, char delimiter);

/**
 * @brief RowSource over a delimited text stream. Blank records are skipped.
 * @throws Tabula::ParseException on an unterminated quote or a parse limit breach.
 */
class CSVRowReader : public RowSource {
public:
	explicit CSVRowReader(std::istream& is, char delimiter, ParseLimits limits = ParseLimits{});
	bool next(RawRow& row) override;
	size_t physicalLine() const noexcept { return line_; }

private:
	std::istream& is_;
	char delimiter_;
	ParseLimits limits_;
	size_t line_ = 0;
};
}
