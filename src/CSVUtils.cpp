#include "CSVUtils.h"
#include "TabulaExceptions.h"

#include <algorithm>
#include <cstdint>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    if (value.empty()) return value;
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    if (!is.good()) return;

    const int first = is.peek();
    if (first == EOF || static_cast<unsigned char>(first) != 0xEF) {
        return;
    }

    is.get();
    const int second = is.peek();
    if (second == EOF || static_cast<unsigned char>(second) != 0xBB) {
        is.clear(is.rdstate() & ~std::ios::eofbit);
        is.unget();
        return;
    }

    is.get();
    const int third = is.peek();
    if (third == EOF || static_cast<unsigned char>(third) != 0xBF) {
        is.clear(is.rdstate() & ~std::ios::eofbit);
        is.unget();
        is.unget();
        return;
    }

    is.get();
}

std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      bool* malformed,
                                      size_t* consumedLines,
                                      bool* limitExceeded,
                                      const ParseLimits& limits) {
    if (malformed) *malformed = false;
    if (consumedLines) *consumedLines = 0;
    if (limitExceeded) *limitExceeded = false;
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string val;
    bool inQuotes = false;
    bool currentFieldQuoted = false;
    bool lastPushedFieldQuoted = false;
    bool hasRecordData = false;
    bool hadDelimiter = false;
    bool recordHadAnyNewline = false;
    bool overLimit = false;
    size_t recordBytes = 0;
    size_t physicalLineCount = 1;
    char c;

    auto markLimitExceeded = [&]() {
        overLimit = true;
        if (limitExceeded) *limitExceeded = true;
    };

    auto exceedsRecordBytes = [&](size_t delta) {
        if (limits.maxRecordBytes == 0) return false;
        if (recordBytes > limits.maxRecordBytes - delta) {
            markLimitExceeded();
            return true;
        }
        recordBytes += delta;
        return false;
    };

    auto appendChar = [&](char ch) {
        val += ch;
        if (limits.maxFieldBytes != 0 && val.size() > limits.maxFieldBytes) {
            markLimitExceeded();
            return false;
        }
        return true;
    };

    auto pushField = [&]() {
        row.push_back(currentFieldQuoted ? val : trimUnquotedField(val));
        lastPushedFieldQuoted = currentFieldQuoted;
        if (limits.maxColumns > 0 && row.size() > limits.maxColumns) {
            markLimitExceeded();
        }
    };

    // Returns true when the record ends at this line break.
    auto onLineBreak = [&]() {
        if (consumedLines) ++(*consumedLines);
        recordHadAnyNewline = true;
        if (!inQuotes) return true;
        ++physicalLineCount;
        if (limits.maxPhysicalLinesPerRecord > 0 && physicalLineCount > limits.maxPhysicalLinesPerRecord) {
            markLimitExceeded();
            return true;
        }
        return !appendChar('\n');
    };

    while (is.get(c)) {
        if (exceedsRecordBytes(1)) break;

        if (c == '"') {
            if (!inQuotes && val.empty()) {
                inQuotes = true;
                currentFieldQuoted = true;
                hasRecordData = true;
            } else if (inQuotes) {
                if (is.peek() == '"') {
                    is.get();
                    if (exceedsRecordBytes(1) || !appendChar('"')) break;
                } else {
                    const int next = is.peek();
                    if (next == EOF || next == delimiter || next == '\n' || next == '\r') {
                        inQuotes = false;
                    } else if (!appendChar(c)) {
                        break;
                    }
                }
            } else {
                if (!appendChar(c)) break;
                hasRecordData = true;
            }
        } else if (c == delimiter && !inQuotes) {
            pushField();
            if (overLimit) break;
            val.clear();
            currentFieldQuoted = false;
            hadDelimiter = true;
            hasRecordData = true;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            if (onLineBreak()) break;
        } else {
            if (!appendChar(c)) break;
            hasRecordData = true;
        }

        if (overLimit) break;
    }

    if (inQuotes && malformed) {
        *malformed = true;
    }

    if (hasRecordData || hadDelimiter || !val.empty()) {
        pushField();
    }

    if (row.size() == 1 && row[0].empty() && !lastPushedFieldQuoted && !hadDelimiter && recordHadAnyNewline) {
        return {};
    }

    return row;
}

char sniffDelimiter(const std::string& sample, const std::string& preferred) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < sample.size()) {
        size_t end = sample.find('\n', start);
        if (end == std::string::npos) {
            // Trailing fragment without a newline may be cut off mid-record.
            if (lines.empty()) lines.push_back(sample.substr(start));
            break;
        }
        std::string line = sample.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") != std::string::npos) lines.push_back(std::move(line));
        start = end + 1;
    }
    if (lines.empty()) return '\0';

    for (char candidate : preferred) {
        size_t expected = 0;
        bool consistent = true;
        for (size_t i = 0; i < lines.size() && consistent; ++i) {
            size_t count = 0;
            bool inQuotes = false;
            for (char ch : lines[i]) {
                if (ch == '"') inQuotes = !inQuotes;
                else if (ch == candidate && !inQuotes) ++count;
            }
            if (i == 0) expected = count;
            consistent = (count > 0 && count == expected);
        }
        if (consistent) return candidate;
    }
    return '\0';
}

std::string quoteField(const std::string& value, char delimiter) {
    const bool needsQuotes = value.find_first_of(std::string("\"\r\n") + delimiter) != std::string::npos ||
                             (!value.empty() && (value.front() == ' ' || value.back() == ' ' ||
                                                 value.front() == '\t' || value.back() == '\t'));
    if (!needsQuotes) return value;

    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char ch : value) {
        if (ch == '"') out.push_back('"');
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

void writeRow(std::ostream& os, const std::vector<std::string>& row, char delimiter) {
    if (row.size() == 1 && row[0].empty()) {
        // A bare empty line would read back as no record at all.
        os << "\"\"\n";
        return;
    }
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) os.put(delimiter);
        os << quoteField(row[i], delimiter);
    }
    os.put('\n');
    if (!os) throw Tabula::IOException("Failed to write delimited record");
}

CSVRowReader::CSVRowReader(std::istream& is, char delimiter, ParseLimits limits)
    : is_(is), delimiter_(delimiter), limits_(limits) {}

bool CSVRowReader::next(RawRow& row) {
    while (is_.peek() != EOF) {
        bool malformed = false;
        bool limitExceeded = false;
        size_t consumed = 0;
        const size_t firstLine = line_;
        auto parsed = parseCSVLine(is_, delimiter_, &malformed, &consumed, &limitExceeded, limits_);
        line_ += std::max<size_t>(consumed, 1);
        if (limitExceeded) {
            throw Tabula::ParseException("Record exceeds parser limits at line " + std::to_string(firstLine + 1));
        }
        if (malformed) {
            throw Tabula::ParseException("Unterminated quoted field starting at line " + std::to_string(firstLine + 1));
        }
        if (parsed.empty()) continue;
        row = std::move(parsed);
        return true;
    }
    return false;
}
} // namespace CSVUtils
