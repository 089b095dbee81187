#include "HeaderParser.h"
#include "ColumnFlags.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cctype>
#include <regex>

namespace {
const std::regex& discreteListPattern() {
    static const std::regex pattern(R"(^\s*[^\s]+(\s[^\s]+)+\s*$)");
    return pattern;
}

bool hasUpper(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) { return std::isupper(c); });
}

RawRow trimmedRow(const RawRow& row) {
    RawRow out;
    out.reserve(row.size());
    for (const auto& cell : row) out.push_back(CommonUtils::trim(cell));
    return out;
}
} // namespace

namespace HeaderParser {

bool isTypeTag(const std::string& cell) {
    static const std::vector<std::string> tags = {"continuous", "c", "discrete", "d", "string", "s", "text"};
    const std::string t = CommonUtils::trim(cell);
    return std::find(tags.begin(), tags.end(), t) != tags.end();
}

bool isDiscreteList(const std::string& cell) {
    return std::regex_match(cell, discreteListPattern());
}

bool isNumericLooking(const std::string& cell) {
    bool sawDigit = false;
    for (unsigned char c : cell) {
        if (std::isdigit(c)) {
            sawDigit = true;
        } else if (c != '.' && c != ',') {
            return false;
        }
    }
    return sawDigit;
}

bool isNameRow(const RawRow& row, double numericRatio) {
    if (row.empty()) return true;
    const size_t numeric = static_cast<size_t>(std::count_if(row.begin(), row.end(), [](const std::string& cell) {
        return isNumericLooking(CommonUtils::trim(cell));
    }));
    return static_cast<double>(numeric) / static_cast<double>(row.size()) < numericRatio;
}

bool isTypeRow(const RawRow& row) {
    return std::all_of(row.begin(), row.end(), [](const std::string& cell) {
        return CommonUtils::isBlank(cell) || isTypeTag(cell) || isDiscreteList(cell);
    });
}

bool isFlagRow(const RawRow& row) {
    return std::all_of(row.begin(), row.end(), [](const std::string& cell) {
        for (const auto& token : ColumnFlags::split(CommonUtils::trim(cell))) {
            if (token.empty()) continue;
            if (!ColumnFlags::isRoleToken(token) && !ColumnFlags::isAttributeToken(token)) return false;
        }
        return true;
    });
}

ParsedHeaders parseHeaders(RowSource& source, double numericRatio) {
    ParsedHeaders result;
    for (int position = 0; position < 3; ++position) {
        RawRow row;
        if (!source.next(row)) break;

        bool header = false;
        switch (position) {
            case 0: header = isNameRow(row, numericRatio); break;
            case 1: header = isTypeRow(row); break;
            default: header = isFlagRow(row); break;
        }
        if (!header) {
            result.pushedBack.push_back(std::move(row));
            break;
        }
        result.rows.push_back(trimmedRow(row));
    }
    return result;
}

void splitCombinedCell(const std::string& cell, std::string& typeTag, std::string& flags) {
    typeTag.clear();
    flags.clear();
    const std::string trimmed = CommonUtils::trim(cell);
    if (trimmed.empty()) return;

    // Exception to the per-letter rule (upper case = type, lower case = flags): an all
    // lower-case cell spelling a type name or a value list is taken as the type.
    if (!hasUpper(trimmed) && (isTypeTag(trimmed) || isDiscreteList(trimmed))) {
        typeTag = trimmed;
        return;
    }

    std::vector<std::string> flagTokens;
    for (unsigned char c : trimmed) {
        if (std::isupper(c)) {
            typeTag.push_back(static_cast<char>(std::tolower(c)));
        } else if (std::islower(c)) {
            flagTokens.emplace_back(1, static_cast<char>(c));
        }
    }
    flags = ColumnFlags::join(flagTokens);
}

std::vector<HeaderTriple> normalizeHeaders(const std::vector<RawRow>& headers, size_t dataWidth) {
    size_t width = dataWidth;
    for (const auto& row : headers) width = std::max(width, row.size());
    std::vector<HeaderTriple> triples(width);

    auto cellAt = [](const RawRow& row, size_t c) -> std::string {
        return c < row.size() ? row[c] : std::string();
    };

    if (headers.size() >= 3) {
        for (size_t c = 0; c < width; ++c) {
            triples[c].name = cellAt(headers[0], c);
            triples[c].typeTag = cellAt(headers[1], c);
            triples[c].flags = cellAt(headers[2], c);
        }
    } else if (headers.size() == 2) {
        for (size_t c = 0; c < width; ++c) {
            triples[c].name = cellAt(headers[0], c);
            splitCombinedCell(cellAt(headers[1], c), triples[c].typeTag, triples[c].flags);
        }
    } else if (headers.size() == 1) {
        for (size_t c = 0; c < width; ++c) {
            const std::string cell = cellAt(headers[0], c);
            const size_t hash = cell.find('#');
            if (hash == std::string::npos) {
                triples[c].name = cell;
                continue;
            }
            splitCombinedCell(cell.substr(0, hash), triples[c].typeTag, triples[c].flags);
            triples[c].name = cell.substr(hash + 1);
        }
    }
    return triples;
}

} // namespace HeaderParser
