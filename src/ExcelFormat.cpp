#include "ExcelFormat.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "FormatRegistry.h"
#include "Logging.h"
#include "ProcessUtils.h"
#include "TableBuilder.h"
#include "TabulaExceptions.h"

#include <fstream>
#include <iterator>
#include <regex>
#include <sstream>

namespace {
std::string convertWorkbook(const std::string& path) {
    {
        std::ifstream probe(path, std::ios::binary);
        if (!probe) throw Tabula::IOException("Could not open file: " + path);
    }

    const bool isXlsx = CommonUtils::endsWith(CommonUtils::toLower(path), ".xlsx");
    const std::string tool = isXlsx ? "xlsx2csv" : "xls2csv";
    const std::string exe = ProcessUtils::findExecutableInPath(tool);
    if (exe.empty()) {
        throw Tabula::IOException(std::string(isXlsx ? "XLSX" : "XLS") + " import requires " + tool);
    }

    const std::vector<std::string> args = isXlsx
        ? std::vector<std::string>{"-a", path}
        : std::vector<std::string>{"-d", "utf-8", path};
    ProcessUtils::TempFile out(ProcessUtils::makeTempPath("sheets", ".csv"));
    const int rc = ProcessUtils::spawnToFile(exe, args, out.path());
    if (rc != 0) throw Tabula::IOException("Failed to convert spreadsheet " + path + " (" + tool + " exit status " + std::to_string(rc) + ")");

    std::ifstream in(out.path(), std::ios::binary);
    if (!in) throw Tabula::IOException("Could not read converted spreadsheet " + out.path());
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

std::vector<RawRow> tokenize(const std::string& text) {
    std::istringstream in(text);
    CSVUtils::CSVRowReader reader(in, ',');
    std::vector<RawRow> rows;
    RawRow row;
    while (reader.next(row)) rows.push_back(std::move(row));
    return rows;
}
} // namespace

std::vector<ExcelFormat::Sheet> ExcelFormat::splitXlsxOutput(const std::string& text) {
    static const std::regex separator(R"(^-------- (\d+) - (.*?)\r?$)");
    std::vector<Sheet> sheets;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        std::smatch m;
        if (std::regex_match(line, m, separator)) {
            sheets.emplace_back(m[2].str(), std::string());
            continue;
        }
        if (sheets.empty()) sheets.emplace_back("1", std::string());
        sheets.back().second += line;
        sheets.back().second.push_back('\n');
    }
    return sheets;
}

std::vector<ExcelFormat::Sheet> ExcelFormat::splitXlsOutput(const std::string& text) {
    std::vector<Sheet> sheets;
    const auto parts = CommonUtils::splitOn(text, '\f');
    for (size_t i = 0; i < parts.size(); ++i) {
        // The final form feed leaves a trailing empty chunk.
        if (i + 1 == parts.size() && CommonUtils::isBlank(parts[i]) && !sheets.empty()) break;
        sheets.emplace_back(std::to_string(i + 1), parts[i]);
    }
    return sheets;
}

std::vector<RawRow> ExcelFormat::trimSheet(std::vector<RawRow> rows) {
    size_t first = 0;
    while (first < rows.size() && !CommonUtils::anyNonBlank(rows[first])) ++first;
    if (first == rows.size()) return {};

    const RawRow& head = rows[first];
    size_t firstCol = 0;
    while (firstCol < head.size() && CommonUtils::isBlank(head[firstCol])) ++firstCol;
    const size_t rowLen = head.size();

    std::vector<RawRow> out;
    for (size_t r = first; r < rows.size(); ++r) {
        RawRow cells;
        for (size_t c = firstCol; c < rowLen; ++c) cells.push_back(c < rows[r].size() ? rows[r][c] : std::string());
        if (CommonUtils::anyNonBlank(cells)) out.push_back(std::move(cells));
    }
    return out;
}

Table ExcelFormat::readSheets(const std::vector<Sheet>& sheets, const std::string& selector, const ReadOptions& options) const {
    for (size_t i = 0; i < sheets.size(); ++i) {
        const auto& sheet = sheets[i];
        if (!selector.empty() && sheet.first != selector && std::to_string(i + 1) != selector) continue;

        try {
            std::vector<RawRow> rows = trimSheet(tokenize(sheet.second));
            if (rows.empty()) {
                if (!selector.empty()) throw Tabula::ParseException("Sheet '" + sheet.first + "' is empty");
                TabulaLog::info("Skipping empty sheet '" + sheet.first + "'");
                continue;
            }
            VectorRowSource source(std::move(rows));
            return TableBuilder(options).build(source);
        } catch (const Tabula::ParseException& e) {
            if (!selector.empty()) throw;
            TabulaLog::warning("Skipping sheet '" + sheet.first + "': " + e.what());
        }
    }
    if (!selector.empty()) throw Tabula::IOException("No sheet named '" + selector + "' in Excel document");
    throw Tabula::IOException("No usable sheets in Excel document");
}

Table ExcelFormat::readFile(const std::string& filename, const ReadOptions& options) const {
    std::string path;
    std::string selector;
    if (!FormatRegistry::splitSheetSelector(filename, extensions(), path, selector)) path = filename;
    if (selector.empty()) selector = options.sheet;

    const std::string text = convertWorkbook(path);
    const bool isXlsx = CommonUtils::endsWith(CommonUtils::toLower(path), ".xlsx");
    return readSheets(isXlsx ? splitXlsxOutput(text) : splitXlsOutput(text), selector, options);
}
