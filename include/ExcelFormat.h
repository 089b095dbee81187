#pragma once

#include "FileFormat.h"

#include <string>
#include <utility>
#include <vector>

/**
 * @brief Microsoft Excel workbooks, converted to CSV text by the external xlsx2csv / xls2csv tools.
 * @details A "book.xlsx:Sheet2" selector (or ReadOptions::sheet) picks a sheet by name or
 * 1-based index; otherwise the first sheet that yields a table is used.
 */
class ExcelFormat : public FileFormat {
public:
    using Sheet = std::pair<std::string, std::string>; // name, CSV text

    std::string name() const override { return "excel"; }
    std::string description() const override { return "Microsoft Excel spreadsheet"; }
    std::vector<std::string> extensions() const override { return {".xls", ".xlsx"}; }
    bool acceptsSheetSelector() const override { return true; }

    Table readFile(const std::string& filename, const ReadOptions& options) const override;

    /**
     * @brief Builds a table from the first matching usable sheet.
     * @throws Tabula::IOException when no sheet is usable; a named sheet's parse error propagates.
     */
    Table readSheets(const std::vector<Sheet>& sheets, const std::string& selector, const ReadOptions& options) const;

    // Splits "xlsx2csv -a" output on its "-------- N - name" separator lines.
    static std::vector<Sheet> splitXlsxOutput(const std::string& text);
    // Splits "xls2csv" output on form feeds; sheets are named by 1-based index.
    static std::vector<Sheet> splitXlsOutput(const std::string& text);

    // Drops leading blank rows and columns; keeps columns up to the first non-blank row's width.
    static std::vector<RawRow> trimSheet(std::vector<RawRow> rows);
};
