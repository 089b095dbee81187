#pragma once

#include "ReadOptions.h"
#include "RowSource.h"
#include "Table.h"

#include <string>
#include <vector>

/**
 * @brief One storage format: its extensions and what it can do.
 * @details Row-producing formats tokenize into a RowSource and hand it to TableBuilder;
 * blob formats load and store the Table directly.
 */
class FileFormat {
public:
    virtual ~FileFormat() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    // Lower-case, dot-prefixed, without compression suffixes.
    virtual std::vector<std::string> extensions() const = 0;

    virtual bool canRead() const { return true; }
    virtual bool canWrite() const { return false; }
    // Also register every extension with ".gz", ".bz2", ".xz" appended.
    virtual bool supportsCompressed() const { return false; }
    // Filenames may end in ":sheet".
    virtual bool acceptsSheetSelector() const { return false; }

    /**
     * @throws Tabula::IOException, Tabula::ParseException (without filename context).
     */
    virtual Table readFile(const std::string& filename, const ReadOptions& options) const = 0;

    /**
     * @throws Tabula::FormatException when canWrite() is false, Tabula::IOException on write failure.
     */
    virtual void writeFile(const std::string& filename, const Table& table) const;
};

// Three-row header convention and cell text for writers.
namespace TableHeaders {
std::vector<std::string> names(const Table& table);
std::vector<std::string> types(const Table& table);
std::vector<std::string> flags(const Table& table);
// Row-major cell text in header column order: weights, attributes, class vars, metas.
std::vector<RawRow> rows(const Table& table);
}
