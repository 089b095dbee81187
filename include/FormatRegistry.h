#pragma once

#include "FileFormat.h"
#include "ReadOptions.h"
#include "Table.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Extension-keyed lookup of FileFormat adapters. Populated explicitly.
 */
class FormatRegistry {
public:
    /**
     * @brief Registry with every built-in format (csv, tab, excel, basket, tbin, parquet).
     */
    static FormatRegistry defaults();

    /**
     * @brief Adds a format; compressed variants of its extensions are added when it supports them.
     * @details Later registrations win for an extension already claimed.
     */
    void registerFormat(std::shared_ptr<const FileFormat> format);

    /**
     * @brief Reader for filename, matching the longest registered suffix.
     * @throws Tabula::FormatException "No readers for file ..." when nothing matches.
     */
    const FileFormat& readerFor(const std::string& filename) const;
    const FileFormat& writerFor(const std::string& filename) const;

    // Registered (extension, format) pairs, compressed variants included.
    std::vector<std::pair<std::string, const FileFormat*>> readers() const;
    std::vector<std::pair<std::string, const FileFormat*>> writers() const;
    // "Description (*.ext *.ext)" per distinct format.
    std::vector<std::string> descriptions() const;

    /**
     * @brief Splits "path.ext:sheet" when path ends with one of `extensions` (compressed variants too).
     * @return false when there is no selector.
     */
    static bool splitSheetSelector(const std::string& filename,
                                   const std::vector<std::string>& extensions,
                                   std::string& path,
                                   std::string& sheet);

private:
    const FileFormat* find(const std::string& filename, bool forWriting) const;

    std::vector<std::shared_ptr<const FileFormat>> formats_;
    std::vector<std::pair<std::string, const FileFormat*>> extensions_;
};

namespace TableIO {

/**
 * @brief Loads `filename` with the format registered for its extension.
 * @post The returned Table is complete; failures leave nothing behind.
 * @throws Tabula::FormatException (no reader), Tabula::IOException,
 * Tabula::ParseException ("Cannot parse dataset <file>: <cause>").
 */
Table readTable(const std::string& filename, const ReadOptions& options = ReadOptions{});
Table readTable(const FormatRegistry& registry, const std::string& filename, const ReadOptions& options = ReadOptions{});

void writeTable(const std::string& filename, const Table& table);
void writeTable(const FormatRegistry& registry, const std::string& filename, const Table& table);

}
