#pragma once

#include "FileFormat.h"

/**
 * @brief Delimited text with the three-row header convention.
 * @details The dialect is sniffed from the first 1024 bytes; the format's own delimiter
 * is preferred and is the fallback when sniffing finds nothing consistent.
 */
class DelimitedFormat : public FileFormat {
public:
    static constexpr size_t kSniffBytes = 1024;

    DelimitedFormat(std::string name, std::string description, std::vector<std::string> extensions, char delimiter);

    std::string name() const override { return name_; }
    std::string description() const override { return description_; }
    std::vector<std::string> extensions() const override { return extensions_; }
    bool canWrite() const override { return true; }
    bool supportsCompressed() const override { return true; }

    char delimiter() const noexcept { return delimiter_; }

    Table readFile(const std::string& filename, const ReadOptions& options) const override;
    void writeFile(const std::string& filename, const Table& table) const override;

    /**
     * @brief Delimiter for a lead sample: sniffed, or this format's default.
     */
    char resolveDelimiter(const std::string& sample) const;

    // Parses already decoded text; used by readFile and by converters that produce CSV text.
    Table readText(const std::string& text, const ReadOptions& options) const;

private:
    std::string name_;
    std::string description_;
    std::vector<std::string> extensions_;
    char delimiter_;
};

class CSVFormat : public DelimitedFormat {
public:
    CSVFormat() : DelimitedFormat("csv", "Comma-separated values", {".csv"}, ',') {}
};

class TabFormat : public DelimitedFormat {
public:
    TabFormat() : DelimitedFormat("tab", "Tab-separated values", {".tab", ".tsv"}, '\t') {}
};
