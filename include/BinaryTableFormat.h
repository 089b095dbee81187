#pragma once

#include "FileFormat.h"

#include <cstdint>

/**
 * @brief Native little-endian binary snapshot of a Table (domain and columns) with an FNV-1a checksum.
 * @details Loads and stores the typed table directly; header parsing and inference are bypassed.
 */
class BinaryTableFormat : public FileFormat {
public:
    static constexpr uint32_t kFormatVersion = 1;

    std::string name() const override { return "tbin"; }
    std::string description() const override { return "Tabula binary table"; }
    std::vector<std::string> extensions() const override { return {".tbin"}; }
    bool canWrite() const override { return true; }

    /**
     * @throws Tabula::IOException when the file cannot be opened,
     * Tabula::ParseException on a bad signature, version, truncation or checksum mismatch.
     */
    Table readFile(const std::string& filename, const ReadOptions& options) const override;
    void writeFile(const std::string& filename, const Table& table) const override;
};
