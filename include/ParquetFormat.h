#pragma once

#include "FileFormat.h"

/**
 * @brief Apache Parquet via Arrow. Roles, kinds and discrete values travel as field metadata.
 * @details Only functional when built with TABULA_USE_NATIVE_PARQUET; otherwise reads and
 * writes throw Tabula::IOException. Files without Tabula metadata load numeric columns as
 * continuous attributes and text columns as string metas.
 */
class ParquetFormat : public FileFormat {
public:
    std::string name() const override { return "parquet"; }
    std::string description() const override { return "Apache Parquet"; }
    std::vector<std::string> extensions() const override { return {".parquet"}; }
    bool canWrite() const override { return true; }

    Table readFile(const std::string& filename, const ReadOptions& options) const override;
    void writeFile(const std::string& filename, const Table& table) const override;

    static bool nativeSupport() noexcept;
};
