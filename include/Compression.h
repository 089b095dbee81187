#pragma once

#include "ProcessUtils.h"

#include <string>
#include <vector>

enum class Compression { NONE, GZIP, BZIP2, XZ };

namespace CompressionUtils {

// ".gz", ".bz2", ".xz" in that order.
const std::vector<std::string>& suffixes();

Compression fromFilename(const std::string& filename);
std::string suffix(Compression compression);
std::string stripSuffix(const std::string& filename);

/**
 * @brief Decompresses `path` into a temporary file using the matching system tool (gzip/bzip2/xz).
 * @pre compression != Compression::NONE.
 * @post Returned TempFile owns the plain-text copy and deletes it on destruction.
 * @throws Tabula::IOException when the source is unreadable, the tool is missing, or it fails.
 */
ProcessUtils::TempFile decompressToTemp(const std::string& path, Compression compression);

/**
 * @brief Compresses plainPath into targetPath (overwritten).
 * @throws Tabula::IOException on tool failure.
 */
void compressFile(const std::string& plainPath, const std::string& targetPath, Compression compression);

} // namespace CompressionUtils
