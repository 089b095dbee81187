#pragma once

#include <string>

namespace TextInput {

/**
 * @brief Reads a text file as UTF-8, decompressing by suffix and transcoding from the
 * declared or detected encoding. A leading UTF-8 BOM is kept; CSVUtils::skipBOM drops it.
 * @throws Tabula::IOException when the file (or its compression tool) is unavailable,
 * Tabula::ParseException on bytes invalid in the source encoding.
 */
std::string readUtf8(const std::string& filename, const std::string& declaredEncoding = std::string());

}
