#include "TextInput.h"
#include "Compression.h"
#include "EncodingDetector.h"
#include "Logging.h"
#include "TabulaExceptions.h"

#include <fstream>
#include <iterator>
#include <optional>

namespace TextInput {

std::string readUtf8(const std::string& filename, const std::string& declaredEncoding) {
    const Compression compression = CompressionUtils::fromFilename(filename);
    ProcessUtils::TempFile plain;
    std::string path = filename;
    if (compression != Compression::NONE) {
        plain = CompressionUtils::decompressToTemp(filename, compression);
        path = plain.path();
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) throw Tabula::IOException("Could not open file: " + filename);

    std::optional<std::string> encoding;
    if (!declaredEncoding.empty() || compression != Compression::NONE) {
        encoding = EncodingUtils::detectEncoding(in, declaredEncoding);
    } else {
        encoding = EncodingUtils::detectEncoding(filename);
    }

    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw Tabula::IOException("Failed reading file: " + filename);

    if (!encoding) {
        TabulaLog::info("Could not determine encoding of " + filename + ", reading as UTF-8");
        return bytes;
    }
    if (!EncodingUtils::needsTranscoding(encoding)) return bytes;

    TabulaLog::debug("Transcoding " + filename + " from " + *encoding);
    return EncodingUtils::transcodeToUtf8(bytes, *encoding);
}

} // namespace TextInput
