#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Incremental byte-statistics encoding guesser.
 * @details Feed chunks until done() reports confidence, then close() and read result().
 * Distinguishes BOM-marked and NUL-patterned UTF-16, UTF-8, plain ASCII and the
 * single-byte Western encodings (windows-1252 when C1 control bytes occur, else iso-8859-1).
 */
class EncodingDetector {
public:
    void feed(std::string_view bytes);
    bool done() const noexcept { return done_; }
    void close();
    const std::optional<std::string>& result() const noexcept { return result_; }
    void reset();

private:
    void consume(unsigned char b);

    size_t bytesSeen_ = 0;
    size_t highBytes_ = 0;
    size_t c1Bytes_ = 0;
    size_t nulEven_ = 0;
    size_t nulOdd_ = 0;
    size_t utf8Multibyte_ = 0;
    int utf8Pending_ = 0;
    bool utf8Valid_ = true;
    bool done_ = false;
    bool closed_ = false;
    std::optional<std::string> result_;
};

namespace EncodingUtils {

/**
 * @brief Encodings `file --mime-encoding` reports reliably; anything else defers to EncodingDetector.
 */
bool isTrustedMimeEncoding(const std::string& label);

/**
 * @brief Asks the system `file` utility for the MIME encoding of an uncompressed file.
 * @return label when the utility exists, succeeds and reports a trusted encoding.
 */
std::optional<std::string> sniffMimeEncoding(const std::string& filename);

/**
 * @brief Full detection chain for a path: MIME sniff first, statistical detector second.
 * Compressed paths skip the sniff and are scanned through a decompressed copy.
 * @return std::nullopt when nothing could be determined; callers then assume UTF-8.
 */
std::optional<std::string> detectEncoding(const std::string& filename);

std::optional<std::string> detectEncodingFromBytes(std::string_view bytes);

/**
 * @brief Scans the stream line by line until confident; the read position is restored.
 * A non-empty declaredEncoding is returned as-is without scanning.
 */
std::optional<std::string> detectEncoding(std::istream& is, const std::string& declaredEncoding = std::string());

bool needsTranscoding(const std::optional<std::string>& label);

/**
 * @throws Tabula::ParseException on an invalid byte sequence, Tabula::IOException
 * when the encoding is unknown to iconv.
 */
std::string transcodeToUtf8(const std::string& bytes, const std::string& label);

} // namespace EncodingUtils
