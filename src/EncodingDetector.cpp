#include "EncodingDetector.h"
#include "CommonUtils.h"
#include "Compression.h"
#include "Logging.h"
#include "ProcessUtils.h"
#include "TabulaExceptions.h"

#include <cerrno>
#include <fstream>
#include <iconv.h>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace {
constexpr size_t kConfidentMultibyte = 64;
constexpr size_t kConfidentHighBytes = 64;
constexpr size_t kConfidentNulBytes = 32;

std::string iconvName(const std::string& label) {
    static const std::unordered_map<std::string, std::string> names = {
        {"utf-8", "UTF-8"},
        {"ascii", "ASCII"},
        {"us-ascii", "ASCII"},
        {"iso-8859-1", "ISO-8859-1"},
        {"latin-1", "ISO-8859-1"},
        {"utf-7", "UTF-7"},
        {"utf-16le", "UTF-16LE"},
        {"utf-16be", "UTF-16BE"},
        {"ebcdic", "EBCDIC-US"},
        {"windows-1252", "CP1252"}
    };
    const std::string key = CommonUtils::toLower(CommonUtils::trim(label));
    const auto it = names.find(key);
    if (it != names.end()) return it->second;
    std::string upper = key;
    for (char& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return upper;
}

struct IconvHandle {
    iconv_t cd;
    explicit IconvHandle(iconv_t h) : cd(h) {}
    IconvHandle(const IconvHandle&) = delete;
    IconvHandle& operator=(const IconvHandle&) = delete;
    ~IconvHandle() {
        if (cd != reinterpret_cast<iconv_t>(-1)) iconv_close(cd);
    }
};

std::optional<std::string> scanLines(std::istream& is) {
    EncodingDetector detector;
    std::string line;
    while (std::getline(is, line)) {
        if (!is.eof()) line.push_back('\n');
        detector.feed(line);
        if (detector.done()) break;
    }
    detector.close();
    return detector.result();
}
} // namespace

void EncodingDetector::feed(std::string_view bytes) {
    if (done_ || closed_ || bytes.empty()) return;

    if (bytesSeen_ == 0) {
        const auto at = [&](size_t i) { return static_cast<unsigned char>(bytes[i]); };
        if (bytes.size() >= 3 && at(0) == 0xEF && at(1) == 0xBB && at(2) == 0xBF) {
            result_ = "utf-8";
            done_ = true;
            bytesSeen_ = bytes.size();
            return;
        }
        if (bytes.size() >= 2 && at(0) == 0xFF && at(1) == 0xFE) {
            result_ = "utf-16le";
            done_ = true;
            bytesSeen_ = bytes.size();
            return;
        }
        if (bytes.size() >= 2 && at(0) == 0xFE && at(1) == 0xFF) {
            result_ = "utf-16be";
            done_ = true;
            bytesSeen_ = bytes.size();
            return;
        }
    }

    for (char ch : bytes) {
        consume(static_cast<unsigned char>(ch));
    }

    if (utf8Valid_ && utf8Multibyte_ >= kConfidentMultibyte) done_ = true;
    if (!utf8Valid_ && highBytes_ >= kConfidentHighBytes) done_ = true;
    if (nulEven_ + nulOdd_ >= kConfidentNulBytes) done_ = true;
}

void EncodingDetector::consume(unsigned char b) {
    if (b == 0) {
        if (bytesSeen_ % 2 == 0) ++nulEven_;
        else ++nulOdd_;
    }
    if (b >= 0x80) {
        ++highBytes_;
        if (b <= 0x9F) ++c1Bytes_;
    }
    ++bytesSeen_;

    if (!utf8Valid_) return;
    if (utf8Pending_ > 0) {
        if ((b & 0xC0) == 0x80) {
            if (--utf8Pending_ == 0) ++utf8Multibyte_;
        } else {
            utf8Valid_ = false;
        }
        return;
    }
    if (b < 0x80) return;
    if ((b & 0xE0) == 0xC0 && b >= 0xC2) utf8Pending_ = 1;
    else if ((b & 0xF0) == 0xE0) utf8Pending_ = 2;
    else if ((b & 0xF8) == 0xF0 && b <= 0xF4) utf8Pending_ = 3;
    else utf8Valid_ = false;
}

void EncodingDetector::close() {
    if (closed_) return;
    closed_ = true;
    if (result_) return;
    if (bytesSeen_ == 0) return;

    const size_t nuls = nulEven_ + nulOdd_;
    if (nuls * 4 > bytesSeen_) {
        if (nulOdd_ > nulEven_ * 2) result_ = "utf-16le";
        else if (nulEven_ > nulOdd_ * 2) result_ = "utf-16be";
        return;
    }

    // A sequence cut off by the end of input is not UTF-8.
    if (utf8Valid_ && utf8Pending_ == 0) {
        result_ = (highBytes_ == 0) ? "ascii" : "utf-8";
        return;
    }
    result_ = (c1Bytes_ > 0) ? "windows-1252" : "iso-8859-1";
}

void EncodingDetector::reset() {
    *this = EncodingDetector();
}

namespace EncodingUtils {

bool isTrustedMimeEncoding(const std::string& label) {
    static const std::unordered_set<std::string> trusted = {
        "utf-8", "us-ascii", "iso-8859-1", "utf-7", "utf-16le", "utf-16be", "ebcdic"
    };
    return trusted.count(CommonUtils::toLower(CommonUtils::trim(label))) > 0;
}

std::optional<std::string> sniffMimeEncoding(const std::string& filename) {
    const std::string exe = ProcessUtils::findExecutableInPath("file");
    if (exe.empty()) return std::nullopt;

    ProcessUtils::TempFile out(ProcessUtils::makeTempPath("mime", ".txt"));
    const int rc = ProcessUtils::spawnToFile(exe, {"--brief", "--mime-encoding", filename}, out.path());
    if (rc != 0) return std::nullopt;

    std::ifstream in(out.path());
    std::string label;
    std::getline(in, label);
    label = CommonUtils::toLower(CommonUtils::trim(label));
    if (!isTrustedMimeEncoding(label)) {
        TabulaLog::debug("file reported '" + label + "' for " + filename + "; using byte statistics");
        return std::nullopt;
    }
    return label;
}

std::optional<std::string> detectEncoding(const std::string& filename) {
    const Compression compression = CompressionUtils::fromFilename(filename);
    if (compression != Compression::NONE) {
        ProcessUtils::TempFile plain = CompressionUtils::decompressToTemp(filename, compression);
        std::ifstream in(plain.path(), std::ios::binary);
        if (!in) throw Tabula::IOException("Could not open file: " + plain.path());
        return scanLines(in);
    }

    std::ifstream in(filename, std::ios::binary);
    if (!in) throw Tabula::IOException("Could not open file: " + filename);

    if (auto sniffed = sniffMimeEncoding(filename)) return sniffed;
    return scanLines(in);
}

std::optional<std::string> detectEncodingFromBytes(std::string_view bytes) {
    EncodingDetector detector;
    detector.feed(bytes);
    detector.close();
    return detector.result();
}

std::optional<std::string> detectEncoding(std::istream& is, const std::string& declaredEncoding) {
    if (!CommonUtils::trim(declaredEncoding).empty()) return declaredEncoding;

    const std::streampos start = is.tellg();
    auto detected = scanLines(is);
    is.clear();
    if (start != std::streampos(-1)) is.seekg(start);
    return detected;
}

bool needsTranscoding(const std::optional<std::string>& label) {
    if (!label) return false;
    const std::string l = CommonUtils::toLower(CommonUtils::trim(*label));
    return !(l.empty() || l == "utf-8" || l == "ascii" || l == "us-ascii");
}

std::string transcodeToUtf8(const std::string& bytes, const std::string& label) {
    IconvHandle handle(iconv_open("UTF-8", iconvName(label).c_str()));
    if (handle.cd == reinterpret_cast<iconv_t>(-1)) {
        throw Tabula::IOException("Unsupported text encoding: " + label);
    }

    std::string out;
    out.reserve(bytes.size() + bytes.size() / 2);
    std::vector<char> buffer(64 * 1024);

    char* inPtr = const_cast<char*>(bytes.data());
    size_t inLeft = bytes.size();
    while (inLeft > 0) {
        char* outPtr = buffer.data();
        size_t outLeft = buffer.size();
        const size_t rc = iconv(handle.cd, &inPtr, &inLeft, &outPtr, &outLeft);
        out.append(buffer.data(), buffer.size() - outLeft);
        if (rc == static_cast<size_t>(-1) && errno != E2BIG) {
            const size_t offset = bytes.size() - inLeft;
            throw Tabula::ParseException("Invalid " + label + " byte sequence at offset " + std::to_string(offset));
        }
    }

    char* outPtr = buffer.data();
    size_t outLeft = buffer.size();
    if (iconv(handle.cd, nullptr, nullptr, &outPtr, &outLeft) == static_cast<size_t>(-1)) {
        throw Tabula::ParseException("Truncated " + label + " byte sequence at end of input");
    }
    out.append(buffer.data(), buffer.size() - outLeft);
    return out;
}

} // namespace EncodingUtils
