#include "Compression.h"
#include "CommonUtils.h"
#include "Logging.h"
#include "TabulaExceptions.h"

#include <filesystem>
#include <fstream>

namespace {
const char* toolFor(Compression compression) {
    switch (compression) {
        case Compression::GZIP: return "gzip";
        case Compression::BZIP2: return "bzip2";
        case Compression::XZ: return "xz";
        case Compression::NONE: break;
    }
    return "";
}

std::string requireTool(Compression compression) {
    const std::string tool = toolFor(compression);
    const std::string exe = ProcessUtils::findExecutableInPath(tool);
    if (exe.empty()) {
        throw Tabula::IOException(tool + " is required to handle " + CompressionUtils::suffix(compression) + " files");
    }
    return exe;
}
} // namespace

namespace CompressionUtils {

const std::vector<std::string>& suffixes() {
    static const std::vector<std::string> all = {".gz", ".bz2", ".xz"};
    return all;
}

Compression fromFilename(const std::string& filename) {
    if (CommonUtils::endsWith(filename, ".gz")) return Compression::GZIP;
    if (CommonUtils::endsWith(filename, ".bz2")) return Compression::BZIP2;
    if (CommonUtils::endsWith(filename, ".xz")) return Compression::XZ;
    return Compression::NONE;
}

std::string suffix(Compression compression) {
    switch (compression) {
        case Compression::GZIP: return ".gz";
        case Compression::BZIP2: return ".bz2";
        case Compression::XZ: return ".xz";
        case Compression::NONE: break;
    }
    return "";
}

std::string stripSuffix(const std::string& filename) {
    const std::string sfx = suffix(fromFilename(filename));
    return filename.substr(0, filename.size() - sfx.size());
}

ProcessUtils::TempFile decompressToTemp(const std::string& path, Compression compression) {
    {
        std::ifstream probe(path, std::ios::binary);
        if (!probe) throw Tabula::IOException("Could not open file: " + path);
    }
    const std::string exe = requireTool(compression);

    const std::string plainName = std::filesystem::path(stripSuffix(path)).extension().string();
    ProcessUtils::TempFile tmp(ProcessUtils::makeTempPath("plain", plainName));
    const int rc = ProcessUtils::spawnToFile(exe, {"-cd", path}, tmp.path());
    if (rc != 0) {
        throw Tabula::IOException("Failed to decompress " + path + " (" + toolFor(compression) + " exit status " + std::to_string(rc) + ")");
    }
    TabulaLog::debug("Decompressed " + path + " into " + tmp.path());
    return tmp;
}

void compressFile(const std::string& plainPath, const std::string& targetPath, Compression compression) {
    const std::string exe = requireTool(compression);
    const int rc = ProcessUtils::spawnToFile(exe, {"-c"}, targetPath, plainPath);
    if (rc != 0) {
        std::error_code ec;
        std::filesystem::remove(targetPath, ec);
        throw Tabula::IOException("Failed to compress " + targetPath + " (" + toolFor(compression) + " exit status " + std::to_string(rc) + ")");
    }
}

} // namespace CompressionUtils
