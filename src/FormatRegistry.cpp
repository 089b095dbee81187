#include "FormatRegistry.h"
#include "BasketFormat.h"
#include "BinaryTableFormat.h"
#include "CommonUtils.h"
#include "Compression.h"
#include "DelimitedFormat.h"
#include "ExcelFormat.h"
#include "Logging.h"
#include "ParquetFormat.h"
#include "TabulaExceptions.h"

#include <algorithm>

namespace {
// Pickled tables can execute code when loaded, so they are refused by name.
void rejectPickled(const std::string& filename) {
    const std::string lower = CommonUtils::toLower(filename);
    for (const char* ext : {".pkl", ".pickle"}) {
        bool matched = CommonUtils::endsWith(lower, ext);
        for (const auto& sfx : CompressionUtils::suffixes()) matched = matched || CommonUtils::endsWith(lower, ext + sfx);
        if (matched) throw Tabula::FormatException("Pickled tables are not supported: \"" + filename + "\"");
    }
}
} // namespace

FormatRegistry FormatRegistry::defaults() {
    FormatRegistry registry;
    registry.registerFormat(std::make_shared<CSVFormat>());
    registry.registerFormat(std::make_shared<TabFormat>());
    registry.registerFormat(std::make_shared<ExcelFormat>());
    registry.registerFormat(std::make_shared<BasketFormat>());
    registry.registerFormat(std::make_shared<BinaryTableFormat>());
    registry.registerFormat(std::make_shared<ParquetFormat>());
    return registry;
}

void FormatRegistry::registerFormat(std::shared_ptr<const FileFormat> format) {
    if (!format) return;
    const FileFormat* raw = format.get();
    formats_.push_back(std::move(format));

    auto claim = [&](const std::string& ext) {
        auto it = std::find_if(extensions_.begin(), extensions_.end(), [&](const auto& entry) { return entry.first == ext; });
        if (it != extensions_.end()) {
            TabulaLog::debug("Extension " + ext + " moves from " + it->second->name() + " to " + raw->name());
            it->second = raw;
        } else {
            extensions_.emplace_back(ext, raw);
        }
    };

    for (const auto& ext : raw->extensions()) {
        const std::string lower = CommonUtils::toLower(ext);
        claim(lower);
        if (raw->supportsCompressed()) {
            for (const auto& sfx : CompressionUtils::suffixes()) claim(lower + sfx);
        }
    }
}

bool FormatRegistry::splitSheetSelector(const std::string& filename,
                                        const std::vector<std::string>& extensions,
                                        std::string& path,
                                        std::string& sheet) {
    const size_t colon = filename.rfind(':');
    if (colon == std::string::npos) return false;
    const std::string head = CommonUtils::toLower(filename.substr(0, colon));
    for (const auto& ext : extensions) {
        const std::string lower = CommonUtils::toLower(ext);
        bool matched = CommonUtils::endsWith(head, lower);
        for (const auto& sfx : CompressionUtils::suffixes()) matched = matched || CommonUtils::endsWith(head, lower + sfx);
        if (matched) {
            path = filename.substr(0, colon);
            sheet = filename.substr(colon + 1);
            return true;
        }
    }
    return false;
}

const FileFormat* FormatRegistry::find(const std::string& filename, bool forWriting) const {
    const std::string lower = CommonUtils::toLower(filename);
    const FileFormat* best = nullptr;
    size_t bestLength = 0;

    for (const auto& entry : extensions_) {
        const FileFormat* format = entry.second;
        if (forWriting ? !format->canWrite() : !format->canRead()) continue;

        bool matched = CommonUtils::endsWith(lower, entry.first);
        if (!matched && !forWriting && format->acceptsSheetSelector()) {
            std::string path;
            std::string sheet;
            matched = splitSheetSelector(lower, {entry.first}, path, sheet) && CommonUtils::endsWith(path, entry.first);
        }
        if (matched && entry.first.size() > bestLength) {
            best = format;
            bestLength = entry.first.size();
        }
    }
    return best;
}

const FileFormat& FormatRegistry::readerFor(const std::string& filename) const {
    rejectPickled(filename);
    const FileFormat* format = find(filename, false);
    if (!format) throw Tabula::FormatException("No readers for file \"" + filename + "\"");
    return *format;
}

const FileFormat& FormatRegistry::writerFor(const std::string& filename) const {
    rejectPickled(filename);
    const FileFormat* format = find(filename, true);
    if (!format) throw Tabula::FormatException("No writers for file \"" + filename + "\"");
    return *format;
}

std::vector<std::pair<std::string, const FileFormat*>> FormatRegistry::readers() const {
    std::vector<std::pair<std::string, const FileFormat*>> out;
    for (const auto& entry : extensions_) {
        if (entry.second->canRead()) out.push_back(entry);
    }
    return out;
}

std::vector<std::pair<std::string, const FileFormat*>> FormatRegistry::writers() const {
    std::vector<std::pair<std::string, const FileFormat*>> out;
    for (const auto& entry : extensions_) {
        if (entry.second->canWrite()) out.push_back(entry);
    }
    return out;
}

std::vector<std::string> FormatRegistry::descriptions() const {
    std::vector<std::string> out;
    for (const auto& format : formats_) {
        std::string line = format->description() + " (";
        const auto exts = format->extensions();
        for (size_t i = 0; i < exts.size(); ++i) {
            if (i > 0) line += " ";
            line += "*" + exts[i];
        }
        out.push_back(line + ")");
    }
    return out;
}

namespace TableIO {

namespace {
const FormatRegistry& defaultRegistry() {
    static const FormatRegistry registry = FormatRegistry::defaults();
    return registry;
}
} // namespace

Table readTable(const FormatRegistry& registry, const std::string& filename, const ReadOptions& options) {
    const FileFormat& format = registry.readerFor(filename);
    TabulaLog::debug("Reading " + filename + " as " + format.name());
    try {
        return format.readFile(filename, options);
    } catch (const Tabula::ParseException& e) {
        throw e.withFilename(filename);
    }
}

Table readTable(const std::string& filename, const ReadOptions& options) {
    return readTable(defaultRegistry(), filename, options);
}

void writeTable(const FormatRegistry& registry, const std::string& filename, const Table& table) {
    const FileFormat& format = registry.writerFor(filename);
    TabulaLog::debug("Writing " + filename + " as " + format.name());
    format.writeFile(filename, table);
}

void writeTable(const std::string& filename, const Table& table) {
    writeTable(defaultRegistry(), filename, table);
}

} // namespace TableIO
