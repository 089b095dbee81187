#include "DelimitedFormat.h"
#include "CSVUtils.h"
#include "Compression.h"
#include "Logging.h"
#include "TableBuilder.h"
#include "TabulaExceptions.h"
#include "TextInput.h"

#include <fstream>
#include <sstream>

DelimitedFormat::DelimitedFormat(std::string name, std::string description, std::vector<std::string> extensions, char delimiter)
    : name_(std::move(name)), description_(std::move(description)), extensions_(std::move(extensions)), delimiter_(delimiter) {}

char DelimitedFormat::resolveDelimiter(const std::string& sample) const {
    std::string candidates(1, delimiter_);
    for (char c : std::string(",\t;: $")) {
        if (c != delimiter_) candidates.push_back(c);
    }
    const char sniffed = CSVUtils::sniffDelimiter(sample, candidates);
    if (sniffed == '\0') {
        TabulaLog::debug("Could not sniff a delimiter, using '" + std::string(1, delimiter_) + "'");
        return delimiter_;
    }
    return sniffed;
}

Table DelimitedFormat::readText(const std::string& text, const ReadOptions& options) const {
    std::istringstream in(text);
    CSVUtils::skipBOM(in);
    const std::streampos start = in.tellg();

    char delimiter = options.delimiter;
    if (delimiter == '\0') {
        std::string sample(kSniffBytes, '\0');
        in.read(&sample[0], static_cast<std::streamsize>(sample.size()));
        sample.resize(static_cast<size_t>(in.gcount()));
        delimiter = resolveDelimiter(sample);
        in.clear();
        in.seekg(start);
    }

    CSVUtils::CSVRowReader reader(in, delimiter);
    return TableBuilder(options).build(reader);
}

Table DelimitedFormat::readFile(const std::string& filename, const ReadOptions& options) const {
    return readText(TextInput::readUtf8(filename, options.encoding), options);
}

void DelimitedFormat::writeFile(const std::string& filename, const Table& table) const {
    const Compression compression = CompressionUtils::fromFilename(filename);
    ProcessUtils::TempFile plain;
    std::string path = filename;
    if (compression != Compression::NONE) {
        plain = ProcessUtils::TempFile(ProcessUtils::makeTempPath("write", extensions_.front()));
        path = plain.path();
    }

    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) throw Tabula::IOException("Could not open file for writing: " + filename);
        CSVUtils::writeRow(out, TableHeaders::names(table), delimiter_);
        CSVUtils::writeRow(out, TableHeaders::types(table), delimiter_);
        CSVUtils::writeRow(out, TableHeaders::flags(table), delimiter_);
        for (const auto& row : TableHeaders::rows(table)) CSVUtils::writeRow(out, row, delimiter_);
        out.flush();
        if (!out) throw Tabula::IOException("Failed writing file: " + filename);
    }

    if (compression != Compression::NONE) CompressionUtils::compressFile(path, filename, compression);
}
