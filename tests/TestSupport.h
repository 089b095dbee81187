#pragma once

#include "Logging.h"
#include "Table.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

// Temporary directory removed with everything in it on destruction.
class ScratchDir {
public:
    ScratchDir();
    ~ScratchDir();
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    std::string path(const std::string& name) const;
    // Writes `content` byte for byte and returns the path.
    std::string file(const std::string& name, const std::string& content) const;

private:
    std::filesystem::path root_;
};

// Routes TabulaLog into memory for the lifetime of the object.
class LogCapture {
public:
    LogCapture();
    ~LogCapture();

    const std::vector<std::string>& messages() const { return *messages_; }
    bool contains(const std::string& fragment) const;

private:
    std::shared_ptr<std::vector<std::string>> messages_;
    TabulaLog::Level previous_;
};

// NaN-aware column comparison.
void expectSameColumn(const NumericColumn& expected, const NumericColumn& actual);
void expectSameTable(const Table& expected, const Table& actual);

// Two rows covering every role and kind: a weight, continuous x (unit=cm, one NaN),
// discrete color, ordered class cls, string meta id.
Table sampleTable();
