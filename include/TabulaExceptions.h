#ifndef TABULA_EXCEPTIONS_H
#define TABULA_EXCEPTIONS_H

#include <cstddef>
#include <stdexcept>
#include <string>

namespace Tabula {

class TabulaException : public std::runtime_error {
public:
    explicit TabulaException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public TabulaException {
public:
    explicit IOException(const std::string& message) : TabulaException("IO Error: " + message) {}
};

// No reader or writer is registered for a filename.
class FormatException : public TabulaException {
public:
    explicit FormatException(const std::string& message) : TabulaException("Format Error: " + message) {}
};

class ConfigurationException : public TabulaException {
public:
    explicit ConfigurationException(const std::string& message) : TabulaException("Configuration Error: " + message) {}
};

/**
 * @brief Malformed content inside a readable file.
 * @details row/column are zero-based data positions, npos when unknown.
 * The raw cause is kept separately so readTable() can rewrap it once with the filename.
 */
class ParseException : public TabulaException {
public:
    static constexpr size_t npos = static_cast<size_t>(-1);

    explicit ParseException(const std::string& cause, size_t row = npos, size_t column = npos)
        : TabulaException(format(cause, row, column)), cause_(cause), row_(row), column_(column) {}

    const std::string& cause() const noexcept { return cause_; }
    size_t row() const noexcept { return row_; }
    size_t column() const noexcept { return column_; }

    ParseException withFilename(const std::string& filename) const {
        return ParseException("Cannot parse dataset " + filename + ": " + cause_, row_, column_);
    }

private:
    static std::string format(const std::string& cause, size_t row, size_t column) {
        std::string out = cause;
        if (row != npos) out += " (row " + std::to_string(row + 1);
        if (column != npos) out += (row != npos ? ", column " : " (column ") + std::to_string(column + 1);
        if (row != npos || column != npos) out += ")";
        return out;
    }

    std::string cause_;
    size_t row_;
    size_t column_;
};

} // namespace Tabula

#endif // TABULA_EXCEPTIONS_H
