#include "Table.h"
#include "TabulaExceptions.h"

#include <array>
#include <charconv>
#include <cmath>
#include <limits>

namespace {
void checkColumns(const std::vector<NumericColumn>& columns,
                  size_t expectedCount,
                  size_t rowCount,
                  const char* what) {
    if (columns.size() != expectedCount) {
        throw Tabula::TabulaException(std::string("Table ") + what + " has " + std::to_string(columns.size()) +
                                      " columns, domain declares " + std::to_string(expectedCount));
    }
    for (size_t c = 0; c < columns.size(); ++c) {
        if (columns[c].size() != rowCount) {
            throw Tabula::TabulaException(std::string("Table ") + what + " column " + std::to_string(c) + " has " +
                                          std::to_string(columns[c].size()) + " rows, expected " + std::to_string(rowCount));
        }
    }
}
} // namespace

Table::Table(Domain domain,
             std::vector<NumericColumn> X,
             std::vector<NumericColumn> Y,
             std::vector<MetaColumn> metas,
             std::vector<NumericColumn> W,
             size_t rowCount)
    : domain_(std::move(domain)),
      X_(std::move(X)),
      Y_(std::move(Y)),
      metas_(std::move(metas)),
      W_(std::move(W)),
      rowCount_(rowCount) {
    checkColumns(X_, domain_.attributes.size(), rowCount_, "X");
    checkColumns(Y_, domain_.classVars.size(), rowCount_, "Y");
    checkColumns(W_, W_.size(), rowCount_, "W");

    if (metas_.size() != domain_.metas.size()) {
        throw Tabula::TabulaException("Table metas has " + std::to_string(metas_.size()) +
                                      " columns, domain declares " + std::to_string(domain_.metas.size()));
    }
    for (size_t c = 0; c < metas_.size(); ++c) {
        const bool isStringStorage = std::holds_alternative<StringColumn>(metas_[c]);
        if (isStringStorage != domain_.metas[c].isString()) {
            throw Tabula::TabulaException("Table meta column '" + domain_.metas[c].name + "' storage does not match its kind");
        }
        if (TableUtils::metaColumnSize(metas_[c]) != rowCount_) {
            throw Tabula::TabulaException("Table meta column '" + domain_.metas[c].name + "' has " +
                                          std::to_string(TableUtils::metaColumnSize(metas_[c])) + " rows, expected " +
                                          std::to_string(rowCount_));
        }
    }

    // Primitive variables cannot live in X or Y with string storage.
    for (const auto* group : {&domain_.attributes, &domain_.classVars}) {
        for (const auto& var : *group) {
            if (var.isString()) {
                throw Tabula::TabulaException("String variable '" + var.name + "' must be placed among metas");
            }
        }
    }
}

namespace TableUtils {

bool isMissing(double value) {
    return std::isnan(value);
}

double missingValue() {
    return std::numeric_limits<double>::quiet_NaN();
}

std::string formatDouble(double value) {
    if (std::isnan(value)) return "?";
    std::array<char, 64> buf{};
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    if (ec != std::errc{}) return std::to_string(value);
    return std::string(buf.data(), ptr);
}

size_t metaColumnSize(const MetaColumn& column) {
    return std::visit([](const auto& values) { return values.size(); }, column);
}

std::string cellText(const Variable& var, double value) {
    if (isMissing(value)) return "?";
    if (var.isDiscrete()) {
        if (!(value >= 0.0 && value < static_cast<double>(var.values.size()))) return "?";
        return var.values[static_cast<size_t>(value)];
    }
    return formatDouble(value);
}

} // namespace TableUtils
