#include "FileFormat.h"
#include "ColumnFlags.h"
#include "TabulaExceptions.h"

#include <algorithm>

void FileFormat::writeFile(const std::string& filename, const Table&) const {
    throw Tabula::FormatException(description() + " files cannot be written: " + filename);
}

namespace {
std::string typeHeader(const Variable& var, const std::vector<double>* column) {
    if (!var.isDiscrete()) return variableKindName(var.kind);
    if (var.values.size() < 2) return "discrete";
    if (var.ordered) return ColumnFlags::join(var.values);

    // A bare "discrete" re-reads as the sorted set of observed values; keep the order otherwise.
    if (!std::is_sorted(var.values.begin(), var.values.end())) return ColumnFlags::join(var.values);
    if (column) {
        std::vector<bool> seen(var.values.size(), false);
        for (double v : *column) {
            if (!TableUtils::isMissing(v) && v >= 0.0 && static_cast<size_t>(v) < seen.size()) seen[static_cast<size_t>(v)] = true;
        }
        if (std::find(seen.begin(), seen.end(), false) != seen.end()) return ColumnFlags::join(var.values);
    }
    return "discrete";
}

std::string flagHeader(const std::string& role, const Variable& var) {
    std::vector<std::string> tokens = {role};
    for (const auto& kv : var.attributes) tokens.push_back(kv.first + "=" + kv.second);
    return ColumnFlags::join(tokens);
}
} // namespace

namespace TableHeaders {

std::vector<std::string> names(const Table& table) {
    std::vector<std::string> out;
    const Domain& d = table.domain();
    for (size_t i = 0; i < table.W().size(); ++i) out.push_back("weights_" + std::to_string(i));
    for (const auto* group : {&d.attributes, &d.classVars, &d.metas}) {
        for (const auto& var : *group) out.push_back(var.name);
    }
    return out;
}

std::vector<std::string> types(const Table& table) {
    std::vector<std::string> out(table.W().size(), "continuous");
    const Domain& d = table.domain();
    for (size_t i = 0; i < d.attributes.size(); ++i) out.push_back(typeHeader(d.attributes[i], &table.X()[i]));
    for (size_t i = 0; i < d.classVars.size(); ++i) out.push_back(typeHeader(d.classVars[i], &table.Y()[i]));
    for (size_t i = 0; i < d.metas.size(); ++i) {
        out.push_back(typeHeader(d.metas[i], std::get_if<NumericColumn>(&table.metas()[i])));
    }
    return out;
}

std::vector<std::string> flags(const Table& table) {
    std::vector<std::string> out(table.W().size(), "weight");
    const Domain& d = table.domain();
    for (const auto& var : d.attributes) out.push_back(flagHeader("", var));
    for (const auto& var : d.classVars) out.push_back(flagHeader("class", var));
    for (const auto& var : d.metas) out.push_back(flagHeader("meta", var));
    return out;
}

std::vector<RawRow> rows(const Table& table) {
    const Domain& d = table.domain();
    std::vector<RawRow> out(table.rowCount());
    for (size_t r = 0; r < table.rowCount(); ++r) {
        RawRow& row = out[r];
        row.reserve(table.W().size() + d.size());
        for (const auto& w : table.W()) row.push_back(TableUtils::formatDouble(w[r]));
        for (size_t c = 0; c < d.attributes.size(); ++c) row.push_back(TableUtils::cellText(d.attributes[c], table.X()[c][r]));
        for (size_t c = 0; c < d.classVars.size(); ++c) row.push_back(TableUtils::cellText(d.classVars[c], table.Y()[c][r]));
        for (size_t c = 0; c < d.metas.size(); ++c) {
            if (const auto* strings = std::get_if<StringColumn>(&table.metas()[c])) {
                row.push_back((*strings)[r]);
            } else {
                row.push_back(TableUtils::cellText(d.metas[c], std::get<NumericColumn>(table.metas()[c])[r]));
            }
        }
    }
    return out;
}

} // namespace TableHeaders
