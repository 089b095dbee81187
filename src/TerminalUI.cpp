#include "TerminalUI.h"
#include "ColumnFlags.h"
#include <algorithm>
#include <iomanip>

namespace {
const char* kRule = "============================================================================================================\n";

void printVariable(std::ostream& os, const char* role, const Variable& var, int w) {
    os << std::left << std::setw(12) << role << std::setw(w) << var.name << std::setw(12) << variableKindName(var.kind);
    if (var.isDiscrete()) {
        os << (var.ordered ? "ordered: " : "") << ColumnFlags::join(var.values);
    }
    for (const auto& kv : var.attributes) os << "  " << kv.first << "=" << kv.second;
    os << "\n";
}
} // namespace

void TerminalUI::printDomainSummary(const std::string& source, const Table& table, std::ostream& os) {
    const Domain& d = table.domain();
    size_t maxNameLen = 15;
    for (const auto* group : {&d.attributes, &d.classVars, &d.metas}) {
        for (const auto& var : *group) maxNameLen = std::max(maxNameLen, var.name.length());
    }
    const int w = static_cast<int>(maxNameLen) + 2;

    os << "\n============================================== DOMAIN SUMMARY ==============================================\n";
    os << "Source: " << source << "\n"
       << "Rows: " << table.rowCount()
       << " | Attributes: " << d.attributes.size()
       << " | Class: " << d.classVars.size()
       << " | Metas: " << d.metas.size()
       << " | Weights: " << table.W().size() << "\n";
    os << std::left << std::setw(12) << "Role" << std::setw(w) << "Variable" << std::setw(12) << "Kind" << "Values\n";
    os << std::string(static_cast<size_t>(w) + 12 * 3, '-') << "\n";
    for (const auto& var : d.attributes) printVariable(os, "attribute", var, w);
    for (const auto& var : d.classVars) printVariable(os, "class", var, w);
    for (const auto& var : d.metas) printVariable(os, "meta", var, w);
    os << kRule;
}

void TerminalUI::printPreview(const Table& table, size_t rows, std::ostream& os) {
    const auto names = TableHeaders::names(table);
    const auto cells = TableHeaders::rows(table);
    const size_t shown = std::min(rows, cells.size());

    os << "\n================================================= PREVIEW ==================================================\n";
    for (const auto& name : names) os << std::left << std::setw(14) << name;
    os << "\n" << std::string(names.size() * 14, '-') << "\n";
    for (size_t r = 0; r < shown; ++r) {
        for (const auto& cell : cells[r]) os << std::left << std::setw(14) << cell;
        os << "\n";
    }
    if (shown < cells.size()) os << "... " << (cells.size() - shown) << " more rows\n";
    os << kRule;
}

void TerminalUI::printFormats(const FormatRegistry& registry, std::ostream& os) {
    os << "Readable and writable formats:\n";
    for (const auto& line : registry.descriptions()) os << "  " << line << "\n";
    os << "Reader extensions:";
    for (const auto& entry : registry.readers()) os << " " << entry.first;
    os << "\nWriter extensions:";
    for (const auto& entry : registry.writers()) os << " " << entry.first;
    os << "\n";
}
