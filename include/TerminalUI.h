#pragma once
#include "FormatRegistry.h"
#include "Table.h"
#include <iostream>
#include <string>

class TerminalUI {
public:
    // One line per variable: role, name, kind and discrete values.
    static void printDomainSummary(const std::string& source, const Table& table, std::ostream& os = std::cout);

    // First `rows` rows in header column order.
    static void printPreview(const Table& table, size_t rows, std::ostream& os = std::cout);

    static void printFormats(const FormatRegistry& registry, std::ostream& os = std::cout);
};
