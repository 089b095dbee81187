#include "FormatRegistry.h"
#include "Logging.h"
#include "TabulaConfig.h"
#include "TabulaExceptions.h"
#include "TerminalUI.h"
#include "VariableRegistry.h"
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char* argv[]) {
    TabulaConfig config;
    try {
        config = TabulaConfig::fromArgs(argc, argv);
    } catch (const Tabula::ConfigurationException& e) {
        std::cerr << "[Tabula][Error] " << e.what() << "\n";
        return 2;
    }

    const FormatRegistry registry = FormatRegistry::defaults();
    if (config.listFormats) {
        TerminalUI::printFormats(registry);
        return 0;
    }

    try {
        TabulaLog::setLevel(TabulaLog::parseLevel(config.logLevel));

        ReadOptions options = config.toReadOptions();
        std::unique_ptr<VariableRegistry> isolated;
        if (config.isolatedRegistry) {
            isolated = std::make_unique<VariableRegistry>();
            options.registry = isolated.get();
        }

        const Table table = TableIO::readTable(registry, config.inputPath, options);
        TabulaLog::info("Loaded " + std::to_string(table.rowCount()) + " rows from " + config.inputPath);

        if (config.summary) TerminalUI::printDomainSummary(config.inputPath, table);
        if (config.previewRows > 0) TerminalUI::printPreview(table, config.previewRows);

        if (!config.outputPath.empty()) {
            TableIO::writeTable(registry, config.outputPath, table);
            TabulaLog::info("Wrote " + config.outputPath);
        }
    } catch (const Tabula::TabulaException& e) {
        std::cerr << "[Tabula][Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Tabula][Exception] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
