#include "TabulaConfig.h"
#include "CommonUtils.h"
#include "Logging.h"
#include "TabulaExceptions.h"

#include <algorithm>
#include <fstream>
#include <utility>

namespace {
std::vector<std::string> splitCSV(const std::string& s) {
    std::vector<std::string> out;
    for (const auto& part : CommonUtils::splitOn(s, ',')) {
        std::string t = CommonUtils::trim(part);
        if (!t.empty()) out.push_back(t);
    }
    return out;
}

template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Tabula::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Tabula::TabulaException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Tabula::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

// Drops '{' '}' outside quotes and a trailing ',' so JSON-ish lines read as key: value.
std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) continue;
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) return i;
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// "--Header-Numeric-Ratio" and "header-numeric-ratio" both become "header_numeric_ratio".
std::string normalizeConfigKey(std::string key) {
    key = CommonUtils::toLower(CommonUtils::trim(key));
    while (!key.empty() && key.front() == '-') key.erase(key.begin());
    std::replace(key.begin(), key.end(), '-', '_');
    return key;
}

size_t parseSizeStrict(const std::string& value, const std::string& key, size_t minValue) {
    if (!value.empty() && value.front() == '-') {
        throw Tabula::ConfigurationException("Invalid unsigned integer for " + key + ": " + value);
    }
    const unsigned long long parsed = parseNumericStrict<unsigned long long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoull(v, pos); });
    if (parsed < minValue) {
        throw Tabula::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return static_cast<size_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key) {
    return parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Tabula::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

char parseDelimiter(const std::string& value) {
    const std::string lowered = CommonUtils::toLower(value);
    if (lowered == "auto") return '\0';
    if (lowered == "tab" || value == "\\t") return '\t';
    if (value.size() != 1) throw Tabula::ConfigurationException("delimiter expects a single character, 'tab' or 'auto'");
    return value[0];
}

void assignKeyValue(TabulaConfig& config, const std::string& key, const std::string& value) {
    if (key == "input") config.inputPath = value;
    else if (key == "output") config.outputPath = value;
    else if (key == "delimiter") config.delimiter = parseDelimiter(value);
    else if (key == "sheet") config.sheet = value;
    else if (key == "encoding") config.encoding = value;
    else if (key == "header_numeric_ratio") config.headerNumericRatio = parseDoubleStrict(value, key);
    else if (key == "discrete_max_numeric_values") config.discreteMaxNumericValues = parseSizeStrict(value, key, 1);
    else if (key == "discrete_cardinality_exponent") config.discreteCardinalityExponent = parseDoubleStrict(value, key);
    else if (key == "missing_values") config.missingValues = splitCSV(value);
    else if (key == "summary") config.summary = parseBoolStrict(value, key);
    else if (key == "preview_rows") config.previewRows = parseSizeStrict(value, key, 0);
    else if (key == "log_level") config.logLevel = CommonUtils::toLower(value);
    else if (key == "isolated_registry") config.isolatedRegistry = parseBoolStrict(value, key);
    else throw Tabula::ConfigurationException("Unknown config key: " + key);
}
} // namespace

std::string TabulaConfig::usage() {
    return "Usage: tabula <input> [--output path] [--config path] [--delimiter c|tab|auto] [--sheet name|index] "
           "[--encoding label] [--header-numeric-ratio 0..1] [--discrete-max-numeric-values N] "
           "[--discrete-cardinality-exponent 0..1] [--missing-values a,b,...] [--summary true|false] "
           "[--preview-rows N] [--log-level debug|info|warning|error] [--verbose] [--isolated-registry true|false]\n"
           "       tabula --formats";
}

TabulaConfig TabulaConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2) throw Tabula::ConfigurationException(usage());

    TabulaConfig config;
    int first = 1;
    if (std::string(argv[1]) == "--formats") {
        config.listFormats = true;
        config.validate();
        return config;
    }
    if (CommonUtils::startsWith(argv[1], "--")) {
        throw Tabula::ConfigurationException(usage());
    }
    config.inputPath = argv[first];

    std::string configPath;
    std::vector<std::pair<std::string, std::string>> overrides;
    for (int i = first + 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--verbose") {
            overrides.emplace_back("log_level", "info");
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (CommonUtils::startsWith(arg, "--") && i + 1 < argc) {
            overrides.emplace_back(normalizeConfigKey(arg), argv[++i]);
        } else {
            throw Tabula::ConfigurationException("Unexpected argument '" + arg + "'\n" + usage());
        }
    }

    // Command-line values win over the config file.
    if (!configPath.empty()) {
        config = fromFile(configPath, config);
        if (config.inputPath.empty()) config.inputPath = argv[first];
    }
    for (const auto& kv : overrides) assignKeyValue(config, kv.first, kv.second);

    config.validate();
    return config;
}

TabulaConfig TabulaConfig::fromFile(const std::string& configPath, const TabulaConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Tabula::ConfigurationException("Could not open config file: " + configPath);

    TabulaConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value);
        } catch (const Tabula::TabulaException& ex) {
            throw Tabula::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    config.validate();

    return config;
}

void TabulaConfig::validate() const {
    if (listFormats) return;
    if (inputPath.empty()) throw Tabula::ConfigurationException("input path is required");
    if (!(headerNumericRatio > 0.0 && headerNumericRatio <= 1.0)) {
        throw Tabula::ConfigurationException("header_numeric_ratio must be within (0,1]");
    }
    if (!(discreteCardinalityExponent > 0.0 && discreteCardinalityExponent <= 1.0)) {
        throw Tabula::ConfigurationException("discrete_cardinality_exponent must be within (0,1]");
    }
    if (discreteMaxNumericValues < 1) {
        throw Tabula::ConfigurationException("discrete_max_numeric_values must be >= 1");
    }
    TabulaLog::parseLevel(logLevel);
}

ReadOptions TabulaConfig::toReadOptions() const {
    ReadOptions options;
    options.missingValues = missingValues;
    options.headerNumericRatio = headerNumericRatio;
    options.discreteMaxNumericValues = discreteMaxNumericValues;
    options.discreteCardinalityExponent = discreteCardinalityExponent;
    options.delimiter = delimiter;
    options.sheet = sheet;
    options.encoding = encoding;
    return options;
}
