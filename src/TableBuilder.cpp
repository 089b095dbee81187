#include "TableBuilder.h"
#include "ColumnFlags.h"
#include "CommonUtils.h"
#include "Logging.h"
#include "TabulaExceptions.h"
#include "VariableRegistry.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <set>
#include <unordered_map>
#ifdef USE_OPENMP
#include <omp.h>
#endif

VariableRegistry& ReadOptions::effectiveRegistry() const {
    return registry ? *registry : VariableRegistry::global();
}

namespace {
enum class TypeTag { NONE, CONTINUOUS, DISCRETE, STRING, VALUE_LIST };

TypeTag classifyTag(const std::string& tag) {
    if (tag.empty()) return TypeTag::NONE;
    if (tag == "string" || tag == "s" || tag == "text") return TypeTag::STRING;
    if (tag == "continuous" || tag == "c") return TypeTag::CONTINUOUS;
    if (tag == "discrete" || tag == "d") return TypeTag::DISCRETE;
    if (HeaderParser::isDiscreteList(tag)) return TypeTag::VALUE_LIST;
    return TypeTag::NONE;
}

// Converted form of one column, produced independently of the other columns.
struct ColumnResult {
    bool skipped = false;
    VariableKind kind = VariableKind::CONTINUOUS;
    std::vector<std::string> values;
    bool ordered = false;
    NumericColumn numeric;
    StringColumn strings;
    std::optional<Tabula::ParseException> error;
};

std::vector<std::string> parseValueList(const std::string& tag, size_t column) {
    std::vector<std::string> values = ColumnFlags::split(CommonUtils::trim(tag));
    std::set<std::string> seen;
    for (const auto& value : values) {
        if (value.empty()) {
            throw Tabula::ParseException("Empty value in discrete value list '" + tag + "'", Tabula::ParseException::npos, column);
        }
        if (value.back() == '\\') {
            throw Tabula::ParseException("Dangling escape in discrete value list '" + tag + "'", Tabula::ParseException::npos, column);
        }
        if (!seen.insert(value).second) {
            throw Tabula::ParseException("Duplicate value '" + value + "' in discrete value list '" + tag + "'",
                                         Tabula::ParseException::npos, column);
        }
    }
    return values;
}

NumericColumn indexColumn(const std::vector<std::string>& cells,
                          const std::vector<uint8_t>& missing,
                          const std::vector<std::string>& values) {
    std::unordered_map<std::string, double> index;
    for (size_t i = 0; i < values.size(); ++i) index.emplace(values[i], static_cast<double>(i));

    NumericColumn out(cells.size(), TableUtils::missingValue());
    for (size_t r = 0; r < cells.size(); ++r) {
        if (missing[r]) continue;
        auto it = index.find(cells[r]);
        if (it != index.end()) out[r] = it->second;
    }
    return out;
}

std::vector<std::string> sortedDistinct(const std::vector<std::string>& cells, const std::vector<uint8_t>& missing) {
    std::set<std::string> distinct;
    for (size_t r = 0; r < cells.size(); ++r) {
        if (!missing[r]) distinct.insert(cells[r]);
    }
    return std::vector<std::string>(distinct.begin(), distinct.end());
}

// Existing variables keep their index space: remap indices from `inferred` order to `canonical`.
void remapIndices(NumericColumn& column, const std::vector<std::string>& inferred, const std::vector<std::string>& canonical) {
    std::unordered_map<std::string, size_t> position;
    for (size_t i = 0; i < canonical.size(); ++i) position.emplace(canonical[i], i);

    std::vector<double> mapping(inferred.size());
    for (size_t i = 0; i < inferred.size(); ++i) mapping[i] = static_cast<double>(position.at(inferred[i]));

    for (double& v : column) {
        if (!TableUtils::isMissing(v)) v = mapping[static_cast<size_t>(v)];
    }
}
} // namespace

TableBuilder::TableBuilder(ReadOptions options)
    : options_(std::move(options)),
      missingTokens_(options_.missingValues.begin(), options_.missingValues.end()) {}

bool TableBuilder::isMissingToken(const std::string& trimmed) const {
    return trimmed.empty() || missingTokens_.count(trimmed) > 0;
}

bool TableBuilder::parseNumber(const std::string& token, double& out) {
    std::string s = CommonUtils::trim(token);
    if (!s.empty() && s.front() == '+') s.erase(s.begin());
    if (s.empty()) return false;
    const char* b = s.data();
    const char* e = b + s.size();
    auto [p, ec] = std::from_chars(b, e, out, std::chars_format::general);
    return ec == std::errc{} && p == e;
}

std::optional<std::vector<std::string>> TableBuilder::inferDiscreteValues(const std::vector<std::string>& cells,
                                                                          const std::vector<uint8_t>& missing) const {
    std::vector<std::string> distinct = sortedDistinct(cells, missing);
    if (distinct.empty()) return std::nullopt;

    bool numericLooking = true;
    size_t probed = 0;
    for (size_t r = 0; r < cells.size() && probed < 3; ++r) {
        if (missing[r]) continue;
        ++probed;
        double v = 0.0;
        if (!parseNumber(cells[r], v)) {
            numericLooking = false;
            break;
        }
    }

    if (numericLooking) {
        if (distinct.size() > options_.discreteMaxNumericValues) return std::nullopt;
        bool binary = true;
        bool someLabel = false;
        for (const auto& value : distinct) {
            double v = 0.0;
            if (!parseNumber(value, v)) {
                someLabel = true;
                binary = false;
            } else if (v != 0.0 && v != 1.0) {
                binary = false;
            }
        }
        if (binary || someLabel) return distinct;
        return std::nullopt;
    }

    const double limit = std::round(std::pow(static_cast<double>(cells.size()), options_.discreteCardinalityExponent));
    if (static_cast<double>(distinct.size()) <= limit) return distinct;
    return std::nullopt;
}

Table TableBuilder::build(RowSource& rows) const {
    ParsedHeaders parsed = HeaderParser::parseHeaders(rows, options_.headerNumericRatio);
    SplicedRowSource data(std::move(parsed.pushedBack), rows);
    return build(parsed.rows, data);
}

Table TableBuilder::build(const std::vector<RawRow>& headers, RowSource& rows) const {
    std::vector<RawRow> data;
    size_t dataWidth = 0;
    RawRow row;
    while (rows.next(row)) {
        if (!CommonUtils::anyNonBlank(row)) continue;
        dataWidth = std::max(dataWidth, row.size());
        data.push_back(std::move(row));
        row.clear();
    }

    const std::vector<HeaderTriple> triples = HeaderParser::normalizeHeaders(headers, dataWidth);
    const size_t width = triples.size();
    if (width == 0) throw Tabula::ParseException("No columns found");
    const size_t rowCount = data.size();

    std::vector<ColumnFlags> flags;
    flags.reserve(width);
    for (const auto& triple : triples) flags.push_back(ColumnFlags::parse(triple.flags));

    std::vector<ColumnResult> results(width);

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t c = 0; c < width; ++c) {
        ColumnResult& result = results[c];
        if (flags[c].isIgnore) {
            result.skipped = true;
            continue;
        }

        std::vector<std::string> cells(rowCount);
        std::vector<uint8_t> missing(rowCount, static_cast<uint8_t>(0));
        for (size_t r = 0; r < rowCount; ++r) {
            if (c < data[r].size()) cells[r] = CommonUtils::trim(data[r][c]);
            if (isMissingToken(cells[r])) missing[r] = static_cast<uint8_t>(1);
        }

        try {
            const std::string tag = CommonUtils::trim(triples[c].typeTag);
            TypeTag typeTag = classifyTag(tag);
            if (typeTag == TypeTag::NONE && !tag.empty()) {
                TabulaLog::warning("Unknown type tag '" + tag + "' for column " + std::to_string(c + 1) + ", inferring type");
            }

            if (typeTag == TypeTag::VALUE_LIST) {
                result.kind = VariableKind::DISCRETE;
                result.values = parseValueList(tag, c);
                result.ordered = true;
            } else if (typeTag == TypeTag::DISCRETE) {
                result.kind = VariableKind::DISCRETE;
                result.values = sortedDistinct(cells, missing);
            } else if (typeTag == TypeTag::STRING) {
                result.kind = VariableKind::STRING;
            } else if (typeTag == TypeTag::CONTINUOUS) {
                result.kind = VariableKind::CONTINUOUS;
            } else if (auto discrete = inferDiscreteValues(cells, missing)) {
                result.kind = VariableKind::DISCRETE;
                result.values = std::move(*discrete);
            } else {
                result.kind = VariableKind::CONTINUOUS;
                double v = 0.0;
                for (size_t r = 0; r < rowCount; ++r) {
                    if (!missing[r] && !parseNumber(cells[r], v)) {
                        result.kind = VariableKind::STRING;
                        break;
                    }
                }
            }

            if (result.kind == VariableKind::STRING) {
                result.strings.resize(rowCount);
                for (size_t r = 0; r < rowCount; ++r) {
                    if (!missing[r]) result.strings[r] = std::move(cells[r]);
                }
            } else if (result.kind == VariableKind::DISCRETE) {
                result.numeric = indexColumn(cells, missing, result.values);
            } else {
                result.numeric.assign(rowCount, TableUtils::missingValue());
                for (size_t r = 0; r < rowCount; ++r) {
                    if (missing[r]) continue;
                    if (!parseNumber(cells[r], result.numeric[r])) {
                        throw Tabula::ParseException("could not convert string to float: '" + cells[r] + "'", r, c);
                    }
                }
            }
        } catch (const Tabula::ParseException& e) {
            result.error = e;
        }
    }

    for (const auto& result : results) {
        if (result.error) throw *result.error;
    }

    Domain domain;
    std::vector<NumericColumn> X;
    std::vector<NumericColumn> Y;
    std::vector<MetaColumn> metas;
    std::vector<NumericColumn> W;
    VariableRegistry& registry = options_.effectiveRegistry();
    size_t nextFeature = 1;

    for (size_t c = 0; c < width; ++c) {
        ColumnResult& result = results[c];
        if (result.skipped) continue;

        if (!flags[c].isMeta && result.kind != VariableKind::STRING && flags[c].isWeight) {
            W.push_back(std::move(result.numeric));
            continue;
        }

        Variable var;
        var.name = triples[c].name.empty() ? "Feature " + std::to_string(nextFeature++) : triples[c].name;
        var.kind = result.kind;
        var.ordered = result.ordered;
        var.attributes = flags[c].attributes;

        if (result.kind == VariableKind::DISCRETE) {
            if (result.ordered) {
                registry.declare(var.name, result.values);
                var.values = std::move(result.values);
            } else {
                var.values = registry.canonicalize(var.name, result.values);
                if (var.values != result.values) remapIndices(result.numeric, result.values, var.values);
            }
        }

        if (flags[c].isMeta || result.kind == VariableKind::STRING) {
            if (result.kind == VariableKind::STRING) {
                metas.emplace_back(std::move(result.strings));
            } else {
                metas.emplace_back(std::move(result.numeric));
            }
            domain.metas.push_back(std::move(var));
        } else if (flags[c].isClass) {
            Y.push_back(std::move(result.numeric));
            domain.classVars.push_back(std::move(var));
        } else {
            X.push_back(std::move(result.numeric));
            domain.attributes.push_back(std::move(var));
        }
    }

    if (headers.size() <= 1 && domain.classVars.empty() && domain.attributes.size() > 1) {
        domain.classVars.push_back(std::move(domain.attributes.back()));
        domain.attributes.pop_back();
        Y.push_back(std::move(X.back()));
        X.pop_back();
    }

    return Table(std::move(domain), std::move(X), std::move(Y), std::move(metas), std::move(W), rowCount);
}
