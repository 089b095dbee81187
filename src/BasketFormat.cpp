#include "BasketFormat.h"
#include "CommonUtils.h"
#include "TableBuilder.h"
#include "TabulaExceptions.h"
#include "TextInput.h"

#include <sstream>
#include <unordered_map>

namespace {
// Sparse columns of one segment, grown as new names appear.
struct SparseGroup {
    std::vector<std::string> names;
    std::unordered_map<std::string, size_t> index;
    std::vector<std::unordered_map<size_t, double>> rows;

    void add(size_t row, const std::string& name, double value) {
        auto it = index.find(name);
        if (it == index.end()) {
            it = index.emplace(name, names.size()).first;
            names.push_back(name);
        }
        if (rows.size() <= row) rows.resize(row + 1);
        rows[row][it->second] += value;
    }

    std::vector<NumericColumn> columns(size_t rowCount, double absent) const {
        std::vector<NumericColumn> out(names.size(), NumericColumn(rowCount, absent));
        for (size_t r = 0; r < rows.size(); ++r) {
            for (const auto& kv : rows[r]) out[kv.first][r] = kv.second;
        }
        return out;
    }

    std::vector<Variable> variables() const {
        std::vector<Variable> vars;
        vars.reserve(names.size());
        for (const auto& n : names) vars.push_back(Variable::continuous(n));
        return vars;
    }
};
} // namespace

Table BasketFormat::readText(const std::string& text) const {
    SparseGroup groups[3];
    std::istringstream in(text);
    std::string line;
    size_t lineNo = 0;
    size_t rowCount = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        const std::string trimmed = CommonUtils::trim(line);
        if (trimmed.empty() || trimmed.front() == '#') continue;

        const auto segments = CommonUtils::splitOn(trimmed, '|');
        if (segments.size() > 3) {
            throw Tabula::ParseException("Basket line " + std::to_string(lineNo) + " has more than three '|' segments", rowCount);
        }
        for (size_t s = 0; s < segments.size(); ++s) {
            for (const auto& rawItem : CommonUtils::splitOn(segments[s], ',')) {
                const std::string item = CommonUtils::trim(rawItem);
                if (item.empty()) continue;

                std::string name = item;
                double value = 1.0;
                const size_t eq = item.find('=');
                if (eq != std::string::npos) {
                    name = CommonUtils::trim(item.substr(0, eq));
                    if (!TableBuilder::parseNumber(item.substr(eq + 1), value)) {
                        throw Tabula::ParseException("Invalid value in basket item '" + item + "' on line " + std::to_string(lineNo), rowCount);
                    }
                }
                if (name.empty()) {
                    throw Tabula::ParseException("Empty name in basket item '" + item + "' on line " + std::to_string(lineNo), rowCount);
                }
                groups[s].add(rowCount, name, value);
            }
        }
        ++rowCount;
    }

    Domain domain;
    domain.attributes = groups[0].variables();
    domain.classVars = groups[1].variables();
    domain.metas = groups[2].variables();

    std::vector<MetaColumn> metas;
    for (auto& column : groups[2].columns(rowCount, TableUtils::missingValue())) metas.emplace_back(std::move(column));

    return Table(std::move(domain),
                 groups[0].columns(rowCount, 0.0),
                 groups[1].columns(rowCount, TableUtils::missingValue()),
                 std::move(metas),
                 {},
                 rowCount);
}

Table BasketFormat::readFile(const std::string& filename, const ReadOptions& options) const {
    return readText(TextInput::readUtf8(filename, options.encoding));
}
