#pragma once

#include "Variable.h"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

using NumericColumn = std::vector<double>;
using StringColumn = std::vector<std::string>;
// Meta columns keep strings for STRING variables and doubles for everything else.
using MetaColumn = std::variant<NumericColumn, StringColumn>;

/**
 * @brief Typed, role-partitioned, column-major table.
 * @details Discrete cells hold the zero-based value index as a double; missing
 * numeric or discrete cells are NaN, missing string cells are "".
 */
class Table {
public:
    Table() = default;

    /**
     * @pre X.size() == domain.attributes.size(), Y.size() == domain.classVars.size(),
     *      metas.size() == domain.metas.size(), and every column (W included) has rowCount entries.
     * @post rowCount() == rowCount.
     * @throws Tabula::TabulaException when any column or the domain does not match.
     */
    Table(Domain domain,
          std::vector<NumericColumn> X,
          std::vector<NumericColumn> Y,
          std::vector<MetaColumn> metas,
          std::vector<NumericColumn> W,
          size_t rowCount);

    const Domain& domain() const noexcept { return domain_; }
    size_t rowCount() const noexcept { return rowCount_; }

    const std::vector<NumericColumn>& X() const noexcept { return X_; }
    const std::vector<NumericColumn>& Y() const noexcept { return Y_; }
    const std::vector<MetaColumn>& metas() const noexcept { return metas_; }
    const std::vector<NumericColumn>& W() const noexcept { return W_; }

    bool hasWeights() const noexcept { return !W_.empty(); }

private:
    Domain domain_;
    std::vector<NumericColumn> X_;
    std::vector<NumericColumn> Y_;
    std::vector<MetaColumn> metas_;
    std::vector<NumericColumn> W_;
    size_t rowCount_ = 0;
};

namespace TableUtils {
bool isMissing(double value);
double missingValue();
// Shortest round-trippable text of a finite double.
std::string formatDouble(double value);
size_t metaColumnSize(const MetaColumn& column);
// Discrete value label, "?" for missing, number text otherwise.
std::string cellText(const Variable& var, double value);
}
