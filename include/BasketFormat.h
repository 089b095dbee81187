#pragma once

#include "FileFormat.h"

#include <string>

/**
 * @brief Sparse "basket" files: one example per line, `attrs | classes | metas`,
 * each segment a comma-separated list of `name` or `name=value` items.
 * @details A bare name counts 1.0; repeated names add up. Variables are continuous and
 * ordered by first appearance. Absent items are 0 for attributes and missing for classes and metas.
 * Lines starting with '#' are comments.
 */
class BasketFormat : public FileFormat {
public:
    std::string name() const override { return "basket"; }
    std::string description() const override { return "Basket file"; }
    std::vector<std::string> extensions() const override { return {".basket", ".bsk"}; }

    Table readFile(const std::string& filename, const ReadOptions& options) const override;

    /**
     * @throws Tabula::ParseException on more than three segments, an empty name or a non-numeric value.
     */
    Table readText(const std::string& text) const;
};
