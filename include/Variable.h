#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

enum class VariableKind { CONTINUOUS, DISCRETE, STRING };

const char* variableKindName(VariableKind kind);

/**
 * @brief Named, typed column descriptor.
 * @details `values` and `ordered` are meaningful for DISCRETE only: `values` is the
 * deduplicated domain in index order, `ordered` marks an explicitly declared order.
 */
struct Variable {
    std::string name;
    VariableKind kind = VariableKind::CONTINUOUS;
    std::vector<std::string> values;
    bool ordered = false;
    std::map<std::string, std::string> attributes;

    static Variable continuous(std::string name);
    static Variable string(std::string name);
    static Variable discrete(std::string name, std::vector<std::string> values, bool ordered = false);

    bool isContinuous() const noexcept { return kind == VariableKind::CONTINUOUS; }
    bool isDiscrete() const noexcept { return kind == VariableKind::DISCRETE; }
    bool isString() const noexcept { return kind == VariableKind::STRING; }
    bool isPrimitive() const noexcept { return kind != VariableKind::STRING; }

    /**
     * @brief Index of a discrete value, -1 when absent.
     */
    int indexOf(const std::string& value) const;

    bool operator==(const Variable& other) const;
    bool operator!=(const Variable& other) const { return !(*this == other); }
};

/**
 * @brief Ordered partition of Variables into features, class variables and metas.
 */
struct Domain {
    std::vector<Variable> attributes;
    std::vector<Variable> classVars;
    std::vector<Variable> metas;

    size_t size() const noexcept { return attributes.size() + classVars.size() + metas.size(); }

    /**
     * @brief First variable with this name across attributes, classVars, metas; nullptr when absent.
     */
    const Variable* find(const std::string& name) const;

    bool operator==(const Domain& other) const;
    bool operator!=(const Domain& other) const { return !(*this == other); }
};
