#pragma once

#include "Variable.h"

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Canonical discrete value orderings keyed by variable name.
 * @details Keeps index spaces stable across reads: a later file that sees the same
 * discrete column gets the earlier value order, with unseen values appended.
 * All members are safe to call from several threads.
 */
class VariableRegistry {
public:
    /**
     * @brief Process-wide registry used when ReadOptions does not supply one.
     */
    static VariableRegistry& global();

    /**
     * @brief Reconciles an inferred, unordered discrete value list with the registered one.
     * @return canonical value list (registered values first, then unseen ones in input order).
     * @post the canonical list is stored under `name`.
     */
    std::vector<std::string> canonicalize(const std::string& name, const std::vector<std::string>& observed);

    /**
     * @brief Stores an explicitly declared (ordered) value list as-is.
     */
    void declare(const std::string& name, const std::vector<std::string>& values);

    bool contains(const std::string& name) const;
    std::vector<std::string> values(const std::string& name) const;
    size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<std::string>> values_;
};
