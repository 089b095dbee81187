#include "VariableRegistry.h"

#include <algorithm>
#include <unordered_set>

VariableRegistry& VariableRegistry::global() {
    static VariableRegistry registry;
    return registry;
}

std::vector<std::string> VariableRegistry::canonicalize(const std::string& name, const std::vector<std::string>& observed) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(name);
    if (it == values_.end()) {
        values_.emplace(name, observed);
        return observed;
    }

    std::vector<std::string>& canonical = it->second;
    std::unordered_set<std::string> known(canonical.begin(), canonical.end());
    for (const auto& value : observed) {
        if (known.insert(value).second) canonical.push_back(value);
    }
    return canonical;
}

void VariableRegistry::declare(const std::string& name, const std::vector<std::string>& values) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[name] = values;
}

bool VariableRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.count(name) > 0;
}

std::vector<std::string> VariableRegistry::values(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(name);
    if (it == values_.end()) return {};
    return it->second;
}

size_t VariableRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.size();
}

void VariableRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
}
