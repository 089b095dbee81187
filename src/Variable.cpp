#include "Variable.h"

#include <algorithm>

const char* variableKindName(VariableKind kind) {
    switch (kind) {
        case VariableKind::CONTINUOUS: return "continuous";
        case VariableKind::DISCRETE: return "discrete";
        case VariableKind::STRING: return "string";
    }
    return "unknown";
}

Variable Variable::continuous(std::string name) {
    Variable v;
    v.name = std::move(name);
    v.kind = VariableKind::CONTINUOUS;
    return v;
}

Variable Variable::string(std::string name) {
    Variable v;
    v.name = std::move(name);
    v.kind = VariableKind::STRING;
    return v;
}

Variable Variable::discrete(std::string name, std::vector<std::string> values, bool ordered) {
    Variable v;
    v.name = std::move(name);
    v.kind = VariableKind::DISCRETE;
    v.values = std::move(values);
    v.ordered = ordered;
    return v;
}

int Variable::indexOf(const std::string& value) const {
    const auto it = std::find(values.begin(), values.end(), value);
    if (it == values.end()) return -1;
    return static_cast<int>(std::distance(values.begin(), it));
}

bool Variable::operator==(const Variable& other) const {
    return name == other.name && kind == other.kind && values == other.values &&
           ordered == other.ordered && attributes == other.attributes;
}

const Variable* Domain::find(const std::string& name) const {
    for (const auto* group : {&attributes, &classVars, &metas}) {
        for (const auto& var : *group) {
            if (var.name == name) return &var;
        }
    }
    return nullptr;
}

bool Domain::operator==(const Domain& other) const {
    return attributes == other.attributes && classVars == other.classVars && metas == other.metas;
}
