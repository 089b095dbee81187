#include "ColumnFlags.h"
#include "CommonUtils.h"
#include "Logging.h"

bool ColumnFlags::isRoleToken(const std::string& token) {
    return token == "class" || token == "c" ||
           token == "ignore" || token == "i" ||
           token == "meta" || token == "m" ||
           token == "weight" || token == "w";
}

bool ColumnFlags::isAttributeToken(const std::string& token) {
    const size_t eq = token.find('=');
    return eq != std::string::npos && eq > 0;
}

std::vector<std::string> ColumnFlags::split(const std::string& cell) {
    std::vector<std::string> out;
    std::string current;
    for (size_t i = 0; i < cell.size(); ++i) {
        const char ch = cell[i];
        if (ch == '\\' && i + 1 < cell.size() && cell[i + 1] == ' ') {
            current.push_back(' ');
            ++i;
        } else if (ch == ' ') {
            out.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    out.push_back(std::move(current));
    return out;
}

std::string ColumnFlags::join(const std::vector<std::string>& tokens) {
    std::string out;
    for (const auto& raw : tokens) {
        const std::string token = CommonUtils::trim(raw);
        if (!out.empty() || !token.empty()) {
            if (!out.empty()) out.push_back(' ');
            for (char ch : token) {
                if (ch == ' ') out.push_back('\\');
                out.push_back(ch);
            }
        }
    }
    return out;
}

ColumnFlags ColumnFlags::parse(const std::string& cell) {
    ColumnFlags flags;
    for (const auto& raw : split(cell)) {
        const std::string token = CommonUtils::trim(raw);
        if (token.empty()) continue;

        if (isAttributeToken(token)) {
            const size_t eq = token.find('=');
            flags.attributes[token.substr(0, eq)] = token.substr(eq + 1);
        } else if (token == "class" || token == "c") {
            flags.isClass = true;
        } else if (token == "ignore" || token == "i") {
            flags.isIgnore = true;
        } else if (token == "meta" || token == "m") {
            flags.isMeta = true;
        } else if (token == "weight" || token == "w") {
            flags.isWeight = true;
        } else {
            TabulaLog::warning("Invalid attribute flag '" + token + "'");
        }
    }
    return flags;
}
