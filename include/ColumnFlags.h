#pragma once

#include <map>
#include <string>
#include <vector>

/**
 * @brief Decoded role annotations of one column (third header row).
 */
struct ColumnFlags {
    bool isClass = false;
    bool isIgnore = false;
    bool isMeta = false;
    bool isWeight = false;
    std::map<std::string, std::string> attributes;

    /**
     * @brief Parses a raw flag cell such as "class color=red".
     * @details Tokens are split on unescaped spaces; unrecognized tokens are logged and skipped.
     */
    static ColumnFlags parse(const std::string& cell);

    /**
     * @brief Splits on spaces not preceded by a backslash and unescapes "\ ".
     */
    static std::vector<std::string> split(const std::string& cell);

    /**
     * @brief Inverse of split(): trims each token, escapes embedded spaces, joins with ' '.
     */
    static std::string join(const std::vector<std::string>& tokens);

    static bool isRoleToken(const std::string& token);
    static bool isAttributeToken(const std::string& token);
};
