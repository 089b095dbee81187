#pragma once

#include <functional>
#include <string>

namespace TabulaLog {

enum class Level { DEBUG, INFO, WARNING, ERROR };

using Sink = std::function<void(Level, const std::string&)>;

/**
 * @brief Messages below the threshold are dropped. Default: WARNING.
 */
void setLevel(Level level);
Level level();

/**
 * @brief Replaces the output sink. An empty function restores the console sink,
 * which writes "[Tabula][<Level>] message" lines to stderr.
 */
void setSink(Sink sink);

Level parseLevel(const std::string& name);
const char* levelName(Level level);

void log(Level level, const std::string& message);
inline void debug(const std::string& message) { log(Level::DEBUG, message); }
inline void info(const std::string& message) { log(Level::INFO, message); }
inline void warning(const std::string& message) { log(Level::WARNING, message); }
inline void error(const std::string& message) { log(Level::ERROR, message); }

} // namespace TabulaLog
