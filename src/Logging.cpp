#include "Logging.h"
#include "CommonUtils.h"
#include "TabulaExceptions.h"

#include <iostream>
#include <mutex>

namespace {
std::mutex& logMutex() {
    static std::mutex m;
    return m;
}

TabulaLog::Level& threshold() {
    static TabulaLog::Level lvl = TabulaLog::Level::WARNING;
    return lvl;
}

TabulaLog::Sink& activeSink() {
    static TabulaLog::Sink sink;
    return sink;
}
} // namespace

namespace TabulaLog {

void setLevel(Level lvl) {
    std::lock_guard<std::mutex> lock(logMutex());
    threshold() = lvl;
}

Level level() {
    std::lock_guard<std::mutex> lock(logMutex());
    return threshold();
}

void setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(logMutex());
    activeSink() = std::move(sink);
}

Level parseLevel(const std::string& name) {
    const std::string n = CommonUtils::toLower(CommonUtils::trim(name));
    if (n == "debug") return Level::DEBUG;
    if (n == "info") return Level::INFO;
    if (n == "warning" || n == "warn") return Level::WARNING;
    if (n == "error") return Level::ERROR;
    throw Tabula::ConfigurationException("Unknown log level: " + name + " (allowed: debug, info, warning, error)");
}

const char* levelName(Level lvl) {
    switch (lvl) {
        case Level::DEBUG: return "Debug";
        case Level::INFO: return "Info";
        case Level::WARNING: return "Warning";
        case Level::ERROR: return "Error";
    }
    return "Unknown";
}

// The sink runs outside the lock so it may log or change settings itself.
void log(Level lvl, const std::string& message) {
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(logMutex());
        if (static_cast<int>(lvl) < static_cast<int>(threshold())) return;
        if (!activeSink()) {
            std::cerr << "[Tabula][" << levelName(lvl) << "] " << message << "\n";
            return;
        }
        sink = activeSink();
    }
    sink(lvl, message);
}

} // namespace TabulaLog
