// Minimal console logger with a global level threshold.
#pragma once

#include <optional>
#include <string_view>

namespace Engine {

enum class LogLevel { Debug, Info, Warning, Error };

class Logger {
public:
    static void log(LogLevel level, std::string_view message);

    static void setMinLevel(LogLevel level);
    static LogLevel minLevel();
};

// Accepts "debug", "info", "warn"/"warning" and "error" (case-insensitive).
std::optional<LogLevel> parseLogLevel(std::string_view name);

inline void logDebug(std::string_view msg) { Logger::log(LogLevel::Debug, msg); }
inline void logInfo(std::string_view msg) { Logger::log(LogLevel::Info, msg); }
inline void logWarn(std::string_view msg) { Logger::log(LogLevel::Warning, msg); }
inline void logError(std::string_view msg) { Logger::log(LogLevel::Error, msg); }

}  // namespace Engine
