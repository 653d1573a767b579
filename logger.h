#include <string>

#pragma once

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

// Файл лога и минимальный уровень; до вызова пишем в timetable.log, уровень Info
void configureLogger(const std::string& filePath, LogLevel minLevel);

LogLevel logLevelFromString(const std::string& s); // неизвестное => Info

void logMessage(LogLevel level, const std::string& msg);

void logInfo(const std::string& msg);
void logWarning(const std::string& msg);
void logError(const std::string& msg);
void logDebug(const std::string& msg);
