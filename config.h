#pragma once

#include <string>

#include "logger.h"

// Настройки HTTPS-сервера из переменных окружения TIMETABLE_*.
// Параметры БД читает db::DbConfig::fromEnv.
struct AppConfig {
    std::string jwtSecret;   // обязателен
    std::string bindHost;
    int         port;
    std::string tlsCertPath;
    std::string tlsKeyPath;
    std::string logFile;
    LogLevel    logLevel;
    int         previewTtlSeconds; // неопубликованные превью старше удаляются

    static AppConfig fromEnv(); // std::runtime_error, если нет обязательных
};
