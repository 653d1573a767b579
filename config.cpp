#include "config.h"

#include <cstdlib>
#include <stdexcept>

static std::string envOr(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return (val && *val) ? std::string(val) : fallback;
}

AppConfig AppConfig::fromEnv() {
    const char* secret = std::getenv("TIMETABLE_JWT_SECRET");
    if (!secret || !*secret) {
        throw std::runtime_error("Environment variable TIMETABLE_JWT_SECRET is not set");
    }

    AppConfig cfg;
    cfg.jwtSecret   = secret;
    cfg.bindHost    = envOr("TIMETABLE_BIND_HOST", "127.0.0.1");
    cfg.tlsCertPath = envOr("TIMETABLE_TLS_CERT", "server-cert.pem");
    cfg.tlsKeyPath  = envOr("TIMETABLE_TLS_KEY", "server-key.pem");
    cfg.logFile     = envOr("TIMETABLE_LOG_FILE", "timetable.log");
    cfg.logLevel    = logLevelFromString(envOr("TIMETABLE_LOG_LEVEL", "info"));

    std::string portStr = envOr("TIMETABLE_PORT", "8443");
    try {
        cfg.port = std::stoi(portStr);
    } catch (const std::exception&) {
        throw std::runtime_error("TIMETABLE_PORT is not a number: " + portStr);
    }
    if (cfg.port <= 0 || cfg.port > 65535) {
        throw std::runtime_error("TIMETABLE_PORT out of range: " + portStr);
    }

    std::string ttlStr = envOr("TIMETABLE_PREVIEW_TTL", "1800");
    try {
        cfg.previewTtlSeconds = std::stoi(ttlStr);
    } catch (const std::exception&) {
        throw std::runtime_error("TIMETABLE_PREVIEW_TTL is not a number: " + ttlStr);
    }
    if (cfg.previewTtlSeconds <= 0) {
        throw std::runtime_error("TIMETABLE_PREVIEW_TTL must be positive: " + ttlStr);
    }

    return cfg;
}
